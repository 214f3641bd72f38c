/*
 * Copyright (C) 2023 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "host/libs/image/image_builder.h"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <unordered_set>

#include <android-base/logging.h>
#include <android-base/scopeguard.h>
#include <fmt/format.h>

#include "common/libs/constants/guest_layout.h"
#include "common/libs/utils/files.h"
#include "host/libs/config/feature.h"
#include "host/libs/image/layer.h"
#include "host/libs/image/overlay.h"
#include "host/libs/image/vm_config.h"

namespace microguest {
namespace {

Result<TreeEntry> FindResolved(const std::string& staging_root,
                               const RootfsTree& tree,
                               const std::string& guest_path,
                               bool follow_last) {
  auto resolved =
      MG_EXPECT(ResolveGuestPath(staging_root, guest_path, follow_last));
  auto entry = tree.Find(resolved);
  MG_EXPECTF(entry.has_value(), "Required entry \"{}\" is missing", guest_path);
  return *entry;
}

// Points the fixed payload interpreter path at the base's own interpreter,
// unless the tree already has something there.
Result<void> LinkPayloadInterpreter(const std::string& staging_root,
                                    const std::string& interpreter) {
  auto directory = MG_EXPECT(
      EnsureGuestDirectory(staging_root, cpp_dirname(kPayloadInterpreter)));
  const auto link = staging_root + directory + "/" +
                    cpp_basename(kPayloadInterpreter);
  if (FileExists(link, /* follow_symlinks */ false)) {
    return {};
  }
  MG_EXPECTF(symlink(interpreter.c_str(), link.c_str()) == 0,
             "Could not link \"{}\" to \"{}\": {}", kPayloadInterpreter,
             interpreter, strerror(errno));
  LOG(DEBUG) << "Linked " << kPayloadInterpreter << " to " << interpreter;
  return {};
}

class ComposeRootfsTree : public ReturningSetupFeature<RootfsTree> {
 public:
  INJECT(ComposeRootfsTree(const RootfsBuildConfig& config,
                           BuildWorkspace& workspace))
      : config_(config), workspace_(workspace) {}

  std::string Name() const override { return "ComposeRootfsTree"; }
  bool Enabled() const override { return true; }

 private:
  std::unordered_set<SetupFeature*> Dependencies() const override {
    return {};
  }
  Result<RootfsTree> Calculate() override {
    MG_EXPECT(ComposeStagingTree(config_, workspace_.StagingRoot(),
                                 workspace_.ScratchRoot()),
              "PopulationError: could not compose the root filesystem");
    auto tree = MG_EXPECT(RootfsTree::Scan(workspace_.StagingRoot()),
                          "PopulationError: could not read the staging tree");
    MG_EXPECT(ValidateFixedEntries(workspace_.StagingRoot(), tree),
              "PopulationError: the composed tree is incomplete");
    LOG(INFO) << "Composed tree: " << tree.size() << " entries, "
              << tree.ContentBytes() << " bytes";
    return tree;
  }

  const RootfsBuildConfig& config_;
  BuildWorkspace& workspace_;
};

class CheckCapacity : public SetupFeature {
 public:
  INJECT(CheckCapacity(const RootfsBuildConfig& config,
                       ComposeRootfsTree& tree))
      : config_(config), tree_(tree) {}

  std::string Name() const override { return "CheckCapacity"; }
  bool Enabled() const override { return true; }

 private:
  std::unordered_set<SetupFeature*> Dependencies() const override {
    return {&tree_};
  }
  Result<void> ResultSetup() override {
    const auto needed = tree_->ContentBytes();
    MG_EXPECTF(needed <= config_.capacity_bytes,
               "CapacityExceeded: the tree needs {} bytes but the image holds "
               "{}",
               needed, config_.capacity_bytes);
    return {};
  }

  const RootfsBuildConfig& config_;
  ComposeRootfsTree& tree_;
};

class AllocateImage : public SetupFeature {
 public:
  INJECT(AllocateImage(const RootfsBuildConfig& config,
                       BuildWorkspace& workspace, CheckCapacity& capacity))
      : config_(config), workspace_(workspace), capacity_(capacity) {}

  std::string Name() const override { return "AllocateImage"; }
  bool Enabled() const override { return true; }

 private:
  std::unordered_set<SetupFeature*> Dependencies() const override {
    return {&capacity_};
  }
  Result<void> ResultSetup() override {
    MG_EXPECTF(CreateBlankImage(workspace_.PartialImage(),
                                config_.capacity_bytes),
               "FormatError: could not allocate {} bytes at \"{}\"",
               config_.capacity_bytes, workspace_.PartialImage());
    return {};
  }

  const RootfsBuildConfig& config_;
  BuildWorkspace& workspace_;
  CheckCapacity& capacity_;
};

class FormatImage : public SetupFeature {
 public:
  INJECT(FormatImage(BuildWorkspace& workspace, Formatter& formatter,
                     AllocateImage& allocate))
      : workspace_(workspace), formatter_(formatter), allocate_(allocate) {}

  std::string Name() const override { return "FormatImage"; }
  bool Enabled() const override { return true; }

 private:
  std::unordered_set<SetupFeature*> Dependencies() const override {
    return {&allocate_};
  }
  Result<void> ResultSetup() override {
    MG_EXPECTF(formatter_.Format(workspace_.PartialImage()),
               "FormatError: could not format \"{}\"",
               workspace_.PartialImage());
    return {};
  }

  BuildWorkspace& workspace_;
  Formatter& formatter_;
  AllocateImage& allocate_;
};

// The first capacity check only counts file data. This one compares against
// what the formatted filesystem really has left after its own metadata.
class CheckUsableSpace : public SetupFeature {
 public:
  INJECT(CheckUsableSpace(BuildWorkspace& workspace, Formatter& formatter,
                          ComposeRootfsTree& tree, FormatImage& format))
      : workspace_(workspace),
        formatter_(formatter),
        tree_(tree),
        format_(format) {}

  std::string Name() const override { return "CheckUsableSpace"; }
  bool Enabled() const override { return true; }

 private:
  std::unordered_set<SetupFeature*> Dependencies() const override {
    return {&tree_, &format_};
  }
  Result<void> ResultSetup() override {
    auto space = MG_EXPECTF(formatter_.FreeSpace(workspace_.PartialImage()),
                            "FormatError: could not read the free space of "
                            "\"{}\"",
                            workspace_.PartialImage());
    const auto needed = tree_->ContentBytes();
    MG_EXPECTF(needed <= space.free_bytes,
               "CapacityExceeded: the tree needs {} bytes but the formatted "
               "image has {} free",
               needed, space.free_bytes);
    MG_EXPECTF(tree_->size() <= space.free_inodes,
               "CapacityExceeded: the tree has {} entries but the formatted "
               "image has {} free inodes",
               tree_->size(), space.free_inodes);
    return {};
  }

  BuildWorkspace& workspace_;
  Formatter& formatter_;
  ComposeRootfsTree& tree_;
  FormatImage& format_;
};

class PopulateImage : public SetupFeature {
 public:
  INJECT(PopulateImage(BuildWorkspace& workspace, Populator& populator,
                       ComposeRootfsTree& tree, CheckUsableSpace& space))
      : workspace_(workspace),
        populator_(populator),
        tree_(tree),
        space_(space) {}

  std::string Name() const override { return "PopulateImage"; }
  bool Enabled() const override { return true; }

 private:
  std::unordered_set<SetupFeature*> Dependencies() const override {
    return {&tree_, &space_};
  }
  Result<void> ResultSetup() override {
    MG_EXPECTF(populator_.Populate(workspace_.PartialImage(),
                                   workspace_.StagingRoot(),
                                   workspace_.MountPoint()),
               "PopulationError: could not copy the tree into \"{}\"",
               workspace_.PartialImage());
    return {};
  }

  BuildWorkspace& workspace_;
  Populator& populator_;
  ComposeRootfsTree& tree_;
  CheckUsableSpace& space_;
};

// Writes the VM config next to its final path so that it can be published
// together with the image.
class StageVmConfig : public SetupFeature {
 public:
  INJECT(StageVmConfig(const RootfsBuildConfig& config,
                       BuildWorkspace& workspace, PopulateImage& populate))
      : config_(config), workspace_(workspace), populate_(populate) {}

  std::string Name() const override { return "StageVmConfig"; }
  bool Enabled() const override {
    return !config_.vm_config.output_path.empty();
  }

 private:
  std::unordered_set<SetupFeature*> Dependencies() const override {
    return {&populate_};
  }
  Result<void> ResultSetup() override {
    MG_EXPECT(WriteVmConfig(config_.vm_config,
                            AbsolutePath(config_.output_path),
                            workspace_.PartialVmConfig()),
              "PopulationError: could not stage the VM config");
    return {};
  }

  const RootfsBuildConfig& config_;
  BuildWorkspace& workspace_;
  PopulateImage& populate_;
};

class PublishImage : public SetupFeature {
 public:
  INJECT(PublishImage(const RootfsBuildConfig& config,
                      BuildWorkspace& workspace, PopulateImage& populate,
                      StageVmConfig& stage))
      : config_(config),
        workspace_(workspace),
        populate_(populate),
        stage_(stage) {}

  std::string Name() const override { return "PublishImage"; }
  bool Enabled() const override { return true; }

 private:
  std::unordered_set<SetupFeature*> Dependencies() const override {
    if (stage_.Enabled()) {
      return {&populate_, &stage_};
    }
    return {&populate_};
  }
  Result<void> ResultSetup() override {
    const auto& partial = workspace_.PartialImage();
    MG_EXPECTF(static_cast<uint64_t>(FileSize(partial)) ==
                   config_.capacity_bytes,
               "PopulationError: \"{}\" is {} bytes instead of {}", partial,
               FileSize(partial), config_.capacity_bytes);
    // Both renames stay within their own directories. The VM config goes
    // first since it only names the output path, never its contents.
    if (stage_.Enabled()) {
      const auto& staged = workspace_.PartialVmConfig();
      const auto& final_path = config_.vm_config.output_path;
      MG_EXPECTF(rename(staged.c_str(), final_path.c_str()) == 0,
                 "PopulationError: could not rename \"{}\" to \"{}\": {}",
                 staged, final_path, strerror(errno));
      LOG(INFO) << "Published " << final_path;
    }
    MG_EXPECTF(rename(partial.c_str(), config_.output_path.c_str()) == 0,
               "PopulationError: could not rename \"{}\" to \"{}\": {}",
               partial, config_.output_path, strerror(errno));
    LOG(INFO) << "Published " << config_.output_path;
    return {};
  }

  const RootfsBuildConfig& config_;
  BuildWorkspace& workspace_;
  PopulateImage& populate_;
  StageVmConfig& stage_;
};

}  // namespace

BuildWorkspace::BuildWorkspace(const RootfsBuildConfig& config) {
  work_directory_ = config.work_directory.empty()
                        ? cpp_dirname(config.output_path)
                        : config.work_directory;
  const auto prefix =
      work_directory_ + "/" + cpp_basename(config.output_path);
  partial_image_ = prefix + ".partial";
  mount_point_ = prefix + ".mnt";
  staging_root_ = prefix + ".staging";
  scratch_root_ = prefix + ".scratch";
  if (!config.vm_config.output_path.empty()) {
    partial_vm_config_ = config.vm_config.output_path + ".partial";
  }
}

Result<void> BuildWorkspace::Prepare() {
  MG_EXPECT(EnsureDirectoryExists(work_directory_));
  Cleanup();
  MG_EXPECTF(!FileExists(mount_point_, false),
             "\"{}\" is left over from an earlier build and still in use",
             mount_point_);
  MG_EXPECT(EnsureDirectoryExists(staging_root_, 0755));
  MG_EXPECT(EnsureDirectoryExists(scratch_root_, 0700));
  return {};
}

void BuildWorkspace::Cleanup() {
  for (const auto& partial : {partial_image_, partial_vm_config_}) {
    if (!partial.empty() && FileExists(partial, false) &&
        !RemoveFile(partial)) {
      PLOG(ERROR) << "Could not remove " << partial;
    }
  }
  // Only an empty mount point is removed, a mounted one stays.
  if (DirectoryExists(mount_point_, false) && rmdir(mount_point_.c_str())) {
    PLOG(ERROR) << "Could not remove " << mount_point_;
  }
  for (const auto& dir : {staging_root_, scratch_root_}) {
    if (DirectoryExists(dir, false) && !RecursivelyRemoveDirectory(dir)) {
      LOG(ERROR) << "Could not remove " << dir;
    }
  }
}

Result<void> ComposeStagingTree(const RootfsBuildConfig& config,
                                const std::string& staging_root,
                                const std::string& scratch_root) {
  auto layers = config.layers;
  LayerSpec init;
  init.kind = LayerKind::kFile;
  init.source = config.guest_init_binary;
  init.destination = kGuestInitPath;
  init.mode = 0755;
  layers.push_back(init);

  for (size_t i = 0; i < layers.size(); i++) {
    auto layer =
        MG_EXPECT(CreateLayer(layers[i], config.tools, config.runtime));
    const auto scratch = fmt::format("{}/layer-{}", scratch_root, i);
    MG_EXPECT(EnsureDirectoryExists(scratch, 0700));
    LOG(INFO) << "Applying layer " << i << ": " << layer->Describe();
    MG_EXPECTF(layer->Apply(staging_root, scratch), "Layer {} ({}) failed", i,
               layer->Describe());
    MG_EXPECTF(RecursivelyRemoveDirectory(scratch),
               "Could not remove \"{}\"", scratch);
  }
  if (config.runtime.interpreter != kPayloadInterpreter) {
    MG_EXPECT(LinkPayloadInterpreter(staging_root, config.runtime.interpreter));
  }
  for (const auto& mount_point : {kProcMountPoint, kSysMountPoint}) {
    MG_EXPECT(EnsureGuestDirectory(staging_root, mount_point, 0555));
  }
  return {};
}

Result<void> ValidateFixedEntries(const std::string& staging_root,
                                  const RootfsTree& tree) {
  auto payload = MG_EXPECT(FindResolved(staging_root, tree, kPayloadPath,
                                        /* follow_last */ true));
  MG_EXPECTF(payload.type == EntryType::kRegularFile,
             "\"{}\" is not a regular file", kPayloadPath);

  auto interpreter = MG_EXPECT(FindResolved(
      staging_root, tree, kPayloadInterpreter, /* follow_last */ true));
  MG_EXPECTF(interpreter.type == EntryType::kRegularFile &&
                 (interpreter.mode & 0111) != 0,
             "\"{}\" is not an executable file", kPayloadInterpreter);

  auto init = MG_EXPECT(
      FindResolved(staging_root, tree, kGuestInitPath, /* follow_last */ false));
  MG_EXPECTF(init.type == EntryType::kRegularFile && (init.mode & 0111) != 0,
             "\"{}\" is not an executable file", kGuestInitPath);

  for (const auto& mount_point : {kProcMountPoint, kSysMountPoint}) {
    auto entry = MG_EXPECT(
        FindResolved(staging_root, tree, mount_point, /* follow_last */ true));
    MG_EXPECTF(entry.type == EntryType::kDirectory,
               "\"{}\" is not a directory", mount_point);
  }
  return {};
}

fruit::Component<BuildWorkspace> RootfsBuildComponent(
    const RootfsBuildConfig* config, Formatter* formatter,
    Populator* populator) {
  return fruit::createComponent()
      .bindInstance(*config)
      .bindInstance(*formatter)
      .bindInstance(*populator)
      .addMultibinding<SetupFeature, ComposeRootfsTree>()
      .addMultibinding<SetupFeature, CheckCapacity>()
      .addMultibinding<SetupFeature, AllocateImage>()
      .addMultibinding<SetupFeature, FormatImage>()
      .addMultibinding<SetupFeature, CheckUsableSpace>()
      .addMultibinding<SetupFeature, PopulateImage>()
      .addMultibinding<SetupFeature, StageVmConfig>()
      .addMultibinding<SetupFeature, PublishImage>();
}

Result<void> BuildRootfsImage(const RootfsBuildConfig& config,
                              Formatter& formatter, Populator& populator) {
  MG_EXPECT(ValidateBuildConfig(config));

  fruit::Injector<BuildWorkspace> injector(RootfsBuildComponent, &config,
                                           &formatter, &populator);
  auto& workspace = injector.get<BuildWorkspace&>();
  MG_EXPECT(workspace.Prepare());
  auto cleanup =
      android::base::make_scope_guard([&workspace]() { workspace.Cleanup(); });

  const auto features = injector.getMultibindings<SetupFeature>();
  MG_EXPECTF(SetupFeature::RunSetup(features), "Building \"{}\" failed",
             config.output_path);
  return {};
}

}  // namespace microguest
