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

#include "host/libs/image/layer.h"

#include <sys/stat.h>

#include <memory>
#include <string>
#include <utility>

#include <android-base/logging.h>
#include <android-base/strings.h>
#include <fmt/format.h>

#include "common/libs/utils/archive.h"
#include "common/libs/utils/files.h"
#include "common/libs/utils/subprocess.h"
#include "host/libs/image/overlay.h"

namespace microguest {
namespace {

class ArchiveLayer : public Layer {
 public:
  ArchiveLayer(LayerSpec spec, std::string bsdtar)
      : spec_(std::move(spec)), bsdtar_(std::move(bsdtar)) {}

  std::string Describe() const override {
    return fmt::format("archive {} -> {}", spec_.source, spec_.destination);
  }

  Result<void> Apply(const std::string& staging_root,
                     const std::string& scratch) override {
    MG_EXPECTF(FileExists(spec_.source), "Archive \"{}\" does not exist",
               spec_.source);
    Archive archive(spec_.source, bsdtar_);
    MG_EXPECT(archive.ExtractAll(scratch));
    MG_EXPECT(OverlayTree(scratch, staging_root, spec_.destination,
                          OverlayMode::kMove));
    return {};
  }

 private:
  LayerSpec spec_;
  std::string bsdtar_;
};

class PackagesLayer : public Layer {
 public:
  PackagesLayer(LayerSpec spec, std::string debootstrap)
      : spec_(std::move(spec)), debootstrap_(std::move(debootstrap)) {}

  std::string Describe() const override {
    return fmt::format("packages [{}] from {} {}",
                       android::base::Join(spec_.packages, ","), spec_.suite,
                       spec_.mirror);
  }

  Result<void> Apply(const std::string& staging_root,
                     const std::string& scratch) override {
    Command debootstrap(debootstrap_);
    debootstrap.AddParameter("--variant=minbase");
    debootstrap.AddParameter("--include=",
                             android::base::Join(spec_.packages, ","));
    debootstrap.AddParameter(spec_.suite);
    debootstrap.AddParameter(scratch);
    debootstrap.AddParameter(spec_.mirror);
    MG_EXPECT(RunAndLogOutput(std::move(debootstrap)));
    MG_EXPECT(OverlayTree(scratch, staging_root, spec_.destination,
                          OverlayMode::kMove));
    return {};
  }

 private:
  LayerSpec spec_;
  std::string debootstrap_;
};

class PipLayer : public Layer {
 public:
  PipLayer(LayerSpec spec, std::string pip)
      : spec_(std::move(spec)), pip_(std::move(pip)) {}

  std::string Describe() const override {
    return fmt::format("pip -r {} -> {}", spec_.source, spec_.destination);
  }

  Result<void> Apply(const std::string& staging_root,
                     const std::string& scratch) override {
    MG_EXPECTF(FileExists(spec_.source),
               "Requirements file \"{}\" does not exist", spec_.source);
    Command pip = PipInstallCommand(pip_, spec_.source, scratch);
    MG_EXPECT(RunAndLogOutput(std::move(pip)));
    MG_EXPECT(OverlayTree(scratch, staging_root, spec_.destination,
                          OverlayMode::kMove));
    return {};
  }

 private:
  LayerSpec spec_;
  std::string pip_;
};

class DirectoryLayer : public Layer {
 public:
  DirectoryLayer(LayerSpec spec) : spec_(std::move(spec)) {}

  std::string Describe() const override {
    return fmt::format("directory {} -> {}", spec_.source, spec_.destination);
  }

  Result<void> Apply(const std::string& staging_root,
                     const std::string&) override {
    MG_EXPECTF(DirectoryExists(spec_.source), "\"{}\" is not a directory",
               spec_.source);
    MG_EXPECT(OverlayTree(spec_.source, staging_root, spec_.destination,
                          OverlayMode::kCopy));
    return {};
  }

 private:
  LayerSpec spec_;
};

class FileLayer : public Layer {
 public:
  FileLayer(LayerSpec spec) : spec_(std::move(spec)) {}

  std::string Describe() const override {
    return fmt::format("file {} -> {} ({:04o})", spec_.source,
                       spec_.destination, spec_.mode);
  }

  Result<void> Apply(const std::string& staging_root,
                     const std::string& scratch) override {
    MG_EXPECTF(FileExists(spec_.source) && !DirectoryExists(spec_.source),
               "\"{}\" is not a file", spec_.source);
    const auto staged = scratch + "/" + cpp_basename(spec_.destination);
    MG_EXPECTF(Copy(spec_.source, staged), "Failed to copy \"{}\"",
               spec_.source);
    MG_EXPECTF(chmod(staged.c_str(), spec_.mode) == 0,
               "chmod(\"{}\", {:04o}) failed: {}", staged, spec_.mode,
               strerror(errno));
    MG_EXPECT(OverlayEntry(staged, staging_root, spec_.destination,
                           OverlayMode::kMove));
    return {};
  }

 private:
  LayerSpec spec_;
};

}  // namespace

Command PipInstallCommand(const std::string& pip,
                          const std::string& requirements,
                          const std::string& target) {
  // Binary wheels only, pinned to the guest's interpreter and platform so
  // nothing is compiled against the host.
  Command command(pip);
  command.AddParameter("install");
  command.AddParameter("--no-cache-dir");
  command.AddParameter("--target");
  command.AddParameter(target);
  command.AddParameter("--only-binary=:all:");
  command.AddParameter("--platform");
  command.AddParameter("manylinux2014_x86_64");
  command.AddParameter("--python-version");
  command.AddParameter("3.11");
  command.AddParameter("--implementation");
  command.AddParameter("cp");
  command.AddParameter("--abi");
  command.AddParameter("cp311");
  command.AddParameter("-r");
  command.AddParameter(requirements);
  return command;
}

Result<std::unique_ptr<Layer>> CreateLayer(const LayerSpec& spec,
                                           const ToolPaths& tools,
                                           const RuntimeLayout& runtime) {
  switch (spec.kind) {
    case LayerKind::kArchive:
      return std::make_unique<ArchiveLayer>(spec, tools.bsdtar);
    case LayerKind::kPackages:
      return std::make_unique<PackagesLayer>(spec, tools.debootstrap);
    case LayerKind::kPip: {
      LayerSpec pip_spec = spec;
      if (pip_spec.destination == "/") {
        pip_spec.destination = runtime.site_packages;
      }
      return std::make_unique<PipLayer>(std::move(pip_spec), tools.pip);
    }
    case LayerKind::kDirectory:
      return std::make_unique<DirectoryLayer>(spec);
    case LayerKind::kFile:
      return std::make_unique<FileLayer>(spec);
  }
  return MG_ERRF("Unsupported layer kind {}", static_cast<int>(spec.kind));
}

}  // namespace microguest
