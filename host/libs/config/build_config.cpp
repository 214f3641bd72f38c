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

#include "host/libs/config/build_config.h"

#include <sys/stat.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#include <android-base/logging.h>
#include <android-base/parseint.h>
#include <android-base/strings.h>

#include "common/libs/constants/guest_layout.h"
#include "common/libs/utils/files.h"
#include "common/libs/utils/json.h"

namespace microguest {
namespace {

constexpr char kOutputPath[] = "output_path";
constexpr char kCapacityBytes[] = "capacity_bytes";
constexpr char kLayers[] = "layers";
constexpr char kPayloadKey[] = "payload";
constexpr char kDataDirectoryKey[] = "data_directory";
constexpr char kGuestInitBinary[] = "guest_init_binary";
constexpr char kWorkDirectory[] = "work_directory";
constexpr char kTools[] = "tools";
constexpr char kRuntime[] = "runtime";
constexpr char kVmConfig[] = "vm_config";

constexpr uint64_t kBlockSize = 4096;

Result<mode_t> ParseMode(const Json::Value& value) {
  if (value.isString()) {
    // Strings are always octal, with or without the leading zero.
    auto text = value.asString();
    if (!android::base::StartsWith(text, "0")) {
      text = "0" + text;
    }
    unsigned int mode = 0;
    MG_EXPECTF(android::base::ParseUint(text, &mode, 07777u),
               "Invalid octal mode \"{}\"", value.asString());
    return static_cast<mode_t>(mode);
  }
  MG_EXPECT(value.isUInt(), "Layer mode must be a string or an integer");
  MG_EXPECT_LE(value.asUInt(), 07777u, "Layer mode out of range");
  return static_cast<mode_t>(value.asUInt());
}

template <typename T>
Result<void> AssignIfPresent(const Json::Value& root,
                             const std::vector<std::string>& selectors,
                             T& out) {
  if (HasValue(root, selectors)) {
    out = MG_EXPECT(GetValue<T>(root, selectors));
  }
  return {};
}

Result<LayerSpec> LayerFromJson(const Json::Value& layer) {
  MG_EXPECT(layer.isObject(), "Every layer must be a JSON object");
  LayerSpec spec;
  spec.kind = MG_EXPECT(
      ParseLayerKind(MG_EXPECT(GetValue<std::string>(layer, {"kind"}))));
  MG_EXPECT(AssignIfPresent(layer, {"source"}, spec.source));
  MG_EXPECT(AssignIfPresent(layer, {"destination"}, spec.destination));
  MG_EXPECT(AssignIfPresent(layer, {"suite"}, spec.suite));
  MG_EXPECT(AssignIfPresent(layer, {"mirror"}, spec.mirror));
  if (layer.isMember("packages")) {
    MG_EXPECT(layer["packages"].isArray(), "\"packages\" must be an array");
    const auto& packages = layer["packages"];
    for (Json::ArrayIndex i = 0; i < packages.size(); i++) {
      MG_EXPECTF(packages[i].isString(), "Package {} is not a string", i);
      spec.packages.push_back(packages[i].asString());
    }
  }
  if (layer.isMember("mode")) {
    spec.mode = MG_EXPECT(ParseMode(layer["mode"]));
  }
  return spec;
}

Result<void> ValidateLayer(const LayerSpec& layer, size_t index) {
  const auto kind = LayerKindName(layer.kind);
  switch (layer.kind) {
    case LayerKind::kPackages:
      MG_EXPECTF(!layer.packages.empty(),
                 "Layer {} ({}) declares no packages", index, kind);
      MG_EXPECTF(!layer.suite.empty() && !layer.mirror.empty(),
                 "Layer {} ({}) needs a suite and a mirror", index, kind);
      break;
    case LayerKind::kArchive:
    case LayerKind::kPip:
    case LayerKind::kDirectory:
    case LayerKind::kFile:
      MG_EXPECTF(!layer.source.empty(), "Layer {} ({}) has no source", index,
                 kind);
      break;
  }
  MG_EXPECTF(android::base::StartsWith(layer.destination, "/"),
             "Layer {} ({}) destination \"{}\" is not absolute", index, kind,
             layer.destination);
  MG_EXPECTF(layer.destination.find("/../") == std::string::npos &&
                 !android::base::EndsWith(layer.destination, "/.."),
             "Layer {} ({}) destination \"{}\" escapes the root", index, kind,
             layer.destination);
  if (layer.kind == LayerKind::kFile) {
    MG_EXPECTF(layer.destination != "/",
               "Layer {} ({}) needs a file destination", index, kind);
  }
  return {};
}

Result<void> ValidateGuestPath(const std::string& path,
                               const std::string& what) {
  MG_EXPECTF(android::base::StartsWith(path, "/") &&
                 path.find("/../") == std::string::npos &&
                 !android::base::EndsWith(path, "/.."),
             "The {} \"{}\" is not an absolute guest path", what, path);
  return {};
}

// Device of the filesystem holding `path`, or the closest existing ancestor of
// it when `path` is yet to be created.
Result<dev_t> FilesystemDevice(const std::string& path) {
  auto current = AbsolutePath(path);
  MG_EXPECTF(!current.empty(), "Could not resolve \"{}\"", path);
  while (true) {
    struct stat st {};
    if (stat(current.c_str(), &st) == 0) {
      return st.st_dev;
    }
    MG_EXPECTF(errno == ENOENT && current != "/",
               "stat(\"{}\") failed: {}", current, strerror(errno));
    current = cpp_dirname(current);
  }
}

}  // namespace

RuntimeLayout DebianRuntimeLayout() {
  RuntimeLayout layout;
  layout.interpreter = kDebianPythonInterpreter;
  layout.site_packages = kDebianSitePackagesDirectory;
  return layout;
}

RootfsBuildConfig::RootfsBuildConfig()
    : capacity_bytes(kDefaultImageCapacityBytes) {}

Result<LayerKind> ParseLayerKind(const std::string& kind) {
  if (kind == "archive") {
    return LayerKind::kArchive;
  } else if (kind == "packages") {
    return LayerKind::kPackages;
  } else if (kind == "pip") {
    return LayerKind::kPip;
  } else if (kind == "directory") {
    return LayerKind::kDirectory;
  } else if (kind == "file") {
    return LayerKind::kFile;
  }
  return MG_ERRF("Unknown layer kind \"{}\"", kind);
}

std::string LayerKindName(LayerKind kind) {
  switch (kind) {
    case LayerKind::kArchive:
      return "archive";
    case LayerKind::kPackages:
      return "packages";
    case LayerKind::kPip:
      return "pip";
    case LayerKind::kDirectory:
      return "directory";
    case LayerKind::kFile:
      return "file";
  }
  return "unknown";
}

Result<RootfsBuildConfig> BuildConfigFromJson(const Json::Value& root) {
  MG_EXPECT(root.isObject(), "Build config must be a JSON object");
  RootfsBuildConfig config;
  MG_EXPECT(AssignIfPresent(root, {kOutputPath}, config.output_path));
  MG_EXPECT(AssignIfPresent(root, {kCapacityBytes}, config.capacity_bytes));
  MG_EXPECT(AssignIfPresent(root, {kGuestInitBinary}, config.guest_init_binary));
  MG_EXPECT(AssignIfPresent(root, {kWorkDirectory}, config.work_directory));

  MG_EXPECT(AssignIfPresent(root, {kTools, "mkfs_ext4"},
                            config.tools.mkfs_ext4));
  MG_EXPECT(AssignIfPresent(root, {kTools, "dumpe2fs"},
                            config.tools.dumpe2fs));
  MG_EXPECT(AssignIfPresent(root, {kTools, "pip"}, config.tools.pip));
  MG_EXPECT(AssignIfPresent(root, {kTools, "debootstrap"},
                            config.tools.debootstrap));
  MG_EXPECT(AssignIfPresent(root, {kTools, "bsdtar"}, config.tools.bsdtar));

  MG_EXPECT(AssignIfPresent(root, {kVmConfig, "output_path"},
                            config.vm_config.output_path));
  MG_EXPECT(AssignIfPresent(root, {kVmConfig, "kernel_image_path"},
                            config.vm_config.kernel_image_path));
  MG_EXPECT(AssignIfPresent(root, {kVmConfig, "dependency_drive"},
                            config.vm_config.dependency_drive));
  MG_EXPECT(AssignIfPresent(root, {kVmConfig, "vcpu_count"},
                            config.vm_config.vcpu_count));
  MG_EXPECT(AssignIfPresent(root, {kVmConfig, "mem_size_mib"},
                            config.vm_config.mem_size_mib));

  if (root.isMember(kLayers)) {
    MG_EXPECT(root[kLayers].isArray(), "\"layers\" must be an array");
    for (Json::ArrayIndex i = 0; i < root[kLayers].size(); i++) {
      config.layers.emplace_back(MG_EXPECTF(LayerFromJson(root[kLayers][i]),
                                            "Invalid layer at index {}", i));
    }
  }
  for (const auto& layer : config.layers) {
    if (layer.kind == LayerKind::kPackages) {
      config.runtime = DebianRuntimeLayout();
      break;
    }
  }
  MG_EXPECT(AssignIfPresent(root, {kRuntime, "interpreter"},
                            config.runtime.interpreter));
  MG_EXPECT(AssignIfPresent(root, {kRuntime, "site_packages"},
                            config.runtime.site_packages));

  if (HasValue(root, {kPayloadKey})) {
    LayerSpec payload;
    payload.kind = LayerKind::kFile;
    payload.source = MG_EXPECT(GetValue<std::string>(root, {kPayloadKey}));
    payload.destination = kPayloadPath;
    payload.mode = 0755;
    config.layers.emplace_back(std::move(payload));
  }
  if (HasValue(root, {kDataDirectoryKey})) {
    LayerSpec data;
    data.kind = LayerKind::kDirectory;
    data.source = MG_EXPECT(GetValue<std::string>(root, {kDataDirectoryKey}));
    data.destination = kDataDirectory;
    config.layers.emplace_back(std::move(data));
  }
  return config;
}

Result<RootfsBuildConfig> LoadBuildConfig(const std::string& path) {
  auto root = MG_EXPECT(LoadFromFile(path));
  return MG_EXPECTF(BuildConfigFromJson(root), "Invalid build config \"{}\"",
                    path);
}

Result<void> ValidateBuildConfig(const RootfsBuildConfig& config) {
  MG_EXPECT(!config.output_path.empty(), "No output path given");
  MG_EXPECT(!DirectoryExists(config.output_path),
            "Output path \"" << config.output_path << "\" is a directory");
  MG_EXPECT(config.capacity_bytes > 0, "Image capacity must be positive");
  MG_EXPECTF(config.capacity_bytes % kBlockSize == 0,
             "Image capacity {} is not a multiple of the {} byte block size",
             config.capacity_bytes, kBlockSize);
  MG_EXPECT(!config.guest_init_binary.empty(),
            "No guest_init binary given");
  MG_EXPECT(!config.layers.empty(), "No layers declared");
  for (size_t i = 0; i < config.layers.size(); i++) {
    MG_EXPECT(ValidateLayer(config.layers[i], i));
  }
  MG_EXPECT(ValidateGuestPath(config.runtime.interpreter, "interpreter"));
  MG_EXPECT(ValidateGuestPath(config.runtime.site_packages,
                              "site-packages directory"));
  if (!config.work_directory.empty()) {
    // Publishing renames the finished image out of the work directory.
    auto work_device = MG_EXPECT(FilesystemDevice(config.work_directory));
    auto output_device =
        MG_EXPECT(FilesystemDevice(cpp_dirname(config.output_path)));
    MG_EXPECTF(work_device == output_device,
               "Work directory \"{}\" and output \"{}\" are on different "
               "filesystems",
               config.work_directory, config.output_path);
  }
  if (!config.vm_config.output_path.empty()) {
    MG_EXPECT(!config.vm_config.kernel_image_path.empty(),
              "A VM config was requested without a kernel image path");
    MG_EXPECT(config.vm_config.vcpu_count > 0, "vcpu_count must be positive");
    MG_EXPECT(config.vm_config.mem_size_mib > 0,
              "mem_size_mib must be positive");
  }
  return {};
}

}  // namespace microguest
