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
#pragma once

#include <sys/types.h>

#include <cstdint>
#include <string>
#include <vector>

#include <json/json.h>

#include "common/libs/constants/guest_layout.h"
#include "common/libs/utils/result.h"

namespace microguest {

enum class LayerKind {
  kArchive,
  kPackages,
  kPip,
  kDirectory,
  kFile,
};

Result<LayerKind> ParseLayerKind(const std::string& kind);
std::string LayerKindName(LayerKind kind);

// One declared contribution to the root filesystem. Which fields matter
// depends on the kind:
//   archive:   source (tarball)
//   packages:  packages, suite, mirror
//   pip:       source (requirements file), destination (site-packages)
//   directory: source (host directory), destination
//   file:      source (host file), destination, mode
struct LayerSpec {
  LayerKind kind = LayerKind::kDirectory;
  std::string source;
  std::string destination = "/";
  std::vector<std::string> packages;
  std::string suite = "bookworm";
  std::string mirror = "http://deb.debian.org/debian";
  mode_t mode = 0644;
};

struct VmConfigOptions {
  std::string output_path;
  std::string kernel_image_path;
  // Optional read-only drive with the payload's Python dependencies.
  std::string dependency_drive;
  uint32_t vcpu_count = 2;
  uint32_t mem_size_mib = 1024;
};

struct ToolPaths {
  std::string mkfs_ext4 = "/sbin/mkfs.ext4";
  std::string dumpe2fs = "/sbin/dumpe2fs";
  std::string pip = "/usr/bin/pip3";
  std::string debootstrap = "/usr/sbin/debootstrap";
  std::string bsdtar = "/usr/bin/bsdtar";
};

// Where the composed tree keeps its Python runtime. pip layers without an
// explicit destination install into `site_packages`.
struct RuntimeLayout {
  std::string interpreter = kPayloadInterpreter;
  std::string site_packages = kSitePackagesDirectory;
};

// Layout of a Debian base built by a packages layer.
RuntimeLayout DebianRuntimeLayout();

// Everything one invocation of the image builder needs.
struct RootfsBuildConfig {
  std::string output_path;
  uint64_t capacity_bytes;
  std::vector<LayerSpec> layers;
  // Host path of the guest_init binary installed at /sbin/guest_init.
  std::string guest_init_binary;
  // Holds the temporary image, mount point and staging tree. Defaults to the
  // directory of output_path so that publishing is a same-filesystem rename.
  std::string work_directory;
  ToolPaths tools;
  RuntimeLayout runtime;
  VmConfigOptions vm_config;

  RootfsBuildConfig();
};

// Accepts both the generic "layers" list and the "payload" and
// "data_directory" shortcuts, which are appended after the declared layers.
// Without a "runtime" section the layout follows the base: Debian paths when a
// packages layer is declared, python:3.11-slim paths otherwise.
Result<RootfsBuildConfig> BuildConfigFromJson(const Json::Value& root);
Result<RootfsBuildConfig> LoadBuildConfig(const std::string& path);

Result<void> ValidateBuildConfig(const RootfsBuildConfig& config);

}  // namespace microguest
