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

#include <string>

#include <fruit/fruit.h>

#include "common/libs/utils/result.h"
#include "host/libs/config/build_config.h"
#include "host/libs/image/disk_image.h"
#include "host/libs/image/image_mount.h"
#include "host/libs/image/rootfs_tree.h"

namespace microguest {

// Temporary paths of one build, all next to each other in the work directory
// and named after the output file.
class BuildWorkspace {
 public:
  INJECT(BuildWorkspace(const RootfsBuildConfig& config));

  const std::string& PartialImage() const { return partial_image_; }
  const std::string& MountPoint() const { return mount_point_; }
  const std::string& StagingRoot() const { return staging_root_; }
  const std::string& ScratchRoot() const { return scratch_root_; }
  // Empty when no VM config is requested.
  const std::string& PartialVmConfig() const { return partial_vm_config_; }

  // Creates the work directory and removes leftovers of an interrupted build.
  Result<void> Prepare();
  // Removes every temporary path. Never touches the output path.
  void Cleanup();

 private:
  std::string work_directory_;
  std::string partial_image_;
  std::string mount_point_;
  std::string staging_root_;
  std::string scratch_root_;
  std::string partial_vm_config_;
};

// Applies every declared layer in order over `staging_root`, then installs the
// guest init binary and the pseudo filesystem mount points. When the base keeps
// its interpreter elsewhere the fixed payload interpreter path links to it.
// Each layer gets a fresh directory under `scratch_root`.
Result<void> ComposeStagingTree(const RootfsBuildConfig& config,
                                const std::string& staging_root,
                                const std::string& scratch_root);

// Checks that the payload, its interpreter, guest init and the /proc and /sys
// mount points are present in the composed tree.
Result<void> ValidateFixedEntries(const std::string& staging_root,
                                  const RootfsTree& tree);

fruit::Component<BuildWorkspace> RootfsBuildComponent(
    const RootfsBuildConfig* config, Formatter* formatter,
    Populator* populator);

/**
 * Builds the image described by `config`. On success exactly one complete
 * image of `config.capacity_bytes` bytes is at `config.output_path`. On failure
 * nothing new is there, any previous file at that path is untouched and all
 * temporary files are gone.
 */
Result<void> BuildRootfsImage(const RootfsBuildConfig& config,
                              Formatter& formatter, Populator& populator);

}  // namespace microguest
