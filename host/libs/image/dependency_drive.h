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

#include <cstdint>
#include <optional>
#include <string>

#include "common/libs/constants/guest_layout.h"
#include "common/libs/utils/result.h"

namespace microguest {

struct DependencyDriveOptions {
  std::string requirements;
  std::string cache_directory;
  std::string pip = "/usr/bin/pip3";
  std::string mkfs_ext4 = "/sbin/mkfs.ext4";
  uint64_t size_bytes = kDefaultDependencyDriveBytes;
};

// Where the drive for `requirements_text` lives in `cache_directory`.
Result<std::string> DependencyDrivePath(const std::string& cache_directory,
                                        const std::string& requirements_text);

/**
 * Returns the path of an ext4 image holding every package in the requirements
 * file, building it only when no drive for the same requirements text is in
 * the cache yet. Returns nullopt when the file lists no requirements.
 */
Result<std::optional<std::string>> BuildDependencyDrive(
    const DependencyDriveOptions& options);

}  // namespace microguest
