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
#include <string>

#include "common/libs/utils/result.h"

namespace microguest {

// Creates (or truncates) `image` as a sparse file of exactly `size_bytes`.
Result<void> CreateBlankImage(const std::string& image, uint64_t size_bytes);

// Room left in a freshly formatted filesystem, after its own metadata.
struct FilesystemSpace {
  uint64_t free_bytes = 0;
  uint64_t free_inodes = 0;
};

// Reads the free block and inode counts from the superblock summary printed
// by `dumpe2fs -h`.
Result<FilesystemSpace> ParseDumpe2fsHeader(const std::string& header);

// Lays a filesystem onto an allocated backing file.
class Formatter {
 public:
  virtual ~Formatter();
  virtual Result<void> Format(const std::string& image) = 0;
  // Space usable for files in a formatted `image`.
  virtual Result<FilesystemSpace> FreeSpace(const std::string& image) = 0;
};

class Ext4Formatter : public Formatter {
 public:
  Ext4Formatter(std::string mkfs_path, std::string dumpe2fs_path,
                std::string label = "rootfs");

  Result<void> Format(const std::string& image) override;
  Result<FilesystemSpace> FreeSpace(const std::string& image) override;

 private:
  std::string mkfs_path_;
  std::string dumpe2fs_path_;
  std::string label_;
};

// Formats `image` with ext4 and fills it with the contents of `directory` in
// the same pass. Needs no mount and so no privileges.
Result<void> FormatExt4WithContents(const std::string& mkfs_path,
                                    const std::string& image,
                                    const std::string& directory,
                                    const std::string& label);

}  // namespace microguest
