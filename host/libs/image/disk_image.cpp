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

#include "host/libs/image/disk_image.h"

#include <fcntl.h>

#include <map>
#include <string>
#include <utility>

#include <android-base/logging.h>
#include <android-base/parseint.h>
#include <android-base/strings.h>

#include "common/libs/fs/shared_fd.h"
#include "common/libs/utils/subprocess.h"

namespace microguest {

Result<void> CreateBlankImage(const std::string& image, uint64_t size_bytes) {
  LOG(DEBUG) << "Creating " << image << " (" << size_bytes << " bytes)";

  auto fd = SharedFD::Open(image, O_CREAT | O_TRUNC | O_RDWR, 0644);
  MG_EXPECTF(fd->IsOpen(), "Could not create \"{}\": {}", image,
             fd->StrError());
  MG_EXPECTF(fd->Truncate(static_cast<off_t>(size_bytes)) == 0,
             "`truncate --size={} '{}'` failed: {}", size_bytes, image,
             fd->StrError());
  return {};
}

Result<FilesystemSpace> ParseDumpe2fsHeader(const std::string& header) {
  std::map<std::string, std::string> fields;
  for (const auto& line : android::base::Split(header, "\n")) {
    auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    fields[android::base::Trim(line.substr(0, colon))] =
        android::base::Trim(line.substr(colon + 1));
  }
  auto number = [&fields](const std::string& name) -> Result<uint64_t> {
    auto it = fields.find(name);
    MG_EXPECTF(it != fields.end(), "No \"{}\" field", name);
    uint64_t value = 0;
    MG_EXPECTF(android::base::ParseUint(it->second, &value),
               "\"{}\" is not a number: \"{}\"", name, it->second);
    return value;
  };
  FilesystemSpace space;
  const auto block_size = MG_EXPECT(number("Block size"));
  space.free_bytes = MG_EXPECT(number("Free blocks")) * block_size;
  space.free_inodes = MG_EXPECT(number("Free inodes"));
  return space;
}

Formatter::~Formatter() = default;

Ext4Formatter::Ext4Formatter(std::string mkfs_path, std::string dumpe2fs_path,
                             std::string label)
    : mkfs_path_(std::move(mkfs_path)),
      dumpe2fs_path_(std::move(dumpe2fs_path)),
      label_(std::move(label)) {}

Result<void> Ext4Formatter::Format(const std::string& image) {
  Command mkfs(mkfs_path_);
  // -F is needed because the target is a regular file, not a block device.
  mkfs.AddParameter("-F");
  mkfs.AddParameter("-q");
  mkfs.AddParameter("-L");
  mkfs.AddParameter(label_);
  mkfs.AddParameter(image);
  MG_EXPECTF(RunAndLogOutput(std::move(mkfs)), "mkfs.ext4 on \"{}\" failed",
             image);
  return {};
}

Result<FilesystemSpace> Ext4Formatter::FreeSpace(const std::string& image) {
  Command dumpe2fs(dumpe2fs_path_);
  dumpe2fs.AddParameter("-h");
  dumpe2fs.AddParameter(image);
  auto header = MG_EXPECT(RunAndCaptureStdout(std::move(dumpe2fs)));
  return MG_EXPECTF(ParseDumpe2fsHeader(header),
                    "Unexpected dumpe2fs output for \"{}\"", image);
}

Result<void> FormatExt4WithContents(const std::string& mkfs_path,
                                    const std::string& image,
                                    const std::string& directory,
                                    const std::string& label) {
  Command mkfs(mkfs_path);
  mkfs.AddParameter("-F");
  mkfs.AddParameter("-q");
  mkfs.AddParameter("-L");
  mkfs.AddParameter(label);
  // Files are owned by root in the guest regardless of who builds.
  mkfs.AddParameter("-E");
  mkfs.AddParameter("root_owner=0:0");
  mkfs.AddParameter("-d");
  mkfs.AddParameter(directory);
  mkfs.AddParameter(image);
  MG_EXPECTF(RunAndLogOutput(std::move(mkfs)),
             "mkfs.ext4 -d \"{}\" on \"{}\" failed", directory, image);
  return {};
}

}  // namespace microguest
