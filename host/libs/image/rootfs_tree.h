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
#include <map>
#include <optional>
#include <ostream>
#include <string>

#include "common/libs/utils/result.h"

namespace microguest {

enum class EntryType {
  kRegularFile,
  kDirectory,
  kSymlink,
  kOther,
};

struct TreeEntry {
  EntryType type;
  uint64_t size;
  mode_t mode;
  // Hex SHA-256 of the file contents or symlink target, empty for
  // directories or when the tree was scanned without digests.
  std::string digest;

  bool operator==(const TreeEntry& other) const;
  bool operator!=(const TreeEntry& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& out, const TreeEntry& entry);

/**
 * The composed root filesystem as seen from inside the guest: every path, its
 * type, size, permission bits and content digest, keyed by absolute guest path
 * ("/" for the root itself). A tree is taken from a staging directory after
 * all layers have been applied.
 */
class RootfsTree {
 public:
  static constexpr uint64_t kBlockSize = 4096;

  static Result<RootfsTree> Scan(const std::string& staging_root,
                                 bool with_digests = false);

  const std::map<std::string, TreeEntry>& Entries() const { return entries_; }
  size_t size() const { return entries_.size(); }

  bool Contains(const std::string& guest_path) const;
  std::optional<TreeEntry> Find(const std::string& guest_path) const;

  // Bytes the tree occupies when every file and directory is rounded up to
  // whole blocks. Symlinks short enough to live in the inode are free.
  uint64_t ContentBytes() const;

  bool operator==(const RootfsTree& other) const {
    return entries_ == other.entries_;
  }
  bool operator!=(const RootfsTree& other) const { return !(*this == other); }

 private:
  std::map<std::string, TreeEntry> entries_;
};

// Hex encoded SHA-256 of the contents of a host file.
Result<std::string> FileSha256(const std::string& path);
Result<std::string> Sha256Hex(const std::string& data);

}  // namespace microguest
