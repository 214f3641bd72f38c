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

#include "host/libs/image/rootfs_tree.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <memory>
#include <string>
#include <vector>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <fmt/format.h>
#include <openssl/evp.h>

#include "common/libs/fs/shared_fd.h"
#include "common/libs/utils/files.h"

namespace microguest {
namespace {

// Inline ("fast") symlink targets are stored in the inode itself.
constexpr size_t kFastSymlinkMax = 60;

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

Result<DigestContext> NewSha256() {
  DigestContext context(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  MG_EXPECT(context.get() != nullptr, "EVP_MD_CTX_new failed");
  MG_EXPECT(EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) == 1,
            "EVP_DigestInit_ex failed");
  return context;
}

Result<std::string> FinishHex(EVP_MD_CTX* context) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_size = 0;
  MG_EXPECT(EVP_DigestFinal_ex(context, digest, &digest_size) == 1,
            "EVP_DigestFinal_ex failed");
  std::string hex;
  for (unsigned int i = 0; i < digest_size; i++) {
    hex += fmt::format("{:02x}", digest[i]);
  }
  return hex;
}

uint64_t RoundUpToBlock(uint64_t bytes) {
  return (bytes + RootfsTree::kBlockSize - 1) / RootfsTree::kBlockSize *
         RootfsTree::kBlockSize;
}

std::string GuestPath(const std::string& parent, const std::string& name) {
  return parent == "/" ? "/" + name : parent + "/" + name;
}

Result<void> ScanInto(const std::string& host_path,
                      const std::string& guest_path, bool with_digests,
                      std::map<std::string, TreeEntry>& entries) {
  struct stat st {};
  MG_EXPECTF(lstat(host_path.c_str(), &st) == 0, "lstat(\"{}\") failed: {}",
             host_path, strerror(errno));
  TreeEntry entry{
      .type = EntryType::kOther,
      .size = 0,
      .mode = static_cast<mode_t>(st.st_mode & 07777),
      .digest = "",
  };
  if (S_ISREG(st.st_mode)) {
    entry.type = EntryType::kRegularFile;
    entry.size = st.st_size;
    if (with_digests) {
      entry.digest = MG_EXPECT(FileSha256(host_path));
    }
  } else if (S_ISLNK(st.st_mode)) {
    entry.type = EntryType::kSymlink;
    std::string target;
    MG_EXPECTF(android::base::Readlink(host_path, &target),
               "readlink(\"{}\") failed: {}", host_path, strerror(errno));
    entry.size = target.size();
    if (with_digests) {
      entry.digest = MG_EXPECT(Sha256Hex(target));
    }
  } else if (S_ISDIR(st.st_mode)) {
    entry.type = EntryType::kDirectory;
  }
  entries[guest_path] = entry;

  if (entry.type == EntryType::kDirectory) {
    for (const auto& child : MG_EXPECT(DirectoryContents(host_path))) {
      MG_EXPECT(ScanInto(host_path + "/" + child, GuestPath(guest_path, child),
                         with_digests, entries));
    }
  }
  return {};
}

}  // namespace

bool TreeEntry::operator==(const TreeEntry& other) const {
  return type == other.type && size == other.size && mode == other.mode &&
         digest == other.digest;
}

std::ostream& operator<<(std::ostream& out, const TreeEntry& entry) {
  static constexpr const char* kTypeNames[] = {"file", "dir", "symlink",
                                               "other"};
  return out << kTypeNames[static_cast<int>(entry.type)] << " size="
             << entry.size << " mode=" << fmt::format("{:04o}", entry.mode)
             << (entry.digest.empty() ? "" : " sha256=" + entry.digest);
}

Result<RootfsTree> RootfsTree::Scan(const std::string& staging_root,
                                    bool with_digests) {
  MG_EXPECTF(DirectoryExists(staging_root, /* follow_symlinks */ false),
             "Staging root \"{}\" is not a directory", staging_root);
  RootfsTree tree;
  MG_EXPECT(ScanInto(staging_root, "/", with_digests, tree.entries_));
  return tree;
}

bool RootfsTree::Contains(const std::string& guest_path) const {
  return entries_.count(guest_path) > 0;
}

std::optional<TreeEntry> RootfsTree::Find(const std::string& guest_path) const {
  auto it = entries_.find(guest_path);
  if (it == entries_.end()) {
    return {};
  }
  return it->second;
}

uint64_t RootfsTree::ContentBytes() const {
  uint64_t total = 0;
  for (const auto& [path, entry] : entries_) {
    switch (entry.type) {
      case EntryType::kRegularFile:
        total += RoundUpToBlock(entry.size);
        break;
      case EntryType::kDirectory:
        total += kBlockSize;
        break;
      case EntryType::kSymlink:
        if (entry.size >= kFastSymlinkMax) {
          total += kBlockSize;
        }
        break;
      case EntryType::kOther:
        break;
    }
  }
  return total;
}

Result<std::string> FileSha256(const std::string& path) {
  auto fd = SharedFD::Open(path, O_RDONLY);
  MG_EXPECTF(fd->IsOpen(), "Could not open \"{}\": {}", path, fd->StrError());
  auto context = MG_EXPECT(NewSha256());
  std::vector<char> buffer(1 << 16);
  ssize_t bytes_read = 0;
  while ((bytes_read = fd->Read(buffer.data(), buffer.size())) > 0) {
    MG_EXPECT(EVP_DigestUpdate(context.get(), buffer.data(), bytes_read) == 1,
              "EVP_DigestUpdate failed");
  }
  MG_EXPECTF(bytes_read == 0, "Reading \"{}\" failed: {}", path,
             fd->StrError());
  return MG_EXPECT(FinishHex(context.get()));
}

Result<std::string> Sha256Hex(const std::string& data) {
  auto context = MG_EXPECT(NewSha256());
  MG_EXPECT(EVP_DigestUpdate(context.get(), data.data(), data.size()) == 1,
            "EVP_DigestUpdate failed");
  return MG_EXPECT(FinishHex(context.get()));
}

}  // namespace microguest
