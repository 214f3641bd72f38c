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

#include "host/libs/image/overlay.h"

#include <sys/stat.h>
#include <unistd.h>

#include <string>
#include <vector>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/strings.h>

#include "common/libs/utils/files.h"

namespace microguest {
namespace {

// Same limit as the kernel's MAXSYMLINKS.
constexpr int kMaxSymlinkHops = 40;

std::string JoinGuestPath(const std::string& parent, const std::string& name) {
  return parent == "/" ? "/" + name : parent + "/" + name;
}

std::string GuestDirname(const std::string& guest_path) {
  auto slash = guest_path.rfind('/');
  if (slash == 0 || slash == std::string::npos) {
    return "/";
  }
  return guest_path.substr(0, slash);
}

std::string HostPath(const std::string& root, const std::string& guest_path) {
  return guest_path == "/" ? root : root + guest_path;
}

Result<std::string> Resolve(const std::string& root,
                            const std::string& guest_path, bool follow_last,
                            int& hops) {
  std::vector<std::string> components;
  for (auto& component : android::base::Split(guest_path, "/")) {
    if (!component.empty() && component != ".") {
      components.emplace_back(std::move(component));
    }
  }
  std::string current = "/";
  for (size_t i = 0; i < components.size(); i++) {
    const auto& component = components[i];
    if (component == "..") {
      current = GuestDirname(current);
      continue;
    }
    auto candidate = JoinGuestPath(current, component);
    const bool is_last = i + 1 == components.size();
    struct stat st {};
    if ((!is_last || follow_last) &&
        lstat(HostPath(root, candidate).c_str(), &st) == 0 &&
        S_ISLNK(st.st_mode)) {
      MG_EXPECTF(++hops <= kMaxSymlinkHops,
                 "Too many levels of symbolic links resolving \"{}\"",
                 guest_path);
      std::string target;
      MG_EXPECTF(android::base::Readlink(HostPath(root, candidate), &target),
                 "readlink(\"{}\") failed: {}", candidate, strerror(errno));
      auto next = android::base::StartsWith(target, "/")
                      ? target
                      : JoinGuestPath(current, target);
      current = MG_EXPECT(Resolve(root, next, true, hops));
    } else {
      current = std::move(candidate);
    }
  }
  return current;
}

// Removes whatever is at `path` unless it is a directory and `keep_directory`
// is set. Missing paths are fine.
Result<void> ClearPath(const std::string& path, bool keep_directory) {
  struct stat st {};
  if (lstat(path.c_str(), &st) != 0) {
    MG_EXPECTF(errno == ENOENT, "lstat(\"{}\") failed: {}", path,
               strerror(errno));
    return {};
  }
  if (S_ISDIR(st.st_mode)) {
    if (!keep_directory) {
      MG_EXPECTF(RecursivelyRemoveDirectory(path),
                 "Could not replace directory \"{}\"", path);
    }
    return {};
  }
  MG_EXPECTF(unlink(path.c_str()) == 0, "unlink(\"{}\") failed: {}", path,
             strerror(errno));
  return {};
}

Result<void> CopyNonDirectory(const std::string& from, const std::string& to,
                              const struct stat& st) {
  if (S_ISLNK(st.st_mode)) {
    std::string target;
    MG_EXPECTF(android::base::Readlink(from, &target),
               "readlink(\"{}\") failed: {}", from, strerror(errno));
    MG_EXPECTF(symlink(target.c_str(), to.c_str()) == 0,
               "symlink(\"{}\", \"{}\") failed: {}", target, to,
               strerror(errno));
    return {};
  }
  MG_EXPECTF(S_ISREG(st.st_mode),
             "\"{}\" is not a regular file, directory or symlink", from);
  MG_EXPECTF(Copy(from, to), "Failed to copy \"{}\" to \"{}\"", from, to);
  MG_EXPECTF(chmod(to.c_str(), st.st_mode & 07777) == 0,
             "chmod(\"{}\") failed: {}", to, strerror(errno));
  return {};
}

Result<void> MoveOrCopy(const std::string& from, const std::string& to,
                        const struct stat& st, OverlayMode mode) {
  if (mode == OverlayMode::kMove) {
    MG_EXPECTF(rename(from.c_str(), to.c_str()) == 0,
               "rename(\"{}\", \"{}\") failed: {}", from, to, strerror(errno));
    return {};
  }
  return CopyNonDirectory(from, to, st);
}

Result<void> OverlayInto(const std::string& from, const std::string& root,
                         const std::string& guest_path, OverlayMode mode) {
  struct stat st {};
  MG_EXPECTF(lstat(from.c_str(), &st) == 0, "lstat(\"{}\") failed: {}", from,
             strerror(errno));
  const bool is_directory = S_ISDIR(st.st_mode);
  auto resolved = MG_EXPECT(ResolveGuestPath(root, guest_path, false));
  if (is_directory) {
    auto through_link = MG_EXPECT(ResolveGuestPath(root, resolved, true));
    if (DirectoryExists(HostPath(root, through_link), false)) {
      resolved = through_link;
    }
  }
  const auto to = HostPath(root, resolved);
  MG_EXPECT(ClearPath(to, /* keep_directory */ is_directory));

  if (!is_directory) {
    return MoveOrCopy(from, to, st, mode);
  }
  if (!DirectoryExists(to, /* follow_symlinks */ false)) {
    if (mode == OverlayMode::kMove) {
      return MoveOrCopy(from, to, st, mode);
    }
    MG_EXPECTF(mkdir(to.c_str(), st.st_mode & 07777) == 0,
               "mkdir(\"{}\") failed: {}", to, strerror(errno));
  }
  MG_EXPECTF(chmod(to.c_str(), st.st_mode & 07777) == 0,
             "chmod(\"{}\") failed: {}", to, strerror(errno));
  for (const auto& child : MG_EXPECT(DirectoryContents(from))) {
    MG_EXPECT(OverlayInto(from + "/" + child, root,
                          JoinGuestPath(resolved, child), mode));
  }
  return {};
}

}  // namespace

Result<std::string> ResolveGuestPath(const std::string& root,
                                     const std::string& guest_path,
                                     bool follow_last) {
  int hops = 0;
  return Resolve(root, guest_path, follow_last, hops);
}

Result<std::string> EnsureGuestDirectory(const std::string& root,
                                         const std::string& guest_directory,
                                         mode_t mode) {
  std::string current = "/";
  for (const auto& component : android::base::Split(guest_directory, "/")) {
    if (component.empty() || component == ".") {
      continue;
    }
    current = MG_EXPECT(
        ResolveGuestPath(root, JoinGuestPath(current, component), true));
    const auto host_path = HostPath(root, current);
    if (DirectoryExists(host_path, false)) {
      continue;
    }
    MG_EXPECT(ClearPath(host_path, /* keep_directory */ false));
    MG_EXPECTF(mkdir(host_path.c_str(), mode) == 0, "mkdir(\"{}\") failed: {}",
               host_path, strerror(errno));
  }
  return current;
}

Result<void> OverlayTree(const std::string& from, const std::string& root,
                         const std::string& guest_directory, OverlayMode mode) {
  MG_EXPECTF(DirectoryExists(from, false), "\"{}\" is not a directory", from);
  auto resolved = MG_EXPECT(EnsureGuestDirectory(root, guest_directory));
  for (const auto& child : MG_EXPECT(DirectoryContents(from))) {
    MG_EXPECT(OverlayInto(from + "/" + child, root,
                          JoinGuestPath(resolved, child), mode));
  }
  return {};
}

Result<void> OverlayEntry(const std::string& from, const std::string& root,
                          const std::string& guest_path, OverlayMode mode) {
  auto path = guest_path;
  while (path.size() > 1 && path.back() == '/') {
    path.pop_back();
  }
  MG_EXPECTF(android::base::StartsWith(path, "/") && path != "/",
             "Cannot place \"{}\" at \"{}\"", from, guest_path);
  auto parent = MG_EXPECT(EnsureGuestDirectory(root, GuestDirname(path)));
  return OverlayInto(from, root, JoinGuestPath(parent, cpp_basename(path)),
                     mode);
}

}  // namespace microguest
