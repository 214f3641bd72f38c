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

#include <string>

#include "common/libs/utils/result.h"

namespace microguest {

// Operations on a staging tree rooted at a host directory. Guest paths are
// absolute paths as seen from inside the guest, and symlinks met along a guest
// path are followed relative to the staging root, never to the host root.

enum class OverlayMode {
  // Entries are renamed into place. Both trees must share a filesystem and the
  // source tree is left empty.
  kMove,
  // Entries are copied; the source tree is untouched.
  kCopy,
};

// Resolves symlinks in every component of `guest_path` except, unless
// `follow_last` is set, the final one. ".." never climbs above the root.
Result<std::string> ResolveGuestPath(const std::string& root,
                                     const std::string& guest_path,
                                     bool follow_last);

// Creates `guest_directory` and its parents. Non-directories in the way are
// replaced. Returns the resolved guest path of the directory.
Result<std::string> EnsureGuestDirectory(const std::string& root,
                                         const std::string& guest_directory,
                                         mode_t mode = 0755);

/**
 * Lays the contents of the host directory `from` over `guest_directory`. An
 * entry of `from` always wins over the entry at the same path in the tree,
 * even when one is a directory and the other is not. Directories present on
 * both sides are merged and take the permission bits of the `from` side. A
 * directory laid over a symlink to a directory is merged into the symlink
 * target.
 */
Result<void> OverlayTree(const std::string& from, const std::string& root,
                         const std::string& guest_directory, OverlayMode mode);

// Places a single host file, symlink or directory at exactly `guest_path`.
Result<void> OverlayEntry(const std::string& from, const std::string& root,
                          const std::string& guest_path, OverlayMode mode);

}  // namespace microguest
