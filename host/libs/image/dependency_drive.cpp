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

#include "host/libs/image/dependency_drive.h"

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/scopeguard.h>
#include <android-base/strings.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/subprocess.h"
#include "host/libs/image/disk_image.h"
#include "host/libs/image/layer.h"
#include "host/libs/image/rootfs_tree.h"

namespace microguest {
namespace {

bool HasRequirements(const std::string& text) {
  for (const auto& line : android::base::Split(text, "\n")) {
    auto trimmed = android::base::Trim(line);
    if (!trimmed.empty() && !android::base::StartsWith(trimmed, "#")) {
      return true;
    }
  }
  return false;
}

Result<void> BuildDrive(const DependencyDriveOptions& options,
                        const std::string& drive) {
  const auto partial = drive + ".partial";
  const auto packages = drive + ".staging";
  auto remove_temporaries = [&partial, &packages]() {
    if (FileExists(partial, false) && !RemoveFile(partial)) {
      PLOG(ERROR) << "Could not remove " << partial;
    }
    if (DirectoryExists(packages, false) &&
        !RecursivelyRemoveDirectory(packages)) {
      LOG(ERROR) << "Could not remove " << packages;
    }
  };
  // Leftovers of an interrupted build.
  remove_temporaries();
  auto cleanup = android::base::make_scope_guard(remove_temporaries);

  MG_EXPECT(EnsureDirectoryExists(packages, 0755));
  MG_EXPECT(RunAndLogOutput(
      PipInstallCommand(options.pip, options.requirements, packages)));

  auto tree = MG_EXPECT(RootfsTree::Scan(packages));
  MG_EXPECTF(tree.ContentBytes() <= options.size_bytes,
             "CapacityExceeded: the dependencies need {} bytes but the drive "
             "holds {}",
             tree.ContentBytes(), options.size_bytes);

  MG_EXPECT(CreateBlankImage(partial, options.size_bytes),
            "FormatError: could not allocate the dependency drive");
  MG_EXPECT(FormatExt4WithContents(options.mkfs_ext4, partial, packages,
                                   "deps"),
            "FormatError: could not format the dependency drive");
  MG_EXPECT(RenameFile(partial, drive),
            "PopulationError: could not publish the dependency drive");
  return {};
}

}  // namespace

Result<std::string> DependencyDrivePath(const std::string& cache_directory,
                                        const std::string& requirements_text) {
  auto digest = MG_EXPECT(Sha256Hex(requirements_text));
  return cache_directory + "/" + digest + ".ext4";
}

Result<std::optional<std::string>> BuildDependencyDrive(
    const DependencyDriveOptions& options) {
  std::string text;
  MG_EXPECTF(android::base::ReadFileToString(options.requirements, &text),
             "Could not read \"{}\": {}", options.requirements,
             strerror(errno));
  if (!HasRequirements(text)) {
    LOG(INFO) << options.requirements << " lists no requirements";
    return std::nullopt;
  }
  MG_EXPECT_EQ(options.size_bytes % RootfsTree::kBlockSize, uint64_t{0},
               "The drive size must be a multiple of the block size");
  MG_EXPECT(EnsureDirectoryExists(options.cache_directory));

  auto drive =
      MG_EXPECT(DependencyDrivePath(options.cache_directory, text));
  if (FileExists(drive)) {
    LOG(INFO) << "Reusing " << drive;
    return drive;
  }
  LOG(INFO) << "Building " << drive;
  MG_EXPECTF(BuildDrive(options, drive), "Building \"{}\" failed", drive);
  return drive;
}

}  // namespace microguest
