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

#include "host/libs/image/payload_patch.h"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>

#include <android-base/logging.h>
#include <android-base/scopeguard.h>

#include "common/libs/constants/guest_layout.h"
#include "common/libs/utils/files.h"
#include "host/libs/image/overlay.h"

namespace microguest {
namespace {

Result<void> ReplacePayload(const std::string& root,
                            const std::string& payload) {
  const auto guest_path =
      MG_EXPECT(ResolveGuestPath(root, kPayloadPath, /* follow_last */ true));
  const auto target = root + guest_path;
  MG_EXPECTF(DirectoryExists(cpp_dirname(target), false),
             "\"{}\" has no directory for \"{}\"", root, kPayloadPath);

  const auto staged = target + ".partial";
  auto remove_staged = android::base::make_scope_guard([&staged]() {
    if (FileExists(staged, false) && !RemoveFile(staged)) {
      PLOG(ERROR) << "Could not remove " << staged;
    }
  });
  MG_EXPECTF(Copy(payload, staged), "Failed to copy \"{}\" into the image",
             payload);
  MG_EXPECTF(chmod(staged.c_str(), 0755) == 0, "chmod(\"{}\") failed: {}",
             staged, strerror(errno));
  MG_EXPECTF(rename(staged.c_str(), target.c_str()) == 0,
             "rename(\"{}\", \"{}\") failed: {}", staged, target,
             strerror(errno));
  remove_staged.Disable();
  sync();
  return {};
}

Result<void> MountAndReplace(const std::string& image,
                             const std::string& payload, ImageMounter& mounter,
                             const std::string& mount_point) {
  MG_EXPECTF(FileExists(image) && !DirectoryExists(image),
             "\"{}\" is not an image file", image);
  MG_EXPECTF(FileExists(payload) && !DirectoryExists(payload),
             "\"{}\" is not a file", payload);
  MG_EXPECTF(!FileExists(mount_point, false), "\"{}\" already exists",
             mount_point);
  MG_EXPECTF(mkdir(mount_point.c_str(), 0700) == 0, "mkdir(\"{}\") failed: {}",
             mount_point, strerror(errno));
  auto remove_mount_point = android::base::make_scope_guard([&mount_point]() {
    if (rmdir(mount_point.c_str()) != 0) {
      PLOG(ERROR) << "Could not remove " << mount_point;
    }
  });

  MG_EXPECT(mounter.Mount(image, mount_point));
  auto unmount = android::base::make_scope_guard([&mounter, &mount_point]() {
    auto result = mounter.Unmount(mount_point);
    if (!result.ok()) {
      LOG(ERROR) << "Leaving \"" << mount_point << "\" mounted: "
                 << result.error().Message();
    }
  });

  MG_EXPECT(ReplacePayload(mount_point, payload));

  unmount.Disable();
  MG_EXPECT(mounter.Unmount(mount_point));
  return {};
}

}  // namespace

Result<void> PatchPayload(const std::string& image, const std::string& payload,
                          ImageMounter& mounter,
                          const std::string& mount_point) {
  MG_EXPECTF(MountAndReplace(image, payload, mounter, mount_point),
             "PopulationError: could not patch the payload of \"{}\"", image);
  LOG(INFO) << "Replaced " << kPayloadPath << " in " << image;
  return {};
}

}  // namespace microguest
