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

#include "host/libs/image/image_mount.h"

#include <unistd.h>

#include <string>
#include <utility>

#include <android-base/logging.h>
#include <android-base/scopeguard.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/subprocess.h"

namespace microguest {

ImageMounter::~ImageMounter() = default;

LoopImageMounter::LoopImageMounter(std::string mount_path,
                                   std::string umount_path)
    : mount_path_(std::move(mount_path)),
      umount_path_(std::move(umount_path)) {}

Result<void> LoopImageMounter::Mount(const std::string& image,
                                     const std::string& mount_point) {
  Command mount(mount_path_);
  mount.AddParameter("-o");
  mount.AddParameter("loop,rw");
  mount.AddParameter(image);
  mount.AddParameter(mount_point);
  MG_EXPECTF(RunAndLogOutput(std::move(mount)),
             "Could not mount \"{}\" at \"{}\"", image, mount_point);
  return {};
}

Result<void> LoopImageMounter::Unmount(const std::string& mount_point) {
  Command umount(umount_path_);
  umount.AddParameter(mount_point);
  MG_EXPECTF(RunAndLogOutput(std::move(umount)), "Could not unmount \"{}\"",
             mount_point);
  return {};
}

Populator::~Populator() = default;

MountingPopulator::MountingPopulator(ImageMounter& mounter)
    : mounter_(mounter) {}

Result<void> MountingPopulator::Populate(const std::string& image,
                                         const std::string& tree_root,
                                         const std::string& mount_point) {
  MG_EXPECT(EnsureDirectoryExists(mount_point, 0700));
  MG_EXPECT(mounter_.Mount(image, mount_point));
  auto unmount = android::base::make_scope_guard([this, &mount_point]() {
    auto result = mounter_.Unmount(mount_point);
    if (!result.ok()) {
      LOG(ERROR) << "Leaving \"" << mount_point << "\" mounted: "
                 << result.error().Message();
    }
  });

  Command cp("/bin/cp");
  cp.AddParameter("-a");
  cp.AddParameter("--sparse=always");
  cp.AddParameter(tree_root, "/.");
  cp.AddParameter(mount_point, "/");
  MG_EXPECTF(RunAndLogOutput(std::move(cp)),
             "Copying \"{}\" into \"{}\" failed", tree_root, image);
  sync();

  unmount.Disable();
  MG_EXPECT(mounter_.Unmount(mount_point));
  return {};
}

}  // namespace microguest
