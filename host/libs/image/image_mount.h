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

#include <string>

#include "common/libs/utils/result.h"

namespace microguest {

// Attaches a filesystem image to a directory of the host.
class ImageMounter {
 public:
  virtual ~ImageMounter();
  virtual Result<void> Mount(const std::string& image,
                             const std::string& mount_point) = 0;
  virtual Result<void> Unmount(const std::string& mount_point) = 0;
};

// Uses mount(8) with a loop device. Needs CAP_SYS_ADMIN.
class LoopImageMounter : public ImageMounter {
 public:
  LoopImageMounter(std::string mount_path = "/bin/mount",
                   std::string umount_path = "/bin/umount");

  Result<void> Mount(const std::string& image,
                     const std::string& mount_point) override;
  Result<void> Unmount(const std::string& mount_point) override;

 private:
  std::string mount_path_;
  std::string umount_path_;
};

// Copies a staged tree into a formatted image.
class Populator {
 public:
  virtual ~Populator();
  virtual Result<void> Populate(const std::string& image,
                                const std::string& tree_root,
                                const std::string& mount_point) = 0;
};

// Mounts the image, copies the tree preserving ownership, permissions, links
// and holes, flushes and unmounts. The image is unmounted on every path out.
class MountingPopulator : public Populator {
 public:
  MountingPopulator(ImageMounter& mounter);

  Result<void> Populate(const std::string& image, const std::string& tree_root,
                        const std::string& mount_point) override;

 private:
  ImageMounter& mounter_;
};

}  // namespace microguest
