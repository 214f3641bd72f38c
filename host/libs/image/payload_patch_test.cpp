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

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/constants/guest_layout.h"
#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"
#include "host/libs/image/build_error.h"

namespace microguest {
namespace {

using ::testing::HasSubstr;

// "Mounts" by swapping the mount point directory for a symlink to a backing
// directory holding the image contents.
class FakeMounter : public ImageMounter {
 public:
  FakeMounter(std::string backing) : backing_(std::move(backing)) {}

  Result<void> Mount(const std::string&,
                     const std::string& mount_point) override {
    if (fail_mount) {
      return MG_ERR("mount: wrong fs type");
    }
    MG_EXPECT(rmdir(mount_point.c_str()) == 0);
    MG_EXPECT(symlink(backing_.c_str(), mount_point.c_str()) == 0);
    mounted = true;
    return {};
  }

  Result<void> Unmount(const std::string& mount_point) override {
    MG_EXPECT(unlink(mount_point.c_str()) == 0);
    MG_EXPECT(mkdir(mount_point.c_str(), 0700) == 0);
    mounted = false;
    unmount_count++;
    return {};
  }

  bool fail_mount = false;
  bool mounted = false;
  int unmount_count = 0;

 private:
  std::string backing_;
};

class PayloadPatchTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const std::string dir = dir_.path;
    backing_ = dir + "/backing";
    image_ = dir + "/rootfs.ext4";
    payload_ = dir + "/agent.py";
    mount_point_ = dir + "/rootfs.ext4.mnt";
    ASSERT_THAT(EnsureDirectoryExists(backing_ + "/usr/bin"), IsOk());
    ASSERT_EQ(symlink("usr/bin", (backing_ + "/bin").c_str()), 0);
    ASSERT_TRUE(android::base::WriteStringToFile(
        "old", backing_ + "/usr/bin/agent.py"));
    ASSERT_TRUE(android::base::WriteStringToFile("image", image_));
    ASSERT_TRUE(android::base::WriteStringToFile("new", payload_));
  }

  std::string Payload() {
    std::string contents;
    android::base::ReadFileToString(backing_ + "/usr/bin/agent.py", &contents);
    return contents;
  }

  TemporaryDir dir_;
  std::string backing_;
  std::string image_;
  std::string payload_;
  std::string mount_point_;
};

TEST_F(PayloadPatchTest, ReplacesPayloadThroughLinks) {
  FakeMounter mounter(backing_);

  ASSERT_THAT(PatchPayload(image_, payload_, mounter, mount_point_), IsOk());

  EXPECT_EQ(Payload(), "new");
  struct stat st {};
  ASSERT_EQ(stat((backing_ + "/usr/bin/agent.py").c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 07777, 0755u);
  EXPECT_FALSE(FileExists(backing_ + "/usr/bin/agent.py.partial"));
  EXPECT_FALSE(mounter.mounted);
  EXPECT_FALSE(FileExists(mount_point_, false));
}

TEST_F(PayloadPatchTest, MountFailureIsPopulationError) {
  FakeMounter mounter(backing_);
  mounter.fail_mount = true;

  auto result = PatchPayload(image_, payload_, mounter, mount_point_);

  ASSERT_THAT(result, IsErrorAndMessage(HasSubstr("wrong fs type")));
  EXPECT_EQ(BuildErrorExitCode(result.error()), 4);
  EXPECT_EQ(Payload(), "old");
  EXPECT_FALSE(FileExists(mount_point_, false));
}

TEST_F(PayloadPatchTest, MissingPayloadDirectoryUnmounts) {
  ASSERT_TRUE(RecursivelyRemoveDirectory(backing_ + "/usr"));
  FakeMounter mounter(backing_);

  auto result = PatchPayload(image_, payload_, mounter, mount_point_);

  ASSERT_THAT(result, IsErrorAndMessage(HasSubstr(kPayloadPath)));
  EXPECT_EQ(mounter.unmount_count, 1);
  EXPECT_FALSE(mounter.mounted);
  EXPECT_FALSE(FileExists(mount_point_, false));
}

TEST_F(PayloadPatchTest, ExistingMountPointIsRejected) {
  ASSERT_THAT(EnsureDirectoryExists(mount_point_), IsOk());
  FakeMounter mounter(backing_);

  EXPECT_THAT(PatchPayload(image_, payload_, mounter, mount_point_),
              IsError());
  EXPECT_EQ(Payload(), "old");
  // A mount point the patch did not create is left alone.
  EXPECT_TRUE(DirectoryExists(mount_point_, false));
}

}  // namespace
}  // namespace microguest
