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

#include <sys/stat.h>

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/result_matchers.h"

namespace microguest {
namespace {

using ::testing::HasSubstr;

// Records its arguments next to itself.
constexpr char kRecordingTool[] = R"(#!/bin/sh
echo "$@" > "$0.args"
)";

constexpr char kFailingTool[] = R"(#!/bin/sh
echo "Bad magic number in super-block" >&2
exit 1
)";

constexpr char kDumpe2fsHeader[] =
    "Filesystem volume name:   rootfs\n"
    "Filesystem created:       Tue Oct  3 10:00:00 2023\n"
    "Inode count:              6400\n"
    "Block count:              25600\n"
    "Reserved block count:     1280\n"
    "Free blocks:              20000\n"
    "Free inodes:              6389\n"
    "Block size:               4096\n";

class DiskImageTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::string(temp_dir_.path);
    image_ = dir_ + "/rootfs.ext4";
  }

  std::string Script(const std::string& name, const std::string& body) {
    const auto path = dir_ + "/" + name;
    EXPECT_TRUE(android::base::WriteStringToFile(body, path));
    EXPECT_EQ(chmod(path.c_str(), 0755), 0);
    return path;
  }

  std::string Contents(const std::string& path) {
    std::string contents;
    android::base::ReadFileToString(path, &contents);
    return contents;
  }

  TemporaryDir temp_dir_;
  std::string dir_;
  std::string image_;
};

TEST_F(DiskImageTest, BlankImageIsSparse) {
  constexpr uint64_t kSize = 64ULL << 20;

  ASSERT_THAT(CreateBlankImage(image_, kSize), IsOk());

  struct stat st {};
  ASSERT_EQ(stat(image_.c_str(), &st), 0);
  EXPECT_EQ(static_cast<uint64_t>(st.st_size), kSize);
  EXPECT_LT(static_cast<uint64_t>(st.st_blocks) * 512, kSize);
}

TEST_F(DiskImageTest, BlankImageInMissingDirectory) {
  EXPECT_THAT(CreateBlankImage(dir_ + "/missing/rootfs.ext4", 4096),
              IsError());
}

TEST_F(DiskImageTest, FormatPassesLabelAndImage) {
  const auto mkfs = Script("mkfs.ext4", kRecordingTool);
  Ext4Formatter formatter(mkfs, "/bin/false");

  ASSERT_THAT(formatter.Format(image_), IsOk());

  EXPECT_EQ(Contents(mkfs + ".args"), "-F -q -L rootfs " + image_ + "\n");
}

TEST_F(DiskImageTest, FormatFailureIsReported) {
  Ext4Formatter formatter(Script("mkfs.ext4", kFailingTool), "/bin/false");

  auto result = formatter.Format(image_);

  ASSERT_THAT(result, IsError());
  EXPECT_THAT(result.error().Message(), HasSubstr(image_));
}

TEST_F(DiskImageTest, FreeSpaceReadsSuperblock) {
  const auto dumpe2fs = Script(
      "dumpe2fs", std::string("#!/bin/sh\necho \"$@\" > \"$0.args\"\n"
                              "cat <<'HEADER'\n") +
                      kDumpe2fsHeader + "HEADER\n");
  Ext4Formatter formatter("/bin/false", dumpe2fs);

  auto space = formatter.FreeSpace(image_);

  ASSERT_THAT(space, IsOk());
  EXPECT_EQ(space->free_bytes, 20000ULL * 4096);
  EXPECT_EQ(space->free_inodes, 6389u);
  EXPECT_EQ(Contents(dumpe2fs + ".args"), "-h " + image_ + "\n");
}

TEST_F(DiskImageTest, FreeSpaceOfUnreadableImage) {
  Ext4Formatter formatter("/bin/false", Script("dumpe2fs", kFailingTool));

  EXPECT_THAT(formatter.FreeSpace(image_), IsError());
}

TEST(ParseDumpe2fsHeaderTest, MissingBlockSize) {
  auto space = ParseDumpe2fsHeader("Free blocks: 10\nFree inodes: 3\n");

  ASSERT_THAT(space, IsError());
  EXPECT_THAT(space.error().Message(), HasSubstr("Block size"));
}

TEST(ParseDumpe2fsHeaderTest, GarbledCount) {
  auto space = ParseDumpe2fsHeader(
      "Block size: 1024\nFree blocks: lots\nFree inodes: 3\n");

  ASSERT_THAT(space, IsError());
  EXPECT_THAT(space.error().Message(), HasSubstr("lots"));
}

TEST_F(DiskImageTest, FormatWithContentsOwnsFilesAsRoot) {
  const auto mkfs = Script("mkfs.ext4", kRecordingTool);

  ASSERT_THAT(FormatExt4WithContents(mkfs, image_, dir_ + "/tree", "deps"),
              IsOk());

  EXPECT_EQ(Contents(mkfs + ".args"),
            "-F -q -L deps -E root_owner=0:0 -d " + dir_ + "/tree " + image_ +
                "\n");
}

}  // namespace
}  // namespace microguest
