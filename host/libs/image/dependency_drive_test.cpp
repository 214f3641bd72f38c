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

#include <sys/stat.h>

#include <string>

#include <android-base/file.h>
#include <android-base/strings.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"
#include "host/libs/image/build_error.h"

namespace microguest {
namespace {

using ::testing::HasSubstr;
using ::testing::Optional;

constexpr char kFakePip[] = R"(#!/bin/sh
target=""
while [ $# -gt 0 ]; do
  if [ "$1" = "--target" ]; then target="$2"; fi
  shift
done
mkdir -p "$target/numpy"
echo numpy > "$target/numpy/__init__.py"
)";

constexpr char kFailingTool[] = R"(#!/bin/sh
echo "no matching distribution" >&2
exit 1
)";

class DependencyDriveTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::string(temp_dir_.path);
    mkfs_log_ = dir_ + "/mkfs.log";
    options_.requirements = dir_ + "/requirements.txt";
    options_.cache_directory = dir_ + "/cache";
    options_.pip = Script("pip", kFakePip);
    // Records the directory it was asked to copy and the image it formatted.
    options_.mkfs_ext4 = Script(
        "mkfs", "#!/bin/sh\n"
                "for arg; do source=\"$image\"; image=\"$arg\"; done\n"
                "ls \"$source\" > " + mkfs_log_ + "\n"
                "echo \"$image\" >> " + mkfs_log_ + "\n");
    options_.size_bytes = 16 << 20;
  }

  std::string Script(const std::string& name, const std::string& body) {
    const auto path = dir_ + "/" + name;
    EXPECT_TRUE(android::base::WriteStringToFile(body, path));
    EXPECT_EQ(chmod(path.c_str(), 0755), 0);
    return path;
  }

  std::string MkfsLog() {
    std::string contents;
    android::base::ReadFileToString(mkfs_log_, &contents);
    return contents;
  }

  std::vector<std::string> CacheContents() {
    auto contents = DirectoryContents(options_.cache_directory);
    return contents.ok() ? *contents : std::vector<std::string>{};
  }

  TemporaryDir temp_dir_;
  std::string dir_;
  std::string mkfs_log_;
  DependencyDriveOptions options_;
};

TEST_F(DependencyDriveTest, BuildsDriveNamedAfterRequirements) {
  ASSERT_TRUE(android::base::WriteStringToFile("numpy==1.26.4\n",
                                               options_.requirements));

  auto drive = BuildDependencyDrive(options_);

  ASSERT_THAT(drive, IsOk());
  auto expected = DependencyDrivePath(options_.cache_directory,
                                      "numpy==1.26.4\n");
  ASSERT_THAT(expected, IsOk());
  EXPECT_THAT(*drive, Optional(*expected));
  EXPECT_EQ(FileSize(**drive), 16 << 20);
  EXPECT_THAT(MkfsLog(), HasSubstr("numpy\n"));
  EXPECT_THAT(MkfsLog(), HasSubstr(".partial"));
  EXPECT_THAT(CacheContents(), ::testing::ElementsAre(cpp_basename(**drive)));
}

TEST_F(DependencyDriveTest, ReusesCachedDrive) {
  ASSERT_TRUE(android::base::WriteStringToFile("numpy\n",
                                               options_.requirements));
  ASSERT_THAT(BuildDependencyDrive(options_), IsOk());
  ASSERT_TRUE(RemoveFile(mkfs_log_));

  auto drive = BuildDependencyDrive(options_);

  ASSERT_THAT(drive, IsOk());
  EXPECT_TRUE(drive->has_value());
  EXPECT_FALSE(FileExists(mkfs_log_));
}

TEST_F(DependencyDriveTest, DifferentRequirementsGetDifferentDrives) {
  auto first = DependencyDrivePath("/cache", "numpy\n");
  auto second = DependencyDrivePath("/cache", "pandas\n");
  ASSERT_THAT(first, IsOk());
  ASSERT_THAT(second, IsOk());
  EXPECT_NE(*first, *second);
  EXPECT_TRUE(android::base::EndsWith(*first, ".ext4"));
}

TEST_F(DependencyDriveTest, EmptyRequirementsProduceNoDrive) {
  ASSERT_TRUE(android::base::WriteStringToFile("\n# nothing yet\n  \n",
                                               options_.requirements));

  auto drive = BuildDependencyDrive(options_);

  ASSERT_THAT(drive, IsOk());
  EXPECT_FALSE(drive->has_value());
  EXPECT_TRUE(CacheContents().empty());
}

TEST_F(DependencyDriveTest, PipFailureLeavesNothingBehind) {
  ASSERT_TRUE(android::base::WriteStringToFile("numpy\n",
                                               options_.requirements));
  options_.pip = Script("failing_pip", kFailingTool);

  auto drive = BuildDependencyDrive(options_);

  EXPECT_THAT(drive, IsErrorAndMessage(HasSubstr("no matching distribution")));
  EXPECT_TRUE(CacheContents().empty());
}

TEST_F(DependencyDriveTest, FormatFailureLeavesNothingBehind) {
  ASSERT_TRUE(android::base::WriteStringToFile("numpy\n",
                                               options_.requirements));
  options_.mkfs_ext4 = Script("failing_mkfs", kFailingTool);

  auto drive = BuildDependencyDrive(options_);

  ASSERT_THAT(drive, IsError());
  EXPECT_EQ(BuildErrorExitCode(drive.error()), 3);
  EXPECT_TRUE(CacheContents().empty());
}

TEST_F(DependencyDriveTest, DriveTooSmall) {
  ASSERT_TRUE(android::base::WriteStringToFile("numpy\n",
                                               options_.requirements));
  options_.size_bytes = 4096;

  auto drive = BuildDependencyDrive(options_);

  ASSERT_THAT(drive, IsError());
  EXPECT_EQ(BuildErrorExitCode(drive.error()), 2);
  EXPECT_TRUE(CacheContents().empty());
}

}  // namespace
}  // namespace microguest
