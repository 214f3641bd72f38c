//
// Copyright (C) 2023 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "common/libs/utils/files.h"

#include <fcntl.h>
#include <sys/stat.h>

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/fs/shared_fd.h"
#include "common/libs/utils/result_matchers.h"

namespace microguest {

using ::testing::UnorderedElementsAre;

TEST(FilesTest, EnsureDirectoryExistsCreatesParents) {
  TemporaryDir dir;
  const std::string nested = std::string(dir.path) + "/a/b/c";

  ASSERT_THAT(EnsureDirectoryExists(nested), IsOk());
  EXPECT_TRUE(DirectoryExists(nested));
  // A second call on an existing directory is a no-op.
  EXPECT_THAT(EnsureDirectoryExists(nested), IsOk());
}

TEST(FilesTest, EnsureDirectoryExistsFailsUnderRegularFile) {
  TemporaryDir dir;
  const std::string file = std::string(dir.path) + "/file";
  ASSERT_TRUE(android::base::WriteStringToFile("x", file));

  EXPECT_THAT(EnsureDirectoryExists(file + "/sub"), IsError());
}

TEST(FilesTest, DirectoryContentsSkipsDotEntries) {
  TemporaryDir dir;
  ASSERT_TRUE(android::base::WriteStringToFile(
      "1", std::string(dir.path) + "/one"));
  ASSERT_THAT(EnsureDirectoryExists(std::string(dir.path) + "/two"), IsOk());

  auto contents = DirectoryContents(dir.path);
  ASSERT_THAT(contents, IsOk());
  EXPECT_THAT(*contents, UnorderedElementsAre("one", "two"));
}

TEST(FilesTest, RecursivelyRemoveDirectory) {
  TemporaryDir dir;
  const std::string root = std::string(dir.path) + "/tree";
  ASSERT_THAT(EnsureDirectoryExists(root + "/x/y"), IsOk());
  ASSERT_TRUE(android::base::WriteStringToFile("data", root + "/x/y/f"));

  EXPECT_TRUE(RecursivelyRemoveDirectory(root));
  EXPECT_FALSE(FileExists(root));
}

TEST(FilesTest, CopyPreservesContentAndApparentSize) {
  TemporaryDir dir;
  const std::string from = std::string(dir.path) + "/from";
  const std::string to = std::string(dir.path) + "/to";
  {
    auto fd = SharedFD::Open(from, O_CREAT | O_WRONLY, 0644);
    ASSERT_TRUE(fd->IsOpen()) << fd->StrError();
    ASSERT_EQ(fd->Write("head", 4), 4);
    // Leaves a hole between the two writes.
    ASSERT_EQ(fd->LSeek(1 << 20, SEEK_SET), 1 << 20);
    ASSERT_EQ(fd->Write("tail", 4), 4);
  }

  ASSERT_TRUE(Copy(from, to));

  EXPECT_EQ(FileSize(to), FileSize(from));
  std::string copied, original;
  ASSERT_TRUE(android::base::ReadFileToString(to, &copied));
  ASSERT_TRUE(android::base::ReadFileToString(from, &original));
  EXPECT_EQ(copied, original);
}

TEST(FilesTest, RenameReplacesDestination) {
  TemporaryDir dir;
  const std::string from = std::string(dir.path) + "/from";
  const std::string to = std::string(dir.path) + "/to";
  ASSERT_TRUE(android::base::WriteStringToFile("new", from));
  ASSERT_TRUE(android::base::WriteStringToFile("old", to));

  ASSERT_TRUE(RenameFile(from, to));

  EXPECT_FALSE(FileExists(from));
  std::string contents;
  ASSERT_TRUE(android::base::ReadFileToString(to, &contents));
  EXPECT_EQ(contents, "new");
}

TEST(FilesTest, PathHelpers) {
  EXPECT_EQ(cpp_basename("/bin/agent.py"), "agent.py");
  EXPECT_EQ(cpp_dirname("/bin/agent.py"), "/bin");
  EXPECT_EQ(cpp_dirname("agent.py"), ".");
  EXPECT_EQ(AbsolutePath("/usr/local"), "/usr/local");
  EXPECT_EQ(AbsolutePath(""), "");
}

}  // namespace microguest
