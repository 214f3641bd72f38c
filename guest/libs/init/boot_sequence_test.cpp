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

#include "guest/libs/init/boot_sequence.h"

#include <sys/stat.h>

#include <string>
#include <vector>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/constants/guest_layout.h"
#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"
#include "guest/libs/init/guest_kernel_mock.h"

namespace microguest {
namespace {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::InvokeWithoutArgs;
using ::testing::Return;

Result<void> Refuse() { return MG_ERR("EPERM"); }

class BootSequenceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = std::string(root_dir_.path);
    ASSERT_THAT(EnsureDirectoryExists(root_ + kProcMountPoint), IsOk());
    ASSERT_THAT(EnsureDirectoryExists(root_ + kSysMountPoint), IsOk());
    WriteExecutable(root_ + kPayloadInterpreter);
    WriteExecutable(root_ + kPayloadPath);
  }

  void WriteExecutable(const std::string& path) {
    ASSERT_THAT(EnsureDirectoryExists(cpp_dirname(path)), IsOk());
    ASSERT_TRUE(android::base::WriteStringToFile("#!/bin/sh\n", path));
    ASSERT_EQ(chmod(path.c_str(), 0755), 0);
  }

  BootSequence Sequence() {
    return BootSequence(kernel_, root_,
                        [this](BootState state) { states_.push_back(state); });
  }

  TemporaryDir root_dir_;
  std::string root_;
  ::testing::StrictMock<MockGuestKernel> kernel_;
  std::vector<BootState> states_;
};

TEST_F(BootSequenceTest, RunsEveryStepInOrder) {
  {
    InSequence order;
    EXPECT_CALL(kernel_, Mount("proc", root_ + "/proc", "proc", _))
        .WillOnce(Return(Result<void>{}));
    EXPECT_CALL(kernel_, Mount("sys", root_ + "/sys", "sysfs", _))
        .WillOnce(Return(Result<void>{}));
    EXPECT_CALL(kernel_, Exec(root_ + kPayloadInterpreter,
                              ElementsAre(kPayloadInterpreter, kPayloadPath),
                              PayloadEnvironment()))
        .WillOnce(Return(Result<void>{}));
  }
  auto boot = Sequence();

  ASSERT_THAT(boot.Run(), IsOk());

  EXPECT_THAT(states_,
              ElementsAre(BootState::kStart, BootState::kProcMounted,
                          BootState::kSysMounted, BootState::kPayloadRunning));
  EXPECT_EQ(boot.State(), BootState::kPayloadRunning);
}

TEST_F(BootSequenceTest, MissingProcStopsBeforeSys) {
  ASSERT_EQ(rmdir((root_ + kProcMountPoint).c_str()), 0);
  auto boot = Sequence();

  EXPECT_THAT(boot.Run(),
              IsErrorAndMessage(HasSubstr("MountError{kind: proc}")));
  EXPECT_THAT(states_, ElementsAre(BootState::kStart));
}

TEST_F(BootSequenceTest, KernelRefusingSysfs) {
  EXPECT_CALL(kernel_, Mount("proc", _, "proc", _))
      .WillOnce(Return(Result<void>{}));
  EXPECT_CALL(kernel_, Mount("sys", _, "sysfs", _))
      .WillOnce(InvokeWithoutArgs(Refuse));
  auto boot = Sequence();

  auto result = boot.Run();

  EXPECT_THAT(result, IsErrorAndMessage(HasSubstr("MountError{kind: sys}")));
  EXPECT_THAT(result, IsErrorAndMessage(HasSubstr("EPERM")));
  EXPECT_THAT(states_, ElementsAre(BootState::kStart, BootState::kProcMounted));
  EXPECT_EQ(boot.State(), BootState::kProcMounted);
}

TEST_F(BootSequenceTest, MissingPayloadIsExecError) {
  ASSERT_TRUE(RemoveFile(root_ + kPayloadPath));
  EXPECT_CALL(kernel_, Mount(_, _, _, _))
      .Times(2)
      .WillRepeatedly(Return(Result<void>{}));
  auto boot = Sequence();

  EXPECT_THAT(boot.Run(), IsErrorAndMessage(HasSubstr("ExecError")));
  EXPECT_THAT(states_, ElementsAre(BootState::kStart, BootState::kProcMounted,
                                   BootState::kSysMounted));
}

TEST_F(BootSequenceTest, NonExecutableInterpreterIsExecError) {
  ASSERT_EQ(chmod((root_ + kPayloadInterpreter).c_str(), 0644), 0);
  EXPECT_CALL(kernel_, Mount(_, _, _, _))
      .Times(2)
      .WillRepeatedly(Return(Result<void>{}));
  auto boot = Sequence();

  EXPECT_THAT(boot.Run(),
              IsErrorAndMessage(HasSubstr(kPayloadInterpreter)));
}

TEST_F(BootSequenceTest, FailedExecIsExecError) {
  EXPECT_CALL(kernel_, Mount(_, _, _, _))
      .Times(2)
      .WillRepeatedly(Return(Result<void>{}));
  EXPECT_CALL(kernel_, Exec(_, _, _)).WillOnce(InvokeWithoutArgs(Refuse));
  auto boot = Sequence();

  EXPECT_THAT(boot.Run(), IsErrorAndMessage(HasSubstr("ExecError")));
  EXPECT_EQ(boot.State(), BootState::kSysMounted);
}

TEST_F(BootSequenceTest, RunsOnlyOnce) {
  ASSERT_EQ(rmdir((root_ + kProcMountPoint).c_str()), 0);
  auto boot = Sequence();
  ASSERT_THAT(boot.Run(), IsError());

  EXPECT_THAT(boot.Run(), IsErrorAndMessage(HasSubstr("already ran")));
  EXPECT_THAT(states_, ElementsAre(BootState::kStart));
}

TEST(PayloadEnvironmentTest, FixedVariables) {
  EXPECT_THAT(PayloadEnvironment(),
              ElementsAre(HasSubstr("PATH=/usr/local/bin"), "HOME=/root",
                          "DATA_PATH=/code/historical_data"));
}

}  // namespace
}  // namespace microguest
