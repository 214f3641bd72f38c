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

#include "common/libs/utils/subprocess.h"

#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/result_matchers.h"

namespace microguest {

using ::testing::AllOf;
using ::testing::HasSubstr;

TEST(SubprocessTest, CapturesStdout) {
  Command echo("/bin/echo");
  echo.AddParameter("hello ", "world");

  auto output = RunAndCaptureStdout(std::move(echo));

  ASSERT_THAT(output, IsOk());
  EXPECT_EQ(*output, "hello world\n");
}

TEST(SubprocessTest, CapturesStdoutAndStderrSeparately) {
  Command sh("/bin/sh");
  sh.AddParameter("-c");
  sh.AddParameter("echo out; echo err >&2; exit 5");
  std::string out, err;

  int exit_code = RunWithManagedStdio(std::move(sh), &out, &err);

  EXPECT_EQ(exit_code, 5);
  EXPECT_EQ(out, "out\n");
  EXPECT_EQ(err, "err\n");
}

TEST(SubprocessTest, CaptureFailureCarriesStderr) {
  Command sh("/bin/sh");
  sh.AddParameter("-c");
  sh.AddParameter("echo 'bad superblock' >&2; exit 1");

  EXPECT_THAT(RunAndCaptureStdout(std::move(sh)),
              IsErrorAndMessage(AllOf(HasSubstr("exit code 1"),
                                      HasSubstr("bad superblock"))));
}

TEST(SubprocessTest, RunAndLogOutputSucceeds) {
  Command sh("/bin/sh");
  sh.AddParameter("-c");
  sh.AddParameter("echo out; echo err >&2");

  EXPECT_THAT(RunAndLogOutput(std::move(sh)), IsOk());
}

TEST(SubprocessTest, RunAndLogOutputIncludesTailOnFailure) {
  Command sh("/bin/sh");
  sh.AddParameter("-c");
  sh.AddParameter("echo 'disk is full' >&2; exit 3");

  EXPECT_THAT(RunAndLogOutput(std::move(sh)),
              IsErrorAndMessage(AllOf(HasSubstr("exit code 3"),
                                      HasSubstr("disk is full"))));
}

TEST(SubprocessTest, MissingExecutableFails) {
  EXPECT_THAT(RunAndCaptureStdout(Command("/nonexistent/binary")), IsError());
}

}  // namespace microguest
