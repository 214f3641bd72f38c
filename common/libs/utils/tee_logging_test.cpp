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

#include "common/libs/utils/tee_logging.h"

#include <string>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/result_matchers.h"

namespace microguest {

using ::testing::HasSubstr;
using ::testing::Not;

TEST(TeeLoggingTest, ParsesSeverityNames) {
  EXPECT_THAT(ToSeverity("debug"), IsOkAndValue(android::base::DEBUG));
  EXPECT_THAT(ToSeverity("WARNING"), IsOkAndValue(android::base::WARNING));
  EXPECT_THAT(ToSeverity("4"), IsOkAndValue(android::base::ERROR));
  EXPECT_THAT(ToSeverity("loud"), IsError());
  EXPECT_EQ(FromSeverity(android::base::INFO), "INFO");
}

TEST(TeeLoggingTest, FileGetsEveryLine) {
  TemporaryFile log_file;
  auto logger = LogToStderrAndFiles({log_file.path}, android::base::ERROR);
  ASSERT_THAT(logger, IsOk());

  (*logger)(android::base::DEFAULT, android::base::DEBUG, "build_rootfs",
            "image_builder.cpp", 10, "first line\nsecond line");

  std::string contents;
  ASSERT_TRUE(android::base::ReadFileToString(log_file.path, &contents));
  EXPECT_THAT(contents, HasSubstr("] first line\n"));
  EXPECT_THAT(contents, HasSubstr("] second line\n"));
  EXPECT_THAT(contents, HasSubstr("build_rootfs D"));
  EXPECT_THAT(contents, Not(HasSubstr("\n\n")));
}

TEST(TeeLoggingTest, UnwritableLogFile) {
  TemporaryDir dir;
  EXPECT_THAT(LogToStderrAndFiles({std::string(dir.path) + "/no/such/file"},
                                  android::base::INFO),
              IsError());
}

}  // namespace microguest
