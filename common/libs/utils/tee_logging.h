/*
 * Copyright (C) 2017 The Android Open Source Project
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
#include <vector>

#include <android-base/logging.h>

#include "common/libs/fs/shared_fd.h"
#include "common/libs/utils/result.h"

namespace microguest {

std::string FromSeverity(android::base::LogSeverity severity);
// Accepts the severity names, case insensitive, or their numeric values.
Result<android::base::LogSeverity> ToSeverity(const std::string& value);

struct SeverityTarget {
  android::base::LogSeverity severity;
  SharedFD target;
};

class TeeLogger {
 public:
  TeeLogger(const std::vector<SeverityTarget>& destinations);

  void operator()(android::base::LogId log_id,
                  android::base::LogSeverity severity, const char* tag,
                  const char* file, unsigned int line, const char* message);

 private:
  std::vector<SeverityTarget> destinations_;
};

// Everything goes to the files, stderr only gets messages at or above
// `console_severity`.
Result<TeeLogger> LogToStderrAndFiles(
    const std::vector<std::string>& files,
    android::base::LogSeverity console_severity);

// Installs a TeeLogger for stderr at `verbosity` plus `files` at every
// severity as the process logger.
Result<void> SetupLogging(const std::string& verbosity,
                          const std::vector<std::string>& files);

}  // namespace microguest
