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

#include "common/libs/utils/tee_logging.h"

#include <fcntl.h>
#include <inttypes.h>
#include <time.h>
#include <unistd.h>

#include <string>
#include <utility>
#include <vector>

#include <android-base/macros.h>
#include <android-base/stringprintf.h>
#include <android-base/strings.h>
#include <android-base/threads.h>

#include "common/libs/fs/shared_buf.h"

using android::base::GetThreadId;
using android::base::LogSeverity;
using android::base::StringPrintf;

namespace microguest {
namespace {

struct SeverityName {
  LogSeverity severity;
  const char* name;
};

constexpr SeverityName kSeverityNames[] = {
    {android::base::VERBOSE, "VERBOSE"},
    {android::base::DEBUG, "DEBUG"},
    {android::base::INFO, "INFO"},
    {android::base::WARNING, "WARNING"},
    {android::base::ERROR, "ERROR"},
    {android::base::FATAL_WITHOUT_ABORT, "FATAL_WITHOUT_ABORT"},
    {android::base::FATAL, "FATAL"},
};

// Adds the log header to each line of message.
std::string StderrOutputGenerator(const struct tm& now, int pid, uint64_t tid,
                                  LogSeverity severity, const char* tag,
                                  const char* file, unsigned int line,
                                  const char* message) {
  char timestamp[32];
  strftime(timestamp, sizeof(timestamp), "%m-%d %H:%M:%S", &now);

  static const char log_characters[] = "VDIWEFF";
  static_assert(arraysize(log_characters) - 1 == android::base::FATAL + 1,
                "Mismatch in size of log_characters and values in LogSeverity");
  char severity_char = log_characters[severity];
  std::string line_prefix;
  if (file != nullptr) {
    line_prefix = StringPrintf("%s %c %s %5d %5" PRIu64 " %s:%u] ",
                               tag ? tag : "nullptr", severity_char, timestamp,
                               pid, tid, file, line);
  } else {
    line_prefix = StringPrintf("%s %c %s %5d %5" PRIu64 " ",
                               tag ? tag : "nullptr", severity_char, timestamp,
                               pid, tid);
  }

  std::string output_string;
  for (const auto& message_line : android::base::Split(message, "\n")) {
    output_string.append(line_prefix);
    output_string.append(message_line);
    output_string.append("\n");
  }
  return output_string;
}

}  // namespace

std::string FromSeverity(LogSeverity severity) {
  for (const auto& [known, name] : kSeverityNames) {
    if (known == severity) {
      return name;
    }
  }
  return "UNKNOWN";
}

Result<LogSeverity> ToSeverity(const std::string& value) {
  for (const auto& [severity, name] : kSeverityNames) {
    if (android::base::EqualsIgnoreCase(value, name) ||
        value == std::to_string(static_cast<int>(severity))) {
      return severity;
    }
  }
  return MG_ERRF("Unknown log severity \"{}\"", value);
}

TeeLogger::TeeLogger(const std::vector<SeverityTarget>& destinations)
    : destinations_(destinations) {}

void TeeLogger::operator()(android::base::LogId, LogSeverity severity,
                           const char* tag, const char* file,
                           unsigned int line, const char* message) {
  struct tm now;
  time_t t = time(nullptr);
  localtime_r(&t, &now);
  auto output_string = StderrOutputGenerator(now, getpid(), GetThreadId(),
                                             severity, tag, file, line, message);
  for (const auto& destination : destinations_) {
    if (severity >= destination.severity) {
      WriteAll(destination.target, output_string);
    }
  }
}

Result<TeeLogger> LogToStderrAndFiles(const std::vector<std::string>& files,
                                      LogSeverity console_severity) {
  std::vector<SeverityTarget> destinations;
  for (const auto& file : files) {
    auto log_file_fd = SharedFD::Open(file, O_CREAT | O_WRONLY | O_APPEND,
                                      S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP);
    MG_EXPECTF(log_file_fd->IsOpen(), "Failed to create log file \"{}\": {}",
               file, log_file_fd->StrError());
    destinations.push_back(
        SeverityTarget{android::base::VERBOSE, log_file_fd});
  }
  destinations.push_back(
      SeverityTarget{console_severity, SharedFD::Dup(/* stderr */ 2)});
  return TeeLogger(destinations);
}

Result<void> SetupLogging(const std::string& verbosity,
                          const std::vector<std::string>& files) {
  auto console_severity = MG_EXPECT(ToSeverity(verbosity));
  auto logger = MG_EXPECT(LogToStderrAndFiles(files, console_severity));
  android::base::SetMinimumLogSeverity(
      files.empty() ? console_severity : android::base::VERBOSE);
  android::base::SetLogger(std::move(logger));
  return {};
}

}  // namespace microguest
