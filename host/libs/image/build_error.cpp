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

#include "host/libs/image/build_error.h"

#include <string>

namespace microguest {

std::string BuildErrorKindName(BuildErrorKind kind) {
  switch (kind) {
    case BuildErrorKind::kCapacityExceeded:
      return "CapacityExceeded";
    case BuildErrorKind::kFormatError:
      return "FormatError";
    case BuildErrorKind::kPopulationError:
      return "PopulationError";
  }
  return "UnknownError";
}

std::optional<BuildErrorKind> ClassifyBuildError(const StackTraceError& error) {
  const auto message = error.Message();
  std::optional<BuildErrorKind> found;
  auto earliest = std::string::npos;
  for (auto kind : {BuildErrorKind::kCapacityExceeded,
                    BuildErrorKind::kFormatError,
                    BuildErrorKind::kPopulationError}) {
    auto position = message.find(BuildErrorKindName(kind) + ":");
    if (position < earliest) {
      earliest = position;
      found = kind;
    }
  }
  return found;
}

int BuildErrorExitCode(const StackTraceError& error) {
  auto kind = ClassifyBuildError(error);
  if (!kind) {
    return 1;
  }
  switch (*kind) {
    case BuildErrorKind::kCapacityExceeded:
      return 2;
    case BuildErrorKind::kFormatError:
      return 3;
    case BuildErrorKind::kPopulationError:
      return 4;
  }
  return 1;
}

}  // namespace microguest
