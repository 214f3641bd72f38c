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
#pragma once

#include <optional>
#include <string>

#include "common/libs/utils/result.h"

namespace microguest {

// Failure classes of an image build. Each build step reports its failures with
// a message starting with the class name, e.g. "CapacityExceeded: ...".
enum class BuildErrorKind {
  kCapacityExceeded,
  kFormatError,
  kPopulationError,
};

std::string BuildErrorKindName(BuildErrorKind kind);

// Finds the class of the innermost classified entry in the error.
std::optional<BuildErrorKind> ClassifyBuildError(const StackTraceError& error);

// Process exit code reported by the host tools for a failed build.
int BuildErrorExitCode(const StackTraceError& error);

}  // namespace microguest
