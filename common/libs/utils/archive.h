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

#include "common/libs/utils/result.h"

namespace microguest {

// Operations on archive files, through bsdtar so that any format it reads is
// accepted.
class Archive {
 public:
  Archive(std::string file, std::string bsdtar_path);
  ~Archive();

  // Extracts every entry below `target_directory`, keeping holes, permission
  // bits and ownership.
  Result<void> ExtractAll(const std::string& target_directory);

 private:
  std::string file_;
  std::string bsdtar_path_;
};

}  // namespace microguest
