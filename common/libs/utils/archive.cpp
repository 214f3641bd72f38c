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

#include "common/libs/utils/archive.h"

#include <string>
#include <utility>

#include "common/libs/utils/subprocess.h"

namespace microguest {

Archive::Archive(std::string file, std::string bsdtar_path)
    : file_(std::move(file)), bsdtar_path_(std::move(bsdtar_path)) {}

Archive::~Archive() {}

Result<void> Archive::ExtractAll(const std::string& target_directory) {
  Command bsdtar_cmd(bsdtar_path_);
  bsdtar_cmd.AddParameter("-x");
  bsdtar_cmd.AddParameter("-v");
  bsdtar_cmd.AddParameter("-C");
  bsdtar_cmd.AddParameter(target_directory);
  bsdtar_cmd.AddParameter("-f");
  bsdtar_cmd.AddParameter(file_);
  // Keeps holes in sparse entries.
  bsdtar_cmd.AddParameter("-S");
  // Preserves permissions and ownership recorded in the archive.
  bsdtar_cmd.AddParameter("-p");
  MG_EXPECTF(RunAndLogOutput(std::move(bsdtar_cmd)),
             "bsdtar extraction of \"{}\" into \"{}\" failed", file_,
             target_directory);
  return {};
}

}  // namespace microguest
