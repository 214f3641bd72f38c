//
// Copyright (C) 2022 The Android Open Source Project
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

#include "common/libs/utils/json.h"

#include <errno.h>
#include <string.h>

#include <memory>
#include <string>
#include <string_view>

#include <android-base/file.h>

namespace microguest {

Result<Json::Value> ParseJson(std::string_view input) {
  Json::Value root;
  JSONCPP_STRING err;
  Json::CharReaderBuilder builder;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  auto begin = input.data();
  auto end = begin + input.length();
  MG_EXPECT(reader->parse(begin, end, &root, &err), err);
  return root;
}

Result<Json::Value> LoadFromFile(const std::string& path_to_file) {
  std::string contents;
  MG_EXPECTF(android::base::ReadFileToString(path_to_file, &contents),
             "Could not read \"{}\": {}", path_to_file, strerror(errno));
  return MG_EXPECTF(ParseJson(contents), "Could not parse \"{}\" as JSON",
                    path_to_file);
}

std::string SerializeJson(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  return Json::writeString(builder, value) + "\n";
}

}  // namespace microguest
