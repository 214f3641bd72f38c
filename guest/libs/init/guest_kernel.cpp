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

#include "guest/libs/init/guest_kernel.h"

#include <sys/mount.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

namespace microguest {
namespace {

std::vector<char*> ToCharPointers(const std::vector<std::string>& vect) {
  std::vector<char*> ret = {};
  for (const auto& str : vect) {
    ret.push_back(const_cast<char*>(str.c_str()));
  }
  ret.push_back(nullptr);
  return ret;
}

}  // namespace

GuestKernel::~GuestKernel() = default;

Result<void> LinuxGuestKernel::Mount(const std::string& source,
                                     const std::string& target,
                                     const std::string& filesystem_type,
                                     unsigned long flags) {
  if (TEMP_FAILURE_RETRY(mount(source.c_str(), target.c_str(),
                               filesystem_type.c_str(), flags, nullptr)) ==
      -1) {
    return MG_ERRNO("mount(\"" << source << "\", \"" << target << "\", \""
                               << filesystem_type
                               << "\") failed: " << strerror(errno));
  }
  return {};
}

Result<void> LinuxGuestKernel::Exec(const std::string& path,
                                    const std::vector<std::string>& argv,
                                    const std::vector<std::string>& env) {
  auto argv_ptrs = ToCharPointers(argv);
  auto env_ptrs = ToCharPointers(env);
  execve(path.c_str(), argv_ptrs.data(), env_ptrs.data());
  return MG_ERRNO("execve(\"" << path << "\") failed: " << strerror(errno));
}

}  // namespace microguest
