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

#include <string>
#include <vector>

#include "common/libs/utils/result.h"

namespace microguest {

// The two kernel services init needs.
class GuestKernel {
 public:
  virtual ~GuestKernel();

  virtual Result<void> Mount(const std::string& source,
                             const std::string& target,
                             const std::string& filesystem_type,
                             unsigned long flags) = 0;

  // Replaces the calling process image. A successful exec does not return.
  virtual Result<void> Exec(const std::string& path,
                            const std::vector<std::string>& argv,
                            const std::vector<std::string>& env) = 0;
};

class LinuxGuestKernel : public GuestKernel {
 public:
  Result<void> Mount(const std::string& source, const std::string& target,
                     const std::string& filesystem_type,
                     unsigned long flags) override;
  Result<void> Exec(const std::string& path,
                    const std::vector<std::string>& argv,
                    const std::vector<std::string>& env) override;
};

}  // namespace microguest
