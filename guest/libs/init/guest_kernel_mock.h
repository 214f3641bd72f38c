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

#include <gmock/gmock.h>

#include "guest/libs/init/guest_kernel.h"

namespace microguest {

class MockGuestKernel : public GuestKernel {
 public:
  MOCK_METHOD(Result<void>, Mount,
              (const std::string&, const std::string&, const std::string&,
               unsigned long),
              (override));
  MOCK_METHOD(Result<void>, Exec,
              (const std::string&, const std::vector<std::string>&,
               const std::vector<std::string>&),
              (override));
};

}  // namespace microguest
