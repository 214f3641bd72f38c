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

#include <json/json.h>

#include "common/libs/utils/result.h"
#include "host/libs/config/build_config.h"

namespace microguest {

// Machine description for a Firecracker-style VMM booting `rootfs_image` as
// its root device with guest_init as PID 1. No network devices are declared.
Json::Value VmConfigJson(const VmConfigOptions& options,
                         const std::string& rootfs_image);

// Writes the description to `path`, which is usually a temporary name next to
// `options.output_path`.
Result<void> WriteVmConfig(const VmConfigOptions& options,
                           const std::string& rootfs_image,
                           const std::string& path);

}  // namespace microguest
