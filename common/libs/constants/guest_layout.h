/*
 * Copyright (C) 2019 The Android Open Source Project
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

#include <cstdint>

// Fixed locations inside the guest root filesystem. The image builder places
// files at these paths and the guest init relies on finding them there.

namespace microguest {

inline constexpr char kGuestInitPath[] = "/sbin/guest_init";
inline constexpr char kPayloadPath[] = "/bin/agent.py";
// guest_init always runs the payload through this path. When the runtime
// lives elsewhere the builder links it here.
inline constexpr char kPayloadInterpreter[] = "/usr/local/bin/python3";
// Layout of the python:3.11-slim root filesystem.
inline constexpr char kSitePackagesDirectory[] =
    "/usr/local/lib/python3.11/site-packages";
// Layout of a Debian bookworm base with the python3 package. Its sys.path
// looks for locally installed packages in dist-packages.
inline constexpr char kDebianPythonInterpreter[] = "/usr/bin/python3";
inline constexpr char kDebianSitePackagesDirectory[] =
    "/usr/local/lib/python3.11/dist-packages";

inline constexpr char kProcMountPoint[] = "/proc";
inline constexpr char kSysMountPoint[] = "/sys";

inline constexpr char kDataPathEnvVar[] = "DATA_PATH";
inline constexpr char kDataDirectory[] = "/code/historical_data";
inline constexpr char kGuestHome[] = "/root";
inline constexpr char kGuestSearchPath[] =
    "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

inline constexpr uint64_t kDefaultImageCapacityBytes = 1ULL << 30;
inline constexpr uint64_t kDefaultDependencyDriveBytes = 256ULL << 20;

inline constexpr char kKernelBootArgs[] =
    "console=ttyS0 reboot=k panic=1 pci=off init=/sbin/guest_init";

}  // namespace microguest
