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

#include "host/libs/image/vm_config.h"

#include <errno.h>
#include <string.h>

#include <string>

#include <android-base/file.h>
#include <android-base/logging.h>

#include "common/libs/constants/guest_layout.h"
#include "common/libs/utils/json.h"

namespace microguest {

Json::Value VmConfigJson(const VmConfigOptions& options,
                         const std::string& rootfs_image) {
  Json::Value config(Json::objectValue);

  Json::Value boot_source(Json::objectValue);
  boot_source["kernel_image_path"] = options.kernel_image_path;
  boot_source["boot_args"] = kKernelBootArgs;
  config["boot-source"] = boot_source;

  Json::Value drives(Json::arrayValue);
  Json::Value rootfs(Json::objectValue);
  rootfs["drive_id"] = "rootfs";
  rootfs["path_on_host"] = rootfs_image;
  rootfs["is_root_device"] = true;
  rootfs["is_read_only"] = false;
  drives.append(rootfs);
  if (!options.dependency_drive.empty()) {
    Json::Value deps(Json::objectValue);
    deps["drive_id"] = "deps";
    deps["path_on_host"] = options.dependency_drive;
    deps["is_root_device"] = false;
    deps["is_read_only"] = true;
    drives.append(deps);
  }
  config["drives"] = drives;

  Json::Value machine(Json::objectValue);
  machine["vcpu_count"] = options.vcpu_count;
  machine["mem_size_mib"] = options.mem_size_mib;
  machine["smt"] = false;
  config["machine-config"] = machine;
  return config;
}

Result<void> WriteVmConfig(const VmConfigOptions& options,
                           const std::string& rootfs_image,
                           const std::string& path) {
  auto contents = SerializeJson(VmConfigJson(options, rootfs_image));
  MG_EXPECTF(android::base::WriteStringToFile(contents, path),
             "Could not write VM config to \"{}\": {}", path,
             strerror(errno));
  LOG(DEBUG) << "Wrote VM config " << path;
  return {};
}

}  // namespace microguest
