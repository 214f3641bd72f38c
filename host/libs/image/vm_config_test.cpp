//
// Copyright (C) 2023 The Android Open Source Project
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

#include "host/libs/image/vm_config.h"

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/json.h"
#include "common/libs/utils/result_matchers.h"

namespace microguest {

using ::testing::HasSubstr;

TEST(VmConfigTest, BootsGuestInitFromRootDevice) {
  VmConfigOptions options;
  options.kernel_image_path = "/images/vmlinux";

  auto config = VmConfigJson(options, "/images/rootfs.ext4");

  EXPECT_EQ(config["boot-source"]["kernel_image_path"].asString(),
            "/images/vmlinux");
  EXPECT_THAT(config["boot-source"]["boot_args"].asString(),
              HasSubstr("init=/sbin/guest_init"));
  EXPECT_THAT(config["boot-source"]["boot_args"].asString(),
              HasSubstr("panic=1"));
  ASSERT_EQ(config["drives"].size(), 1u);
  EXPECT_EQ(config["drives"][0]["path_on_host"].asString(),
            "/images/rootfs.ext4");
  EXPECT_TRUE(config["drives"][0]["is_root_device"].asBool());
  EXPECT_EQ(config["machine-config"]["vcpu_count"].asUInt(), 2u);
  EXPECT_EQ(config["machine-config"]["mem_size_mib"].asUInt(), 1024u);
  EXPECT_FALSE(config["machine-config"]["smt"].asBool());
  EXPECT_FALSE(config.isMember("network-interfaces"));
}

TEST(VmConfigTest, DependencyDriveIsReadOnly) {
  VmConfigOptions options;
  options.kernel_image_path = "/images/vmlinux";
  options.dependency_drive = "/cache/abc.ext4";

  auto config = VmConfigJson(options, "/images/rootfs.ext4");

  ASSERT_EQ(config["drives"].size(), 2u);
  EXPECT_EQ(config["drives"][1]["path_on_host"].asString(), "/cache/abc.ext4");
  EXPECT_TRUE(config["drives"][1]["is_read_only"].asBool());
  EXPECT_FALSE(config["drives"][1]["is_root_device"].asBool());
}

TEST(VmConfigTest, WritesParsableFile) {
  TemporaryDir dir;
  VmConfigOptions options;
  options.output_path = std::string(dir.path) + "/vm.json";
  options.kernel_image_path = "/images/vmlinux";
  options.vcpu_count = 4;

  ASSERT_THAT(
      WriteVmConfig(options, "/images/rootfs.ext4", options.output_path),
      IsOk());

  auto loaded = LoadFromFile(options.output_path);
  ASSERT_THAT(loaded, IsOk());
  EXPECT_EQ((*loaded)["machine-config"]["vcpu_count"].asUInt(), 4u);
}

}  // namespace microguest
