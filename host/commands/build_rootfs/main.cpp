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

#include <unistd.h>

#include <string>
#include <vector>

#include <android-base/logging.h>
#include <gflags/gflags.h>

#include "common/libs/constants/guest_layout.h"
#include "common/libs/utils/files.h"
#include "common/libs/utils/result.h"
#include "common/libs/utils/tee_logging.h"
#include "host/libs/config/build_config.h"
#include "host/libs/image/build_error.h"
#include "host/libs/image/disk_image.h"
#include "host/libs/image/image_builder.h"
#include "host/libs/image/image_mount.h"

DEFINE_string(config, "", "JSON file describing the image and its layers");
DEFINE_string(output, "", "Path of the image to build");
DEFINE_uint64(capacity_bytes, 0,
              "Size of the image in bytes, a multiple of 4096. 0 keeps the "
              "configured size");
DEFINE_string(guest_init, "", "Guest init binary to install at /sbin");
DEFINE_string(payload, "", "Payload script, installed last at /bin/agent.py");
DEFINE_string(data_directory, "",
              "Host directory copied to /code/historical_data");
DEFINE_string(work_directory, "",
              "Where temporary files go. Defaults to the output's directory");
DEFINE_string(mkfs_ext4, "", "mkfs.ext4 binary");
DEFINE_string(pip, "", "pip binary used for pip layers");
DEFINE_string(debootstrap, "", "debootstrap binary used for package layers");
DEFINE_string(vm_config_output, "",
              "If set, write a VM configuration for the image here");
DEFINE_string(kernel_image, "", "Kernel referenced by the VM configuration");
DEFINE_string(dependency_drive, "",
              "Read-only drive attached by the VM configuration");
DEFINE_string(verbosity, "INFO", "Console log level");
DEFINE_string(log_file, "", "Also write the full build log here");

namespace microguest {
namespace {

void Override(std::string& value, const std::string& flag) {
  if (!flag.empty()) {
    value = flag;
  }
}

Result<RootfsBuildConfig> ConfigFromFlags() {
  RootfsBuildConfig config;
  if (!FLAGS_config.empty()) {
    config = MG_EXPECT(LoadBuildConfig(FLAGS_config));
  }
  Override(config.output_path, FLAGS_output);
  if (FLAGS_capacity_bytes != 0) {
    config.capacity_bytes = FLAGS_capacity_bytes;
  }
  Override(config.guest_init_binary, FLAGS_guest_init);
  Override(config.work_directory, FLAGS_work_directory);
  Override(config.tools.mkfs_ext4, FLAGS_mkfs_ext4);
  Override(config.tools.pip, FLAGS_pip);
  Override(config.tools.debootstrap, FLAGS_debootstrap);
  Override(config.vm_config.output_path, FLAGS_vm_config_output);
  Override(config.vm_config.kernel_image_path, FLAGS_kernel_image);
  Override(config.vm_config.dependency_drive, FLAGS_dependency_drive);

  if (!FLAGS_data_directory.empty()) {
    LayerSpec data;
    data.kind = LayerKind::kDirectory;
    data.source = FLAGS_data_directory;
    data.destination = kDataDirectory;
    config.layers.push_back(data);
  }
  if (!FLAGS_payload.empty()) {
    LayerSpec payload;
    payload.kind = LayerKind::kFile;
    payload.source = FLAGS_payload;
    payload.destination = kPayloadPath;
    payload.mode = 0755;
    config.layers.push_back(payload);
  }
  return config;
}

Result<void> BuildRootfsMain(int argc, char** argv) {
  ::android::base::InitLogging(argv, android::base::StderrLogger);
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  std::vector<std::string> log_files;
  if (!FLAGS_log_file.empty()) {
    log_files.push_back(FLAGS_log_file);
  }
  MG_EXPECT(SetupLogging(FLAGS_verbosity, log_files));

  auto config = MG_EXPECT(ConfigFromFlags());
  MG_EXPECT(geteuid() == 0, "Populating the image needs a loop mount; run "
                            "build_rootfs as root");

  Ext4Formatter formatter(config.tools.mkfs_ext4, config.tools.dumpe2fs);
  LoopImageMounter mounter;
  MountingPopulator populator(mounter);
  MG_EXPECT(BuildRootfsImage(config, formatter, populator));

  LOG(INFO) << "Built " << AbsolutePath(config.output_path) << " ("
            << config.capacity_bytes << " bytes)";
  return {};
}

}  // namespace
}  // namespace microguest

int main(int argc, char** argv) {
  auto result = microguest::BuildRootfsMain(argc, argv);
  if (result.ok()) {
    return 0;
  }
  LOG(ERROR) << result.error().Message();
  LOG(DEBUG) << result.error().Trace();
  return microguest::BuildErrorExitCode(result.error());
}
