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

#include <iostream>
#include <string>

#include <android-base/logging.h>
#include <gflags/gflags.h>

#include "common/libs/constants/guest_layout.h"
#include "common/libs/utils/result.h"
#include "common/libs/utils/tee_logging.h"
#include "host/libs/image/build_error.h"
#include "host/libs/image/dependency_drive.h"

DEFINE_string(requirements, "", "pip requirements file");
DEFINE_string(cache_dir, "", "Directory holding the built drives");
DEFINE_string(pip, "/usr/bin/pip3", "pip binary");
DEFINE_string(mkfs_ext4, "/sbin/mkfs.ext4", "mkfs.ext4 binary");
DEFINE_uint64(size_bytes, microguest::kDefaultDependencyDriveBytes,
              "Size of the drive in bytes");
DEFINE_string(verbosity, "INFO", "Console log level");

namespace microguest {
namespace {

Result<void> BuildDependencyDriveMain(int argc, char** argv) {
  ::android::base::InitLogging(argv, android::base::StderrLogger);
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  MG_EXPECT(SetupLogging(FLAGS_verbosity, {}));

  MG_EXPECT(!FLAGS_requirements.empty(), "--requirements is required");
  MG_EXPECT(!FLAGS_cache_dir.empty(), "--cache_dir is required");

  DependencyDriveOptions options;
  options.requirements = FLAGS_requirements;
  options.cache_directory = FLAGS_cache_dir;
  options.pip = FLAGS_pip;
  options.mkfs_ext4 = FLAGS_mkfs_ext4;
  options.size_bytes = FLAGS_size_bytes;

  auto drive = MG_EXPECT(BuildDependencyDrive(options));
  // The path is the tool's output; an empty line means no drive is needed.
  std::cout << drive.value_or("") << std::endl;
  return {};
}

}  // namespace
}  // namespace microguest

int main(int argc, char** argv) {
  auto result = microguest::BuildDependencyDriveMain(argc, argv);
  if (result.ok()) {
    return 0;
  }
  LOG(ERROR) << result.error().Message();
  LOG(DEBUG) << result.error().Trace();
  return microguest::BuildErrorExitCode(result.error());
}
