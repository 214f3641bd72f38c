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

#include <android-base/logging.h>
#include <gflags/gflags.h>

#include "common/libs/utils/result.h"
#include "common/libs/utils/tee_logging.h"
#include "host/libs/image/build_error.h"
#include "host/libs/image/image_mount.h"
#include "host/libs/image/payload_patch.h"

DEFINE_string(image, "", "Image built by build_rootfs");
DEFINE_string(payload, "", "New payload script");
DEFINE_string(mount_point, "",
              "Temporary mount point. Defaults to <image>.mnt");
DEFINE_string(verbosity, "INFO", "Console log level");

namespace microguest {
namespace {

Result<void> PatchPayloadMain(int argc, char** argv) {
  ::android::base::InitLogging(argv, android::base::StderrLogger);
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  MG_EXPECT(SetupLogging(FLAGS_verbosity, {}));

  MG_EXPECT(!FLAGS_image.empty(), "--image is required");
  MG_EXPECT(!FLAGS_payload.empty(), "--payload is required");
  MG_EXPECT(geteuid() == 0, "patch_payload mounts the image; run it as root");
  const auto mount_point =
      FLAGS_mount_point.empty() ? FLAGS_image + ".mnt" : FLAGS_mount_point;

  LoopImageMounter mounter;
  MG_EXPECT(PatchPayload(FLAGS_image, FLAGS_payload, mounter, mount_point));
  return {};
}

}  // namespace
}  // namespace microguest

int main(int argc, char** argv) {
  auto result = microguest::PatchPayloadMain(argc, argv);
  if (result.ok()) {
    return 0;
  }
  LOG(ERROR) << result.error().Message();
  LOG(DEBUG) << result.error().Trace();
  return microguest::BuildErrorExitCode(result.error());
}
