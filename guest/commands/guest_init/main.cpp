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

#include <sys/reboot.h>
#include <unistd.h>

#include <cstdlib>

#include <android-base/logging.h>

#include "common/libs/utils/result.h"
#include "guest/libs/init/boot_sequence.h"
#include "guest/libs/init/guest_kernel.h"

namespace microguest {
namespace {

// Init must never exit: the kernel panics when PID 1 dies. Power off instead
// so the VM monitor sees a clean shutdown.
[[noreturn]] void PowerOff() {
  sync();
  reboot(RB_POWER_OFF);
  PLOG(FATAL) << "reboot(RB_POWER_OFF) failed";
  abort();
}

}  // namespace
}  // namespace microguest

int main(int, char** argv) {
  android::base::InitLogging(argv, android::base::KernelLogger);

  if (getpid() != 1) {
    LOG(ERROR) << "guest_init must run as the first process, not as pid "
               << getpid();
    return 1;
  }

  microguest::LinuxGuestKernel kernel;
  microguest::BootSequence boot(kernel);
  auto result = boot.Run();
  if (result.ok()) {
    LOG(ERROR) << "The payload exec returned without an error";
  } else {
    LOG(ERROR) << "Boot failed in state " << boot.State() << ": "
               << result.error().Message();
    LOG(DEBUG) << result.error().Trace();
  }
  microguest::PowerOff();
}
