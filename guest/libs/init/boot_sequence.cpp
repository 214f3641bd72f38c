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

#include "guest/libs/init/boot_sequence.h"

#include <sys/mount.h>
#include <unistd.h>

#include <string>
#include <utility>
#include <vector>

#include <android-base/logging.h>

#include "common/libs/constants/guest_layout.h"
#include "common/libs/utils/files.h"

namespace microguest {

std::string BootStateName(BootState state) {
  switch (state) {
    case BootState::kStart:
      return "START";
    case BootState::kProcMounted:
      return "PROC_MOUNTED";
    case BootState::kSysMounted:
      return "SYS_MOUNTED";
    case BootState::kPayloadRunning:
      return "PAYLOAD_RUNNING";
  }
  return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& out, BootState state) {
  return out << BootStateName(state);
}

std::vector<std::string> PayloadCommandLine() {
  return {kPayloadInterpreter, kPayloadPath};
}

std::vector<std::string> PayloadEnvironment() {
  return {
      std::string("PATH=") + kGuestSearchPath,
      std::string("HOME=") + kGuestHome,
      std::string(kDataPathEnvVar) + "=" + kDataDirectory,
  };
}

BootSequence::BootSequence(GuestKernel& kernel, std::string root,
                           BootObserver observer)
    : kernel_(kernel), root_(std::move(root)), observer_(std::move(observer)) {
  while (root_.size() > 1 && root_.back() == '/') {
    root_.pop_back();
  }
}

std::string BootSequence::HostPath(const std::string& guest_path) const {
  return root_ == "/" ? guest_path : root_ + guest_path;
}

void BootSequence::Enter(BootState state) {
  state_ = state;
  LOG(INFO) << "Boot state: " << state;
  if (observer_) {
    observer_(state);
  }
}

Result<void> BootSequence::MountPseudoFilesystem(
    const std::string& kind, const std::string& filesystem_type,
    const std::string& mount_point) {
  const auto target = HostPath(mount_point);
  MG_EXPECTF(DirectoryExists(target),
             "MountError{{kind: {}}}: mount point \"{}\" is missing", kind,
             mount_point);
  MG_EXPECTF(kernel_.Mount(kind, target, filesystem_type,
                           MS_NOSUID | MS_NODEV | MS_NOEXEC),
             "MountError{{kind: {}}}: the kernel refused to mount {} at \"{}\"",
             kind, filesystem_type, mount_point);
  return {};
}

Result<void> BootSequence::ExecPayload() {
  const auto interpreter = HostPath(kPayloadInterpreter);
  const auto payload = HostPath(kPayloadPath);
  MG_EXPECTF(access(interpreter.c_str(), X_OK) == 0 &&
                 !DirectoryExists(interpreter),
             "ExecError: \"{}\" is not executable", kPayloadInterpreter);
  MG_EXPECTF(FileExists(payload) && !DirectoryExists(payload),
             "ExecError: \"{}\" is missing", kPayloadPath);
  MG_EXPECT(kernel_.Exec(interpreter, PayloadCommandLine(),
                         PayloadEnvironment()),
            "ExecError: could not start the payload");
  return {};
}

Result<void> BootSequence::Run() {
  MG_EXPECT(!started_, "The boot sequence already ran");
  started_ = true;
  Enter(BootState::kStart);

  MG_EXPECT(MountPseudoFilesystem("proc", "proc", kProcMountPoint));
  Enter(BootState::kProcMounted);

  MG_EXPECT(MountPseudoFilesystem("sys", "sysfs", kSysMountPoint));
  Enter(BootState::kSysMounted);

  MG_EXPECT(ExecPayload());
  Enter(BootState::kPayloadRunning);
  return {};
}

}  // namespace microguest
