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

#include <functional>
#include <ostream>
#include <string>
#include <vector>

#include "common/libs/utils/result.h"
#include "guest/libs/init/guest_kernel.h"

namespace microguest {

enum class BootState {
  kStart,
  kProcMounted,
  kSysMounted,
  kPayloadRunning,
};

std::string BootStateName(BootState state);
std::ostream& operator<<(std::ostream& out, BootState state);

// Called once for every state the sequence enters, kStart included.
using BootObserver = std::function<void(BootState)>;

// Command line and environment the payload is started with.
std::vector<std::string> PayloadCommandLine();
std::vector<std::string> PayloadEnvironment();

/**
 * The fixed boot sequence of the guest's first process:
 *
 *   kStart -> kProcMounted -> kSysMounted -> kPayloadRunning
 *
 * Every transition happens at most once and the sequence stops at the first
 * one that fails. Mount failures are reported as "MountError{kind: proc}" or
 * "MountError{kind: sys}" and a payload that can't be started as "ExecError".
 *
 * `root` is where the guest root filesystem is visible, "/" inside the guest.
 */
class BootSequence {
 public:
  BootSequence(GuestKernel& kernel, std::string root = "/",
               BootObserver observer = nullptr);

  BootState State() const { return state_; }

  // Runs the sequence. With a real kernel this only returns on failure, since
  // a successful exec replaces this process with the payload.
  Result<void> Run();

 private:
  Result<void> MountPseudoFilesystem(const std::string& kind,
                                     const std::string& filesystem_type,
                                     const std::string& mount_point);
  Result<void> ExecPayload();
  void Enter(BootState state);
  std::string HostPath(const std::string& guest_path) const;

  GuestKernel& kernel_;
  std::string root_;
  BootObserver observer_;
  BootState state_ = BootState::kStart;
  bool started_ = false;
};

}  // namespace microguest
