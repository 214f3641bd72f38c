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

#include "common/libs/utils/result.h"
#include "host/libs/image/image_mount.h"

namespace microguest {

/**
 * Replaces the payload inside an already built image. The image is mounted at
 * `mount_point`, which must not exist yet, and the new payload is written next
 * to the old one and renamed over it, so the guest sees either the old or the
 * new file. The image is unmounted and `mount_point` removed on every path.
 */
Result<void> PatchPayload(const std::string& image, const std::string& payload,
                          ImageMounter& mounter,
                          const std::string& mount_point);

}  // namespace microguest
