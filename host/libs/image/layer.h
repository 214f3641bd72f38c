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

#include <memory>
#include <string>

#include "common/libs/utils/result.h"
#include "common/libs/utils/subprocess.h"
#include "host/libs/config/build_config.h"

namespace microguest {

// One materialized contribution to the staging tree.
class Layer {
 public:
  virtual ~Layer() = default;

  virtual std::string Describe() const = 0;

  // Applies the layer over the tree at `staging_root`. `scratch` is an empty
  // directory on the same filesystem that the layer may fill and leave behind.
  virtual Result<void> Apply(const std::string& staging_root,
                             const std::string& scratch) = 0;
};

// pip layers declared at "/" install into the runtime's site-packages.
Result<std::unique_ptr<Layer>> CreateLayer(
    const LayerSpec& spec, const ToolPaths& tools,
    const RuntimeLayout& runtime = RuntimeLayout());

// `pip install` of every requirement in `requirements` into `target`, as
// binary wheels built for the guest's Python.
Command PipInstallCommand(const std::string& pip,
                          const std::string& requirements,
                          const std::string& target);

}  // namespace microguest
