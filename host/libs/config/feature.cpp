/*
 * Copyright (C) 2021 The Android Open Source Project
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

#include "host/libs/config/feature.h"

#include <unordered_set>
#include <vector>

#include "common/libs/utils/result.h"

namespace microguest {

SetupFeature::~SetupFeature() {}

/* static */ Result<void> SetupFeature::RunSetup(
    const std::vector<SetupFeature*>& features) {
  std::unordered_set<SetupFeature*> enabled;
  for (const auto& feature : features) {
    MG_EXPECT(feature != nullptr, "Received null feature");
    if (feature->Enabled()) {
      enabled.insert(feature);
    }
  }
  // Collect these in a vector first to trigger any obvious dependency issues.
  std::vector<SetupFeature*> ordered_features;
  auto add_feature =
      [&ordered_features](SetupFeature* feature) -> Result<void> {
    ordered_features.push_back(feature);
    return {};
  };
  MG_EXPECT(Feature<SetupFeature>::TopologicalVisit(enabled, add_feature),
            "Dependency issue detected, not performing any setup.");
  for (auto& feature : ordered_features) {
    LOG(DEBUG) << "Running setup for " << feature->Name();
    MG_EXPECT(feature->ResultSetup(), "Setup failed for " << feature->Name());
  }
  return {};
}

}  // namespace microguest
