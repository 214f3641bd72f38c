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
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <android-base/logging.h>
#include <fruit/fruit.h>

#include "common/libs/utils/result.h"

namespace microguest {

template <typename Subclass>
class Feature {
 public:
  virtual ~Feature() = default;

  virtual std::string Name() const = 0;

  static Result<void> TopologicalVisit(
      const std::unordered_set<Subclass*>& features,
      const std::function<Result<void>(Subclass*)>& callback);

 private:
  virtual std::unordered_set<Subclass*> Dependencies() const = 0;
};

/**
 * One step of a larger operation. Steps declare the steps they depend on and
 * RunSetup executes every enabled step once, after all of its dependencies.
 * The first failing step aborts the run.
 */
class SetupFeature : public virtual Feature<SetupFeature> {
 public:
  virtual ~SetupFeature();

  static Result<void> RunSetup(const std::vector<SetupFeature*>& features);

  virtual bool Enabled() const = 0;

 private:
  virtual Result<void> ResultSetup() = 0;
};

template <typename T>
class ReturningSetupFeature : public SetupFeature {
 public:
  ReturningSetupFeature() {
    if constexpr (std::is_void_v<T>) {
      calculated_ = false;
    } else {
      calculated_ = {};
    }
  }
  template <typename S = T>
  std::enable_if_t<!std::is_void_v<S>, S&> operator*() {
    CHECK(calculated_.has_value()) << "precondition violation";
    return *calculated_;
  }
  template <typename S = T>
  std::enable_if_t<!std::is_void_v<S>, const S&> operator*() const {
    CHECK(calculated_.has_value()) << "precondition violation";
    return *calculated_;
  }
  template <typename S = T>
  std::enable_if_t<!std::is_void_v<S>, S*> operator->() {
    CHECK(calculated_.has_value()) << "precondition violation";
    return &*calculated_;
  }
  template <typename S = T>
  std::enable_if_t<!std::is_void_v<S>, const S*> operator->() const {
    CHECK(calculated_.has_value()) << "precondition violation";
    return &*calculated_;
  }

 private:
  Result<void> ResultSetup() override final {
    if constexpr (std::is_void_v<T>) {
      MG_EXPECT(!calculated_, "precondition violation");
      MG_EXPECT(Calculate());
      calculated_ = true;
    } else {
      MG_EXPECT(!calculated_.has_value(), "precondition violation");
      calculated_ = MG_EXPECT(Calculate());
    }
    return {};
  }

  virtual Result<T> Calculate() = 0;

  std::conditional_t<std::is_void_v<T>, bool, std::optional<T>> calculated_;
};

template <typename Subclass>
Result<void> Feature<Subclass>::TopologicalVisit(
    const std::unordered_set<Subclass*>& features,
    const std::function<Result<void>(Subclass*)>& callback) {
  enum class Status { UNVISITED, VISITING, VISITED };
  std::unordered_map<Subclass*, Status> features_status;
  for (const auto& feature : features) {
    features_status[feature] = Status::UNVISITED;
  }
  std::function<Result<void>(Subclass*)> visit;
  visit = [&callback, &features_status,
           &visit](Subclass* feature) -> Result<void> {
    MG_EXPECT(features_status.count(feature) > 0,
              "Dependency edge to "
                  << feature->Name() << " but it is not part of the feature "
                  << "graph. This feature is either disabled or not correctly "
                  << "registered.");
    if (features_status[feature] == Status::VISITED) {
      return {};
    }
    MG_EXPECT(features_status[feature] != Status::VISITING,
              "Cycle detected while visiting " << feature->Name());
    features_status[feature] = Status::VISITING;
    for (const auto& dependency : feature->Dependencies()) {
      MG_EXPECT(dependency != nullptr,
                "SetupFeature " << feature->Name() << " has a null dependency.");
      MG_EXPECT(visit(dependency),
                "Error detected while visiting " << feature->Name());
    }
    features_status[feature] = Status::VISITED;
    MG_EXPECT(callback(feature), "Callback error on " << feature->Name());
    return {};
  };
  for (const auto& feature : features) {
    MG_EXPECT(visit(feature));  // `visit` will log the error chain.
  }
  return {};
}

}  // namespace microguest
