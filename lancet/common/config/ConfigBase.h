/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include "lancet/common/config/IConfig.h"

namespace facebook::lancet::config {

/// Immutable in-memory IConfig backed by a string map.
class ConfigBase : public IConfig {
 public:
  explicit ConfigBase(std::unordered_map<std::string, std::string>&& configs)
      : configs_(std::move(configs)) {}

  std::unordered_map<std::string, std::string> rawConfigsCopy() const override {
    return configs_;
  }

 private:
  std::optional<std::string> find(const std::string& key) const override {
    auto it = configs_.find(key);
    if (it == configs_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  const std::unordered_map<std::string, std::string> configs_;
};

} // namespace facebook::lancet::config
