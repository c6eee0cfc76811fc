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

#include <optional>
#include <string>
#include <unordered_map>

#include <folly/Conv.h>

#include "lancet/common/base/Exceptions.h"

namespace facebook::lancet::config {

/// Read-only view of the string settings a reader is opened with. Values
/// are converted with folly::to on lookup.
class IConfig {
 public:
  virtual ~IConfig() = default;

  /// Returns the value of 'key' converted to T, or 'defaultValue' when the
  /// key is absent. A value that does not convert is a user error naming
  /// the key.
  template <typename T>
  T get(const std::string& key, const T& defaultValue) const {
    const auto value = find(key);
    if (!value.has_value()) {
      return defaultValue;
    }
    auto converted = folly::tryTo<T>(value.value());
    LANCET_USER_CHECK(
        converted.hasValue(),
        "Invalid value '{}' for config '{}': {}",
        value.value(),
        key,
        folly::makeConversionError(converted.error(), value.value()).what());
    return converted.value();
  }

  virtual std::unordered_map<std::string, std::string> rawConfigsCopy()
      const = 0;

 private:
  virtual std::optional<std::string> find(const std::string& key) const = 0;
};

} // namespace facebook::lancet::config
