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

#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <folly/Expected.h>

namespace facebook::lancet {

enum class StatusCode : int8_t {
  kOK = 0,
  kInvalid = 1,
  kIOError = 2,
  kNotImplemented = 3,
};

std::string_view toString(StatusCode code);

/// Lightweight success-or-error result used by the codec primitives, which
/// sit below the exception-based decoding layer. OK statuses carry no
/// allocation.
class [[nodiscard]] Status {
 public:
  Status() noexcept = default;

  Status(StatusCode code, std::string message);

  Status(const Status& other)
      : state_(other.state_ ? std::make_unique<State>(*other.state_) : nullptr) {
  }

  Status& operator=(const Status& other) {
    state_ = other.state_ ? std::make_unique<State>(*other.state_) : nullptr;
    return *this;
  }

  Status(Status&&) noexcept = default;
  Status& operator=(Status&&) noexcept = default;

  static Status OK() {
    return Status();
  }

  template <typename... Args>
  static Status Invalid(fmt::format_string<Args...> format, Args&&... args) {
    return Status(
        StatusCode::kInvalid, fmt::format(format, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static Status IOError(fmt::format_string<Args...> format, Args&&... args) {
    return Status(
        StatusCode::kIOError, fmt::format(format, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static Status NotImplemented(
      fmt::format_string<Args...> format,
      Args&&... args) {
    return Status(
        StatusCode::kNotImplemented,
        fmt::format(format, std::forward<Args>(args)...));
  }

  bool ok() const {
    return state_ == nullptr;
  }

  bool isInvalid() const {
    return code() == StatusCode::kInvalid;
  }

  bool isIOError() const {
    return code() == StatusCode::kIOError;
  }

  StatusCode code() const {
    return ok() ? StatusCode::kOK : state_->code;
  }

  const std::string& message() const;

  std::string toString() const;

 private:
  struct State {
    StatusCode code;
    std::string message;
  };

  std::unique_ptr<State> state_;
};

template <typename T>
using Expected = folly::Expected<T, Status>;

#define LANCET_RETURN_IF(expr, s) \
  do {                            \
    if (expr) {                   \
      return (s);                 \
    }                             \
  } while (false)

#define LANCET_RETURN_UNEXPECTED_IF(expr, s) \
  do {                                       \
    if (expr) {                              \
      return folly::makeUnexpected(s);       \
    }                                        \
  } while (false)

#define LANCET_RETURN_UNEXPECTED(expected)                  \
  do {                                                      \
    if (!(expected).hasValue()) {                           \
      return folly::makeUnexpected((expected).error());     \
    }                                                       \
  } while (false)

} // namespace facebook::lancet

template <>
struct fmt::formatter<facebook::lancet::Status> : fmt::formatter<std::string> {
  auto format(const facebook::lancet::Status& status, format_context& ctx)
      const {
    return formatter<std::string>::format(status.toString(), ctx);
  }
};
