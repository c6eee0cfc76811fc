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

#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace facebook::lancet {

namespace error_source {
/// Errors where the root cause is the input handed to the library, e.g. a
/// corrupt encoding descriptor or a buffer index that does not exist.
inline constexpr const char* kErrorSourceUser = "USER";

/// Errors where the root cause is a defect or a failure while executing a
/// well-formed request, e.g. a failed range read or undecodable bytes.
inline constexpr const char* kErrorSourceRuntime = "RUNTIME";
} // namespace error_source

namespace error_code {
inline constexpr const char* kInvalidArgument = "INVALID_ARGUMENT";
inline constexpr const char* kInvalidState = "INVALID_STATE";
inline constexpr const char* kUnreachableCode = "UNREACHABLE_CODE";
inline constexpr const char* kNotImplemented = "NOT_IMPLEMENTED";
inline constexpr const char* kUnsupported = "UNSUPPORTED";
inline constexpr const char* kIndexOutOfBounds = "INDEX_OUT_OF_BOUNDS";
/// Bytes were fetched but could not be decoded.
inline constexpr const char* kCorruptData = "CORRUPT_DATA";
/// A byte range could not be fetched.
inline constexpr const char* kIoError = "IO_ERROR";
} // namespace error_code

class LancetException : public std::exception {
 public:
  LancetException(
      const char* file,
      size_t line,
      const char* function,
      std::string_view failingExpression,
      std::string_view message,
      std::string_view errorSource,
      std::string_view errorCode,
      bool isRetriable);

  const char* what() const noexcept override {
    return elaborateMessage_.c_str();
  }

  const std::string& message() const {
    return message_;
  }

  const std::string& errorSource() const {
    return errorSource_;
  }

  const std::string& errorCode() const {
    return errorCode_;
  }

  const std::string& failingExpression() const {
    return failingExpression_;
  }

  const char* file() const {
    return file_;
  }

  size_t line() const {
    return line_;
  }

  /// True if the failure may go away when the same request is issued again,
  /// e.g. a transient read error. Construction errors are never retriable.
  bool isRetriable() const {
    return isRetriable_;
  }

 private:
  const char* file_;
  size_t line_;
  const char* function_;
  std::string failingExpression_;
  std::string message_;
  std::string errorSource_;
  std::string errorCode_;
  bool isRetriable_;
  std::string elaborateMessage_;
};

class LancetUserError : public LancetException {
 public:
  LancetUserError(
      const char* file,
      size_t line,
      const char* function,
      std::string_view failingExpression,
      std::string_view message,
      std::string_view /* errorSource */,
      std::string_view errorCode,
      bool isRetriable)
      : LancetException(
            file,
            line,
            function,
            failingExpression,
            message,
            error_source::kErrorSourceUser,
            errorCode,
            isRetriable) {}
};

class LancetRuntimeError : public LancetException {
 public:
  LancetRuntimeError(
      const char* file,
      size_t line,
      const char* function,
      std::string_view failingExpression,
      std::string_view message,
      std::string_view /* errorSource */,
      std::string_view errorCode,
      bool isRetriable)
      : LancetException(
            file,
            line,
            function,
            failingExpression,
            message,
            error_source::kErrorSourceRuntime,
            errorCode,
            isRetriable) {}
};

namespace detail {

struct LancetCheckFailArgs {
  const char* file;
  size_t line;
  const char* function;
  const char* expression;
  const char* errorSource;
  const char* errorCode;
  bool isRetriable;
};

template <typename Exception>
[[noreturn]] void lancetCheckFailWithMessage(
    const LancetCheckFailArgs& args,
    const std::string& message) {
  throw Exception(
      args.file,
      args.line,
      args.function,
      args.expression,
      message,
      args.errorSource,
      args.errorCode,
      args.isRetriable);
}

template <typename Exception>
[[noreturn]] void lancetCheckFail(const LancetCheckFailArgs& args) {
  lancetCheckFailWithMessage<Exception>(args, "");
}

template <typename Exception, typename... Args>
[[noreturn]] void lancetCheckFail(
    const LancetCheckFailArgs& args,
    fmt::format_string<Args...> format,
    Args&&... formatArgs) {
  lancetCheckFailWithMessage<Exception>(
      args, fmt::format(format, std::forward<Args>(formatArgs)...));
}

} // namespace detail

#define _LANCET_THROW_IMPL(                                               \
    exception, exprStr, errorSource, errorCode, isRetriable, ...)         \
  do {                                                                    \
    static const ::facebook::lancet::detail::LancetCheckFailArgs          \
        lancetCheckFailArgs = {                                           \
            __FILE__,                                                     \
            __LINE__,                                                     \
            __func__,                                                     \
            exprStr,                                                      \
            errorSource,                                                  \
            errorCode,                                                    \
            isRetriable};                                                 \
    ::facebook::lancet::detail::lancetCheckFail<exception>(               \
        lancetCheckFailArgs, ##__VA_ARGS__);                              \
  } while (0)

#define _LANCET_CHECK_AND_THROW_IMPL(                                     \
    expr, exprStr, exception, errorSource, errorCode, ...)                \
  if (__builtin_expect(!(expr), 0)) {                                     \
    _LANCET_THROW_IMPL(                                                   \
        exception, exprStr, errorSource, errorCode, false, ##__VA_ARGS__); \
  }

#define LANCET_CHECK(expr, ...)                           \
  _LANCET_CHECK_AND_THROW_IMPL(                           \
      expr,                                               \
      #expr,                                              \
      ::facebook::lancet::LancetRuntimeError,             \
      ::facebook::lancet::error_source::kErrorSourceRuntime, \
      ::facebook::lancet::error_code::kInvalidState,      \
      ##__VA_ARGS__)

#define _LANCET_CHECK_OP(expr1, expr2, op, ...)                           \
  LANCET_CHECK(                                                           \
      (expr1)op(expr2),                                                   \
      "({} vs. {}) {}",                                                   \
      expr1,                                                              \
      expr2,                                                              \
      fmt::format("" __VA_ARGS__))

#define LANCET_CHECK_EQ(e1, e2, ...) _LANCET_CHECK_OP(e1, e2, ==, ##__VA_ARGS__)
#define LANCET_CHECK_NE(e1, e2, ...) _LANCET_CHECK_OP(e1, e2, !=, ##__VA_ARGS__)
#define LANCET_CHECK_LT(e1, e2, ...) _LANCET_CHECK_OP(e1, e2, <, ##__VA_ARGS__)
#define LANCET_CHECK_LE(e1, e2, ...) _LANCET_CHECK_OP(e1, e2, <=, ##__VA_ARGS__)
#define LANCET_CHECK_GT(e1, e2, ...) _LANCET_CHECK_OP(e1, e2, >, ##__VA_ARGS__)
#define LANCET_CHECK_GE(e1, e2, ...) _LANCET_CHECK_OP(e1, e2, >=, ##__VA_ARGS__)

#define LANCET_CHECK_NOT_NULL(e, ...) LANCET_CHECK((e) != nullptr, ##__VA_ARGS__)

#define LANCET_USER_CHECK(expr, ...)                   \
  _LANCET_CHECK_AND_THROW_IMPL(                        \
      expr,                                            \
      #expr,                                           \
      ::facebook::lancet::LancetUserError,             \
      ::facebook::lancet::error_source::kErrorSourceUser, \
      ::facebook::lancet::error_code::kInvalidArgument, \
      ##__VA_ARGS__)

#define _LANCET_USER_CHECK_OP(expr1, expr2, op, ...)                      \
  LANCET_USER_CHECK(                                                      \
      (expr1)op(expr2),                                                   \
      "({} vs. {}) {}",                                                   \
      expr1,                                                              \
      expr2,                                                              \
      fmt::format("" __VA_ARGS__))

#define LANCET_USER_CHECK_EQ(e1, e2, ...) \
  _LANCET_USER_CHECK_OP(e1, e2, ==, ##__VA_ARGS__)
#define LANCET_USER_CHECK_LT(e1, e2, ...) \
  _LANCET_USER_CHECK_OP(e1, e2, <, ##__VA_ARGS__)
#define LANCET_USER_CHECK_LE(e1, e2, ...) \
  _LANCET_USER_CHECK_OP(e1, e2, <=, ##__VA_ARGS__)
#define LANCET_USER_CHECK_GT(e1, e2, ...) \
  _LANCET_USER_CHECK_OP(e1, e2, >, ##__VA_ARGS__)
#define LANCET_USER_CHECK_GE(e1, e2, ...) \
  _LANCET_USER_CHECK_OP(e1, e2, >=, ##__VA_ARGS__)

/// Fails construction when a buffer or child index is out of range.
#define LANCET_CHECK_INDEX(index, size, ...)                 \
  _LANCET_CHECK_AND_THROW_IMPL(                              \
      (index) < (size),                                      \
      #index " < " #size,                                    \
      ::facebook::lancet::LancetUserError,                   \
      ::facebook::lancet::error_source::kErrorSourceUser,    \
      ::facebook::lancet::error_code::kIndexOutOfBounds,     \
      ##__VA_ARGS__)

#define LANCET_FAIL(...)                                    \
  _LANCET_THROW_IMPL(                                       \
      ::facebook::lancet::LancetRuntimeError,               \
      "",                                                   \
      ::facebook::lancet::error_source::kErrorSourceRuntime, \
      ::facebook::lancet::error_code::kInvalidState,        \
      false,                                                \
      ##__VA_ARGS__)

#define LANCET_USER_FAIL(...)                             \
  _LANCET_THROW_IMPL(                                     \
      ::facebook::lancet::LancetUserError,                \
      "",                                                 \
      ::facebook::lancet::error_source::kErrorSourceUser, \
      ::facebook::lancet::error_code::kInvalidArgument,   \
      false,                                              \
      ##__VA_ARGS__)

#define LANCET_UNSUPPORTED(...)                           \
  _LANCET_THROW_IMPL(                                     \
      ::facebook::lancet::LancetUserError,                \
      "",                                                 \
      ::facebook::lancet::error_source::kErrorSourceUser, \
      ::facebook::lancet::error_code::kUnsupported,       \
      false,                                              \
      ##__VA_ARGS__)

#define LANCET_UNREACHABLE(...)                             \
  _LANCET_THROW_IMPL(                                       \
      ::facebook::lancet::LancetRuntimeError,               \
      "",                                                   \
      ::facebook::lancet::error_source::kErrorSourceRuntime, \
      ::facebook::lancet::error_code::kUnreachableCode,     \
      false,                                                \
      ##__VA_ARGS__)

#define LANCET_NYI(...)                                     \
  _LANCET_THROW_IMPL(                                       \
      ::facebook::lancet::LancetRuntimeError,               \
      "",                                                   \
      ::facebook::lancet::error_source::kErrorSourceRuntime, \
      ::facebook::lancet::error_code::kNotImplemented,      \
      false,                                                \
      ##__VA_ARGS__)

/// Bytes that were fetched successfully but cannot be decoded. Retriable
/// because the fetch itself may have returned a torn or partial range.
#define LANCET_CORRUPT_DATA(...)                            \
  _LANCET_THROW_IMPL(                                       \
      ::facebook::lancet::LancetRuntimeError,               \
      "",                                                   \
      ::facebook::lancet::error_source::kErrorSourceRuntime, \
      ::facebook::lancet::error_code::kCorruptData,         \
      true,                                                 \
      ##__VA_ARGS__)

#define LANCET_IO_ERROR(...)                                \
  _LANCET_THROW_IMPL(                                       \
      ::facebook::lancet::LancetRuntimeError,               \
      "",                                                   \
      ::facebook::lancet::error_source::kErrorSourceRuntime, \
      ::facebook::lancet::error_code::kIoError,             \
      true,                                                 \
      ##__VA_ARGS__)

} // namespace facebook::lancet
