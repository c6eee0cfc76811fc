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

#include "lancet/common/base/Exceptions.h"

namespace facebook::lancet {

LancetException::LancetException(
    const char* file,
    size_t line,
    const char* function,
    std::string_view failingExpression,
    std::string_view message,
    std::string_view errorSource,
    std::string_view errorCode,
    bool isRetriable)
    : file_(file),
      line_(line),
      function_(function),
      failingExpression_(failingExpression),
      message_(message),
      errorSource_(errorSource),
      errorCode_(errorCode),
      isRetriable_(isRetriable) {
  elaborateMessage_ = fmt::format(
      "Exception: {}\nError Source: {}\nError Code: {}\n",
      isRetriable_ ? "retriable" : "non-retriable",
      errorSource_,
      errorCode_);
  if (!message_.empty()) {
    elaborateMessage_ += fmt::format("Reason: {}\n", message_);
  }
  if (!failingExpression_.empty()) {
    elaborateMessage_ += fmt::format("Expression: {}\n", failingExpression_);
  }
  elaborateMessage_ +=
      fmt::format("Function: {}\nFile: {}\nLine: {}\n", function_, file_, line_);
}

} // namespace facebook::lancet
