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

#include <gtest/gtest.h>

#include "lancet/common/base/Exceptions.h"

#define LANCET_ASSERT_THROW_IMPL(_type, _expression, _errorMessage)        \
  try {                                                                    \
    (_expression);                                                         \
    FAIL() << "Expected an exception";                                     \
  } catch (const _type& e) {                                               \
    ASSERT_TRUE(e.message().find(_errorMessage) != std::string::npos)      \
        << "Expected error message to contain '" << (_errorMessage)        \
        << "', but received '" << e.message() << "'.";                     \
  }

#define LANCET_ASSERT_THROW(_expression, _errorMessage) \
  LANCET_ASSERT_THROW_IMPL(                             \
      facebook::lancet::LancetException, _expression, _errorMessage)

#define LANCET_ASSERT_USER_THROW(_expression, _errorMessage) \
  LANCET_ASSERT_THROW_IMPL(                                  \
      facebook::lancet::LancetUserError, _expression, _errorMessage)

#define LANCET_ASSERT_RUNTIME_THROW(_expression, _errorMessage) \
  LANCET_ASSERT_THROW_IMPL(                                     \
      facebook::lancet::LancetRuntimeError, _expression, _errorMessage)

/// Asserts that '_expression' throws a LancetException with error code
/// '_errorCode'.
#define LANCET_ASSERT_THROW_CODE(_expression, _errorCode)                 \
  try {                                                                   \
    (_expression);                                                        \
    FAIL() << "Expected an exception";                                    \
  } catch (const facebook::lancet::LancetException& e) {                  \
    ASSERT_EQ(e.errorCode(), _errorCode) << e.what();                     \
  }
