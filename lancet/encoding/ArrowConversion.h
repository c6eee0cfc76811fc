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

#include <arrow/array.h>
#include <arrow/type.h>

#include "lancet/encoding/DataBlock.h"
#include "lancet/encoding/DecoderOptions.h"

namespace facebook::lancet::encoding {

/// Gives a decoded block the logical type 'type'. Buffers are shared with
/// the block, not copied. Throws corrupt-data when the block's shape does
/// not fit 'type'. With 'validate' the resulting array is fully validated
/// and a failure is also reported as corrupt data.
std::shared_ptr<arrow::Array> toArrow(
    const DataBlock& block,
    const std::shared_ptr<arrow::DataType>& type,
    bool validate = false);

/// Same as above, validating when 'options' asks for it.
std::shared_ptr<arrow::Array> toArrow(
    const DataBlock& block,
    const std::shared_ptr<arrow::DataType>& type,
    const DecoderOptions& options);

} // namespace facebook::lancet::encoding
