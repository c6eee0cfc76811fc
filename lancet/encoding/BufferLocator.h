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

#include <span>
#include <string_view>

#include "lancet/common/base/Exceptions.h"
#include "lancet/common/file/Region.h"
#include "lancet/encoding/proto/encodings.pb.h"

namespace facebook::lancet::encoding {

/// Positions and sizes of the buffers shared by every column of a file.
struct FileBuffers {
  std::span<const common::Region> positionsAndSizes;
};

/// Positions and sizes of the buffers shared by every page of a column.
struct ColumnBuffers {
  FileBuffers fileBuffers;
  std::span<const common::Region> positionsAndSizes;
};

/// The three buffer address tables published with a page. Buffer references
/// in an encoding descriptor index into one of them.
struct PageBuffers {
  ColumnBuffers columnBuffers;
  std::span<const common::Region> positionsAndSizes;
};

/// Translates a buffer reference into an absolute byte range of the file.
/// Throws INDEX_OUT_OF_BOUNDS when the index is outside its table.
common::Region resolveBuffer(
    const proto::Buffer& buffer,
    const PageBuffers& buffers);

/// Resolves the 'buffer' field of an encoding node and fails when the node
/// does not carry one. 'kind' names the node in error messages.
template <typename T>
common::Region resolveRequiredBuffer(
    const T& encoding,
    std::string_view kind,
    const PageBuffers& buffers) {
  LANCET_USER_CHECK(
      encoding.has_buffer(), "{} encoding is missing its buffer", kind);
  return resolveBuffer(encoding.buffer(), buffers);
}

} // namespace facebook::lancet::encoding
