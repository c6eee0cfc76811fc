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

#include "lancet/encoding/BufferLocator.h"

#include "lancet/common/base/Exceptions.h"

namespace facebook::lancet::encoding {
namespace {
common::Region lookup(
    std::span<const common::Region> table,
    uint32_t index,
    std::string_view scope) {
  LANCET_CHECK_INDEX(
      index,
      table.size(),
      "{} buffer index {} is out of bounds, the table has {} entries",
      scope,
      index,
      table.size());
  return table[index];
}
} // namespace

common::Region resolveBuffer(
    const proto::Buffer& buffer,
    const PageBuffers& buffers) {
  const auto index = buffer.buffer_index();
  switch (buffer.buffer_type()) {
    case proto::Buffer::page:
      return lookup(buffers.positionsAndSizes, index, "Page");
    case proto::Buffer::column:
      return lookup(buffers.columnBuffers.positionsAndSizes, index, "Column");
    case proto::Buffer::file:
      return lookup(
          buffers.columnBuffers.fileBuffers.positionsAndSizes, index, "File");
    default:
      break;
  }
  LANCET_USER_FAIL(
      "Unknown buffer type {}", static_cast<int>(buffer.buffer_type()));
}

} // namespace facebook::lancet::encoding
