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

#include "lancet/encoding/BufferUtils.h"

#include <cstring>

#include <arrow/memory_pool.h>
#include <arrow/result.h>

#include "lancet/common/base/Exceptions.h"

namespace facebook::lancet::encoding {

std::shared_ptr<arrow::ResizableBuffer> allocateBuffer(uint64_t size) {
  auto result = arrow::AllocateResizableBuffer(static_cast<int64_t>(size));
  if (!result.ok()) {
    LANCET_FAIL(
        "Failed to allocate {} bytes: {}", size, result.status().ToString());
  }
  std::shared_ptr<arrow::ResizableBuffer> buffer = std::move(result).ValueUnsafe();
  if (size > 0) {
    std::memset(buffer->mutable_data(), 0, size);
  }
  return buffer;
}

BufferPtr copyBuffer(std::string_view bytes) {
  auto buffer = allocateBuffer(bytes.size());
  if (!bytes.empty()) {
    std::memcpy(buffer->mutable_data(), bytes.data(), bytes.size());
  }
  return buffer;
}

BufferPtr
sliceBuffer(const BufferPtr& buffer, uint64_t offset, uint64_t length) {
  LANCET_CHECK_LE(offset + length, static_cast<uint64_t>(buffer->size()));
  return arrow::SliceBuffer(
      buffer, static_cast<int64_t>(offset), static_cast<int64_t>(length));
}

BufferPtr concatenateBuffers(const std::vector<BufferPtr>& buffers) {
  if (buffers.size() == 1) {
    return buffers[0];
  }
  uint64_t totalSize = 0;
  for (const auto& buffer : buffers) {
    totalSize += buffer->size();
  }
  auto result = allocateBuffer(totalSize);
  auto* out = result->mutable_data();
  for (const auto& buffer : buffers) {
    if (buffer->size() > 0) {
      std::memcpy(out, buffer->data(), buffer->size());
      out += buffer->size();
    }
  }
  return result;
}

} // namespace facebook::lancet::encoding
