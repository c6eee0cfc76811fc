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

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include <arrow/buffer.h>

namespace facebook::lancet::encoding {

/// Immutable byte buffer shared between I/O results, decoded blocks and the
/// Arrow arrays they turn into.
using BufferPtr = std::shared_ptr<arrow::Buffer>;

/// Allocates a zero-initialized buffer of 'size' bytes. Throws on allocation
/// failure.
std::shared_ptr<arrow::ResizableBuffer> allocateBuffer(uint64_t size);

/// Copies 'bytes' into a new buffer.
BufferPtr copyBuffer(std::string_view bytes);

/// Returns a zero-copy view of [offset, offset + length) of 'buffer'. The
/// range must be inside the buffer.
BufferPtr sliceBuffer(const BufferPtr& buffer, uint64_t offset, uint64_t length);

/// Concatenates 'buffers' into one buffer. Returns the single input unchanged
/// when there is exactly one.
BufferPtr concatenateBuffers(const std::vector<BufferPtr>& buffers);

template <typename T>
const T* rawValues(const arrow::Buffer& buffer) {
  return reinterpret_cast<const T*>(buffer.data());
}

} // namespace facebook::lancet::encoding
