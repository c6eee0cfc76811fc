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

#include "lancet/common/compression/Compression.h"
#include "lancet/encoding/PageScheduler.h"

namespace facebook::lancet::encoding {

/// Fixed-width values of 'bytesPerValue' bytes read from one buffer. When the
/// buffer is compressed the whole buffer is fetched and decompressed, since a
/// compressed stream cannot be range-read; otherwise only the bytes covering
/// the requested rows are fetched.
class ValuePageScheduler : public PageScheduler {
 public:
  ValuePageScheduler(
      uint64_t bytesPerValue,
      uint64_t bufferOffset,
      uint64_t bufferSize,
      common::CompressionConfig compressionConfig,
      std::shared_ptr<const common::Codec> codec,
      uint64_t maxDecompressedBytes);

  folly::SemiFuture<PageDecoderPtr> scheduleRanges(
      const std::vector<RowRange>& ranges,
      const std::shared_ptr<EncodingsIo>& io,
      uint64_t topLevelRow) const override;

  std::string toString() const override;

  uint64_t bytesPerValue() const {
    return bytesPerValue_;
  }

  uint64_t bufferOffset() const {
    return bufferOffset_;
  }

  uint64_t bufferSize() const {
    return bufferSize_;
  }

  const common::CompressionConfig& compressionConfig() const {
    return compressionConfig_;
  }

  const common::Codec& codec() const {
    return *codec_;
  }

 private:
  bool isCompressed() const {
    return compressionConfig_.kind != common::CompressionKind_NONE;
  }

  const uint64_t bytesPerValue_;
  const uint64_t bufferOffset_;
  const uint64_t bufferSize_;
  const common::CompressionConfig compressionConfig_;
  const std::shared_ptr<const common::Codec> codec_;
  const uint64_t maxDecompressedBytes_;
};

/// Decodes fixed-width values from byte chunks, one chunk per scheduled
/// range.
class ValuePageDecoder : public PageDecoder {
 public:
  ValuePageDecoder(uint64_t bytesPerValue, std::vector<BufferPtr> chunks);

  DataBlockPtr decode(uint64_t rowsToSkip, uint64_t numRows) const override;

 private:
  const uint64_t bytesPerValue_;
  const std::vector<BufferPtr> chunks_;
};

/// Returns bytes [skipBytes, skipBytes + numBytes) of the concatenation of
/// 'chunks'. Zero-copy when the bytes lie within one chunk.
BufferPtr
readBytes(const std::vector<BufferPtr>& chunks, uint64_t skipBytes, uint64_t numBytes);

} // namespace facebook::lancet::encoding
