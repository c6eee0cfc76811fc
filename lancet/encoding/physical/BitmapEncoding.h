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

#include "lancet/encoding/PageScheduler.h"

namespace facebook::lancet::encoding {

/// A packed boolean bitmap (one bit per row, least significant bit first).
/// Booleans are never block compressed.
class DenseBitmapScheduler : public PageScheduler {
 public:
  explicit DenseBitmapScheduler(uint64_t bufferOffset)
      : bufferOffset_(bufferOffset) {}

  folly::SemiFuture<PageDecoderPtr> scheduleRanges(
      const std::vector<RowRange>& ranges,
      const std::shared_ptr<EncodingsIo>& io,
      uint64_t topLevelRow) const override;

  std::string toString() const override;

  uint64_t bufferOffset() const {
    return bufferOffset_;
  }

 private:
  const uint64_t bufferOffset_;
};

/// Fetched bytes of one scheduled range of bits.
struct BitmapChunk {
  BufferPtr data;
  /// Position of the first requested bit in 'data'.
  uint64_t bitOffset;
  uint64_t numBits;
};

class DenseBitmapDecoder : public PageDecoder {
 public:
  explicit DenseBitmapDecoder(std::vector<BitmapChunk> chunks)
      : chunks_(std::move(chunks)) {}

  DataBlockPtr decode(uint64_t rowsToSkip, uint64_t numRows) const override;

 private:
  const std::vector<BitmapChunk> chunks_;
};

} // namespace facebook::lancet::encoding
