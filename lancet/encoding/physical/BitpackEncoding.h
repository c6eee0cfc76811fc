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

/// Reads 'bitWidth' bits (1 to 64) starting at bit 'bitPosition' of 'data',
/// least significant bit first. Touches only the bytes covering those bits.
uint64_t loadPackedBits(
    const uint8_t* data,
    uint64_t bitPosition,
    uint32_t bitWidth);

/// Sign-extends the low 'bitWidth' bits of 'value'.
inline int64_t signExtend(uint64_t value, uint32_t bitWidth) {
  if (bitWidth >= 64) {
    return static_cast<int64_t>(value);
  }
  const auto shift = 64 - bitWidth;
  return static_cast<int64_t>(value << shift) >> shift;
}

/// Integers stored with 'compressedBits' bits each, packed back to back with
/// no padding between values, and widened to 'uncompressedBits' on decode.
class BitpackedScheduler : public PageScheduler {
 public:
  BitpackedScheduler(
      uint64_t compressedBits,
      uint64_t uncompressedBits,
      uint64_t bufferOffset,
      bool isSigned);

  folly::SemiFuture<PageDecoderPtr> scheduleRanges(
      const std::vector<RowRange>& ranges,
      const std::shared_ptr<EncodingsIo>& io,
      uint64_t topLevelRow) const override;

  std::string toString() const override;

  uint64_t compressedBits() const {
    return compressedBits_;
  }

  uint64_t uncompressedBits() const {
    return uncompressedBits_;
  }

  uint64_t bufferOffset() const {
    return bufferOffset_;
  }

  bool isSigned() const {
    return isSigned_;
  }

 protected:
  virtual std::string_view name() const {
    return "BitpackedScheduler";
  }

 private:
  const uint64_t compressedBits_;
  const uint64_t uncompressedBits_;
  const uint64_t bufferOffset_;
  const bool isSigned_;
};

/// Bit packing for columns known to hold no negative values. Values are
/// laid out as for BitpackedScheduler and never sign-extended.
class BitpackedForNonNegScheduler : public BitpackedScheduler {
 public:
  BitpackedForNonNegScheduler(
      uint64_t compressedBits,
      uint64_t uncompressedBits,
      uint64_t bufferOffset)
      : BitpackedScheduler(
            compressedBits,
            uncompressedBits,
            bufferOffset,
            false) {}

 protected:
  std::string_view name() const override {
    return "BitpackedForNonNegScheduler";
  }
};

struct PackedChunk {
  BufferPtr data;
  /// Position of the first value's first bit in 'data'.
  uint64_t bitOffset;
  uint64_t numValues;
};

class BitpackedPageDecoder : public PageDecoder {
 public:
  BitpackedPageDecoder(
      uint64_t compressedBits,
      uint64_t uncompressedBits,
      bool isSigned,
      std::vector<PackedChunk> chunks)
      : compressedBits_(compressedBits),
        uncompressedBits_(uncompressedBits),
        isSigned_(isSigned),
        chunks_(std::move(chunks)) {}

  DataBlockPtr decode(uint64_t rowsToSkip, uint64_t numRows) const override;

 private:
  const uint64_t compressedBits_;
  const uint64_t uncompressedBits_;
  const bool isSigned_;
  const std::vector<PackedChunk> chunks_;
};

} // namespace facebook::lancet::encoding
