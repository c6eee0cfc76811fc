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

#include "lancet/encoding/physical/BitpackEncoding.h"

#include <cstring>

#include "lancet/common/base/BitUtil.h"
#include "lancet/common/base/Exceptions.h"

namespace facebook::lancet::encoding {

uint64_t
loadPackedBits(const uint8_t* data, uint64_t bitPosition, uint32_t bitWidth) {
  const uint8_t* byte = data + bitPosition / 8;
  const uint32_t shift = bitPosition % 8;
  // A value of up to 64 bits at a shift of up to 7 spans at most 9 bytes.
  uint64_t result = static_cast<uint64_t>(*byte) >> shift;
  uint32_t loaded = 8 - shift;
  while (loaded < bitWidth) {
    ++byte;
    result |= static_cast<uint64_t>(*byte) << loaded;
    loaded += 8;
  }
  return result & bits::lowMask(bitWidth);
}

namespace {

template <typename T>
void storeValue(uint8_t* out, uint64_t index, uint64_t value) {
  const auto narrowed = static_cast<T>(value);
  std::memcpy(out + index * sizeof(T), &narrowed, sizeof(T));
}

void storeValue(
    uint8_t* out,
    uint64_t index,
    uint64_t value,
    uint64_t uncompressedBits) {
  switch (uncompressedBits) {
    case 8:
      storeValue<uint8_t>(out, index, value);
      break;
    case 16:
      storeValue<uint16_t>(out, index, value);
      break;
    case 32:
      storeValue<uint32_t>(out, index, value);
      break;
    case 64:
      storeValue<uint64_t>(out, index, value);
      break;
    default:
      LANCET_UNREACHABLE("Invalid uncompressed width {}", uncompressedBits);
  }
}

} // namespace

BitpackedScheduler::BitpackedScheduler(
    uint64_t compressedBits,
    uint64_t uncompressedBits,
    uint64_t bufferOffset,
    bool isSigned)
    : compressedBits_(compressedBits),
      uncompressedBits_(uncompressedBits),
      bufferOffset_(bufferOffset),
      isSigned_(isSigned) {
  LANCET_USER_CHECK(
      uncompressedBits_ == 8 || uncompressedBits_ == 16 ||
          uncompressedBits_ == 32 || uncompressedBits_ == 64,
      "Bit packing cannot widen values to {} bits",
      uncompressedBits_);
  LANCET_USER_CHECK(
      compressedBits_ >= 1 && compressedBits_ <= uncompressedBits_,
      "Bit packing width {} must be between 1 and {}",
      compressedBits_,
      uncompressedBits_);
}

folly::SemiFuture<PageDecoderPtr> BitpackedScheduler::scheduleRanges(
    const std::vector<RowRange>& ranges,
    const std::shared_ptr<EncodingsIo>& io,
    uint64_t topLevelRow) const {
  std::vector<common::Region> byteRanges;
  std::vector<PackedChunk> chunks;
  byteRanges.reserve(ranges.size());
  chunks.reserve(ranges.size());
  for (const auto& range : ranges) {
    const auto startBit = range.begin * compressedBits_;
    const auto endBit = range.end * compressedBits_;
    const auto startByte = startBit / 8;
    byteRanges.emplace_back(
        bufferOffset_ + startByte, bits::nbytes(endBit) - startByte);
    chunks.push_back(PackedChunk{nullptr, startBit % 8, range.size()});
  }
  return io->submitRequest(std::move(byteRanges), topLevelRow)
      .deferValue([compressedBits = compressedBits_,
                   uncompressedBits = uncompressedBits_,
                   isSigned = isSigned_,
                   chunks = std::move(chunks)](
                      std::vector<BufferPtr> buffers) mutable -> PageDecoderPtr {
        LANCET_CHECK_EQ(buffers.size(), chunks.size());
        for (size_t i = 0; i < chunks.size(); ++i) {
          chunks[i].data = std::move(buffers[i]);
        }
        return std::make_unique<BitpackedPageDecoder>(
            compressedBits, uncompressedBits, isSigned, std::move(chunks));
      });
}

std::string BitpackedScheduler::toString() const {
  return fmt::format(
      "{}{{compressedBits: {}, uncompressedBits: {}, bufferOffset: {}, signed: {}}}",
      name(),
      compressedBits_,
      uncompressedBits_,
      bufferOffset_,
      isSigned_);
}

DataBlockPtr BitpackedPageDecoder::decode(uint64_t rowsToSkip, uint64_t numRows)
    const {
  auto result = allocateBuffer(numRows * uncompressedBits_ / 8);
  auto* out = result->mutable_data();
  const auto width = static_cast<uint32_t>(compressedBits_);
  uint64_t written = 0;
  for (const auto& chunk : chunks_) {
    if (written == numRows) {
      break;
    }
    if (rowsToSkip >= chunk.numValues) {
      rowsToSkip -= chunk.numValues;
      continue;
    }
    const auto count =
        std::min(chunk.numValues - rowsToSkip, numRows - written);
    auto bitPosition = chunk.bitOffset + rowsToSkip * compressedBits_;
    if (bits::nbytes(bitPosition + count * compressedBits_) >
        static_cast<uint64_t>(chunk.data->size())) {
      LANCET_CORRUPT_DATA(
          "Bit packed chunk of {} bytes is too short for {} values of {} bits",
          chunk.data->size(),
          count,
          compressedBits_);
    }
    for (uint64_t i = 0; i < count; ++i) {
      auto value = loadPackedBits(chunk.data->data(), bitPosition, width);
      if (isSigned_) {
        value = static_cast<uint64_t>(signExtend(value, width));
      }
      storeValue(out, written + i, value, uncompressedBits_);
      bitPosition += compressedBits_;
    }
    written += count;
    rowsToSkip = 0;
  }
  LANCET_CHECK_EQ(written, numRows, "Read past the scheduled bit packed ranges");
  return std::make_unique<FixedWidthDataBlock>(
      std::move(result), uncompressedBits_, numRows);
}

} // namespace facebook::lancet::encoding
