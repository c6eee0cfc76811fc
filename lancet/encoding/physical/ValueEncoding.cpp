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

#include "lancet/encoding/physical/ValueEncoding.h"

#include <cstring>

#include "lancet/common/base/Exceptions.h"
#include "lancet/encoding/physical/BlockCompression.h"

namespace facebook::lancet::encoding {

ValuePageScheduler::ValuePageScheduler(
    uint64_t bytesPerValue,
    uint64_t bufferOffset,
    uint64_t bufferSize,
    common::CompressionConfig compressionConfig,
    std::shared_ptr<const common::Codec> codec,
    uint64_t maxDecompressedBytes)
    : bytesPerValue_(bytesPerValue),
      bufferOffset_(bufferOffset),
      bufferSize_(bufferSize),
      compressionConfig_(std::move(compressionConfig)),
      codec_(std::move(codec)),
      maxDecompressedBytes_(maxDecompressedBytes) {
  LANCET_CHECK_GT(bytesPerValue_, 0);
  LANCET_CHECK_NOT_NULL(codec_);
}

folly::SemiFuture<PageDecoderPtr> ValuePageScheduler::scheduleRanges(
    const std::vector<RowRange>& ranges,
    const std::shared_ptr<EncodingsIo>& io,
    uint64_t topLevelRow) const {
  std::vector<common::Region> byteRanges;
  byteRanges.reserve(ranges.size());
  for (const auto& range : ranges) {
    byteRanges.emplace_back(
        range.begin * bytesPerValue_, range.size() * bytesPerValue_);
  }

  if (!isCompressed()) {
    for (auto& byteRange : byteRanges) {
      LANCET_CHECK_LE(
          byteRange.end(),
          bufferSize_,
          "Row range exceeds the value buffer of {}",
          toString());
      byteRange.offset += bufferOffset_;
    }
    return io->submitRequest(std::move(byteRanges), topLevelRow)
        .deferValue([bytesPerValue = bytesPerValue_](
                        std::vector<BufferPtr> chunks) -> PageDecoderPtr {
          return std::make_unique<ValuePageDecoder>(
              bytesPerValue, std::move(chunks));
        });
  }

  // The row ranges address the decompressed bytes, so the whole buffer is
  // fetched and sliced after decompression.
  return io
      ->submitRequest({common::Region(bufferOffset_, bufferSize_)}, topLevelRow)
      .deferValue([bytesPerValue = bytesPerValue_,
                   codec = codec_,
                   maxDecompressedBytes = maxDecompressedBytes_,
                   byteRanges = std::move(byteRanges)](
                      std::vector<BufferPtr> buffers) -> PageDecoderPtr {
        LANCET_CHECK_EQ(buffers.size(), 1);
        auto decompressed =
            decompressBlock(*codec, *buffers[0], maxDecompressedBytes);
        std::vector<BufferPtr> chunks;
        chunks.reserve(byteRanges.size());
        for (const auto& byteRange : byteRanges) {
          if (byteRange.end() > static_cast<uint64_t>(decompressed->size())) {
            LANCET_CORRUPT_DATA(
                "Decompressed value buffer has {} bytes but rows up to byte {} were requested",
                decompressed->size(),
                byteRange.end());
          }
          chunks.push_back(
              sliceBuffer(decompressed, byteRange.offset, byteRange.length));
        }
        return std::make_unique<ValuePageDecoder>(
            bytesPerValue, std::move(chunks));
      });
}

std::string ValuePageScheduler::toString() const {
  return fmt::format(
      "ValuePageScheduler{{bytesPerValue: {}, bufferOffset: {}, bufferSize: {}, compression: {}}}",
      bytesPerValue_,
      bufferOffset_,
      bufferSize_,
      compressionConfig_.toString());
}

ValuePageDecoder::ValuePageDecoder(
    uint64_t bytesPerValue,
    std::vector<BufferPtr> chunks)
    : bytesPerValue_(bytesPerValue), chunks_(std::move(chunks)) {}

DataBlockPtr ValuePageDecoder::decode(uint64_t rowsToSkip, uint64_t numRows)
    const {
  auto data =
      readBytes(chunks_, rowsToSkip * bytesPerValue_, numRows * bytesPerValue_);
  return std::make_unique<FixedWidthDataBlock>(
      std::move(data), bytesPerValue_ * 8, numRows);
}

BufferPtr readBytes(
    const std::vector<BufferPtr>& chunks,
    uint64_t skipBytes,
    uint64_t numBytes) {
  if (numBytes == 0) {
    return allocateBuffer(0);
  }
  size_t chunkIndex = 0;
  while (chunkIndex < chunks.size() &&
         skipBytes >= static_cast<uint64_t>(chunks[chunkIndex]->size())) {
    skipBytes -= chunks[chunkIndex]->size();
    ++chunkIndex;
  }
  LANCET_CHECK_LT(chunkIndex, chunks.size(), "Read past the scheduled bytes");

  const auto& first = chunks[chunkIndex];
  if (skipBytes + numBytes <= static_cast<uint64_t>(first->size())) {
    return sliceBuffer(first, skipBytes, numBytes);
  }

  auto result = allocateBuffer(numBytes);
  auto* out = result->mutable_data();
  uint64_t remaining = numBytes;
  for (; chunkIndex < chunks.size() && remaining > 0; ++chunkIndex) {
    const auto& chunk = chunks[chunkIndex];
    const auto available = chunk->size() - skipBytes;
    const auto toCopy = std::min<uint64_t>(available, remaining);
    std::memcpy(out, chunk->data() + skipBytes, toCopy);
    out += toCopy;
    remaining -= toCopy;
    skipBytes = 0;
  }
  LANCET_CHECK_EQ(remaining, 0, "Read past the scheduled bytes");
  return result;
}

} // namespace facebook::lancet::encoding
