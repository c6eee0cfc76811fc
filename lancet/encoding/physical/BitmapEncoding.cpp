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

#include "lancet/encoding/physical/BitmapEncoding.h"

#include "lancet/common/base/BitUtil.h"
#include "lancet/common/base/Exceptions.h"

namespace facebook::lancet::encoding {

folly::SemiFuture<PageDecoderPtr> DenseBitmapScheduler::scheduleRanges(
    const std::vector<RowRange>& ranges,
    const std::shared_ptr<EncodingsIo>& io,
    uint64_t topLevelRow) const {
  std::vector<common::Region> byteRanges;
  std::vector<BitmapChunk> chunks;
  byteRanges.reserve(ranges.size());
  chunks.reserve(ranges.size());
  for (const auto& range : ranges) {
    const auto startByte = range.begin / 8;
    const auto endByte = bits::nbytes(range.end);
    byteRanges.emplace_back(bufferOffset_ + startByte, endByte - startByte);
    chunks.push_back(BitmapChunk{nullptr, range.begin % 8, range.size()});
  }
  return io->submitRequest(std::move(byteRanges), topLevelRow)
      .deferValue([chunks = std::move(chunks)](
                      std::vector<BufferPtr> buffers) mutable -> PageDecoderPtr {
        LANCET_CHECK_EQ(buffers.size(), chunks.size());
        for (size_t i = 0; i < chunks.size(); ++i) {
          chunks[i].data = std::move(buffers[i]);
        }
        return std::make_unique<DenseBitmapDecoder>(std::move(chunks));
      });
}

std::string DenseBitmapScheduler::toString() const {
  return fmt::format("DenseBitmapScheduler{{bufferOffset: {}}}", bufferOffset_);
}

DataBlockPtr DenseBitmapDecoder::decode(uint64_t rowsToSkip, uint64_t numRows)
    const {
  auto result = allocateBuffer(bits::nbytes(numRows));
  uint64_t written = 0;
  for (const auto& chunk : chunks_) {
    if (written == numRows) {
      break;
    }
    if (rowsToSkip >= chunk.numBits) {
      rowsToSkip -= chunk.numBits;
      continue;
    }
    const auto toCopy = std::min(chunk.numBits - rowsToSkip, numRows - written);
    if (bits::nbytes(chunk.bitOffset + rowsToSkip + toCopy) >
        static_cast<uint64_t>(chunk.data->size())) {
      LANCET_CORRUPT_DATA(
          "Bitmap chunk of {} bytes is too short for {} bits",
          chunk.data->size(),
          chunk.bitOffset + rowsToSkip + toCopy);
    }
    bits::copyBits(
        chunk.data->data(),
        chunk.bitOffset + rowsToSkip,
        result->mutable_data(),
        written,
        toCopy);
    written += toCopy;
    rowsToSkip = 0;
  }
  LANCET_CHECK_EQ(written, numRows, "Read past the scheduled bitmap ranges");
  return std::make_unique<FixedWidthDataBlock>(std::move(result), 1, numRows);
}

} // namespace facebook::lancet::encoding
