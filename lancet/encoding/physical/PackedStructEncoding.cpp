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

#include "lancet/encoding/physical/PackedStructEncoding.h"

#include <cstring>
#include <numeric>

#include <fmt/ranges.h>

#include "lancet/common/base/Exceptions.h"
#include "lancet/encoding/physical/ValueEncoding.h"

namespace facebook::lancet::encoding {

PackedStructPageScheduler::PackedStructPageScheduler(
    std::vector<PageSchedulerPtr> fields,
    std::vector<uint32_t> fieldByteWidths,
    uint64_t bufferOffset)
    : fields_(std::move(fields)),
      fieldByteWidths_(std::move(fieldByteWidths)),
      bufferOffset_(bufferOffset),
      bytesPerRow_(std::accumulate(
          fieldByteWidths_.begin(),
          fieldByteWidths_.end(),
          uint64_t{0})) {
  LANCET_CHECK_EQ(fields_.size(), fieldByteWidths_.size());
  LANCET_USER_CHECK_GT(bytesPerRow_, 0, "Packed struct rows cannot be empty");
}

folly::SemiFuture<PageDecoderPtr> PackedStructPageScheduler::scheduleRanges(
    const std::vector<RowRange>& ranges,
    const std::shared_ptr<EncodingsIo>& io,
    uint64_t topLevelRow) const {
  std::vector<common::Region> byteRanges;
  byteRanges.reserve(ranges.size());
  for (const auto& range : ranges) {
    byteRanges.emplace_back(
        bufferOffset_ + range.begin * bytesPerRow_,
        range.size() * bytesPerRow_);
  }
  return io->submitRequest(std::move(byteRanges), topLevelRow)
      .deferValue([fieldByteWidths = fieldByteWidths_,
                   bytesPerRow = bytesPerRow_](
                      std::vector<BufferPtr> chunks) mutable -> PageDecoderPtr {
        return std::make_unique<PackedStructPageDecoder>(
            std::move(fieldByteWidths), bytesPerRow, std::move(chunks));
      });
}

std::string PackedStructPageScheduler::toString() const {
  std::vector<std::string> fields;
  fields.reserve(fields_.size());
  for (const auto& field : fields_) {
    fields.push_back(field->toString());
  }
  return fmt::format(
      "PackedStructPageScheduler{{bytesPerRow: {}, bufferOffset: {}, fields: [{}]}}",
      bytesPerRow_,
      bufferOffset_,
      fmt::join(fields, ", "));
}

DataBlockPtr PackedStructPageDecoder::decode(
    uint64_t rowsToSkip,
    uint64_t numRows) const {
  auto rows =
      readBytes(chunks_, rowsToSkip * bytesPerRow_, numRows * bytesPerRow_);
  std::vector<DataBlockPtr> children;
  children.reserve(fieldByteWidths_.size());
  uint64_t fieldOffset = 0;
  for (auto width : fieldByteWidths_) {
    auto values = allocateBuffer(numRows * width);
    for (uint64_t row = 0; row < numRows; ++row) {
      std::memcpy(
          values->mutable_data() + row * width,
          rows->data() + row * bytesPerRow_ + fieldOffset,
          width);
    }
    children.push_back(std::make_unique<FixedWidthDataBlock>(
        std::move(values), width * 8ULL, numRows));
    fieldOffset += width;
  }
  return std::make_unique<StructDataBlock>(std::move(children), numRows);
}

} // namespace facebook::lancet::encoding
