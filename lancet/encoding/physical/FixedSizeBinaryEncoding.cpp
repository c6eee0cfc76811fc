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

#include "lancet/encoding/physical/FixedSizeBinaryEncoding.h"

#include <limits>

#include "lancet/common/base/Exceptions.h"

namespace facebook::lancet::encoding {

FixedSizeBinaryPageScheduler::FixedSizeBinaryPageScheduler(
    PageSchedulerPtr bytes,
    uint32_t byteWidth,
    uint32_t bytesPerOffset)
    : bytes_(std::move(bytes)),
      byteWidth_(byteWidth),
      bytesPerOffset_(bytesPerOffset) {
  LANCET_CHECK_NOT_NULL(bytes_);
  LANCET_USER_CHECK_GT(byteWidth_, 0, "Fixed size binary byte width");
  LANCET_CHECK(bytesPerOffset_ == 4 || bytesPerOffset_ == 8);
}

folly::SemiFuture<PageDecoderPtr> FixedSizeBinaryPageScheduler::scheduleRanges(
    const std::vector<RowRange>& ranges,
    const std::shared_ptr<EncodingsIo>& io,
    uint64_t topLevelRow) const {
  return bytes_->scheduleRanges(ranges, io, topLevelRow)
      .deferValue([byteWidth = byteWidth_, bytesPerOffset = bytesPerOffset_](
                      PageDecoderPtr bytes) -> PageDecoderPtr {
        return std::make_unique<FixedSizeBinaryDecoder>(
            std::move(bytes), byteWidth, bytesPerOffset);
      });
}

std::string FixedSizeBinaryPageScheduler::toString() const {
  return fmt::format(
      "FixedSizeBinaryPageScheduler{{byteWidth: {}, bytesPerOffset: {}, bytes: {}}}",
      byteWidth_,
      bytesPerOffset_,
      bytes_->toString());
}

DataBlockPtr FixedSizeBinaryDecoder::decode(
    uint64_t rowsToSkip,
    uint64_t numRows) const {
  auto bytes = bytes_->decode(rowsToSkip, numRows);
  if (auto* nullable = bytes->as<NullableDataBlock>()) {
    auto values = toVariableWidth(
        nullable->data().asChecked<FixedWidthDataBlock>("Fixed size binary"));
    return std::make_unique<NullableDataBlock>(
        std::move(values), nullable->nulls());
  }
  return toVariableWidth(
      bytes->asChecked<FixedWidthDataBlock>("Fixed size binary"));
}

DataBlockPtr FixedSizeBinaryDecoder::toVariableWidth(
    const FixedWidthDataBlock& values) const {
  if (values.bitsPerValue() != byteWidth_ * 8ULL) {
    LANCET_CORRUPT_DATA(
        "Fixed size binary of {} bytes decoded values of {} bits",
        byteWidth_,
        values.bitsPerValue());
  }
  const auto numValues = values.numValues();
  if (bytesPerOffset_ == 4 &&
      numValues * byteWidth_ >
          static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
    LANCET_CORRUPT_DATA(
        "{} values of {} bytes do not fit 32-bit offsets",
        numValues,
        byteWidth_);
  }
  auto offsets = allocateBuffer((numValues + 1) * bytesPerOffset_);
  for (uint64_t i = 0; i <= numValues; ++i) {
    if (bytesPerOffset_ == 8) {
      reinterpret_cast<int64_t*>(offsets->mutable_data())[i] = i * byteWidth_;
    } else {
      reinterpret_cast<int32_t*>(offsets->mutable_data())[i] = i * byteWidth_;
    }
  }
  return std::make_unique<VariableWidthDataBlock>(
      std::move(offsets), values.data(), bytesPerOffset_ * 8, numValues);
}

} // namespace facebook::lancet::encoding
