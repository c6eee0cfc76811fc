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

#include "lancet/encoding/physical/BinaryEncoding.h"

#include <limits>

#include "lancet/common/base/BitUtil.h"
#include "lancet/common/base/Exceptions.h"

namespace facebook::lancet::encoding {
namespace {

// Row offsets and validity gathered from the decoded indices, together with
// the byte ranges they cover.
struct ResolvedOffsets {
  std::vector<uint64_t> ends;
  std::vector<bool> validity;
  std::vector<RowRange> byteRanges;
};

ResolvedOffsets resolveOffsets(
    const std::vector<RowRange>& ranges,
    const FixedWidthDataBlock& indices,
    uint64_t nullAdjustment) {
  ResolvedOffsets result;
  result.ends.reserve(totalRows(ranges));
  result.byteRanges.reserve(ranges.size());
  bool anyNull = false;
  std::vector<bool> validity;
  validity.reserve(totalRows(ranges));

  auto offsetAt = [&](uint64_t index, bool& valid) {
    auto offset = readUnsigned(indices, index);
    valid = true;
    if (nullAdjustment > 0 && offset >= nullAdjustment) {
      valid = false;
      offset -= nullAdjustment;
    }
    return offset;
  };

  uint64_t index = 0;
  uint64_t position = 0;
  for (const auto& range : ranges) {
    uint64_t start = 0;
    if (range.begin > 0) {
      bool ignored;
      start = offsetAt(index++, ignored);
    }
    uint64_t previous = start;
    for (uint64_t row = range.begin; row < range.end; ++row) {
      bool valid;
      const auto end = offsetAt(index++, valid);
      if (end < previous) {
        LANCET_CORRUPT_DATA(
            "Binary offsets decrease at row {}: {} after {}",
            row,
            end,
            previous);
      }
      position += end - previous;
      result.ends.push_back(position);
      validity.push_back(valid);
      anyNull |= !valid;
      previous = end;
    }
    result.byteRanges.push_back(RowRange{start, previous});
  }
  if (index != indices.numValues()) {
    LANCET_CORRUPT_DATA(
        "Expected {} binary offsets but decoded {}",
        index,
        indices.numValues());
  }
  if (anyNull) {
    result.validity = std::move(validity);
  }
  return result;
}

} // namespace

BinaryPageScheduler::BinaryPageScheduler(
    std::shared_ptr<const PageScheduler> indices,
    std::shared_ptr<const PageScheduler> bytes,
    uint32_t bitsPerOffset,
    uint64_t nullAdjustment)
    : indices_(std::move(indices)),
      bytes_(std::move(bytes)),
      bitsPerOffset_(bitsPerOffset),
      nullAdjustment_(nullAdjustment) {
  LANCET_CHECK_NOT_NULL(indices_);
  LANCET_CHECK_NOT_NULL(bytes_);
  LANCET_CHECK(bitsPerOffset_ == 32 || bitsPerOffset_ == 64);
}

std::vector<RowRange> BinaryPageScheduler::indexRanges(
    const std::vector<RowRange>& ranges) {
  std::vector<RowRange> result;
  result.reserve(ranges.size());
  for (const auto& range : ranges) {
    result.push_back(
        RowRange{range.begin > 0 ? range.begin - 1 : 0, range.end});
  }
  return result;
}

folly::SemiFuture<PageDecoderPtr> BinaryPageScheduler::scheduleRanges(
    const std::vector<RowRange>& ranges,
    const std::shared_ptr<EncodingsIo>& io,
    uint64_t topLevelRow) const {
  auto indexRanges = BinaryPageScheduler::indexRanges(ranges);
  const auto numIndices = totalRows(indexRanges);
  return indices_->scheduleRanges(indexRanges, io, topLevelRow)
      .deferValue([ranges,
                   numIndices,
                   io,
                   topLevelRow,
                   bytes = bytes_,
                   bitsPerOffset = bitsPerOffset_,
                   nullAdjustment = nullAdjustment_](PageDecoderPtr indices) {
        auto block = indices->decode(0, numIndices);
        auto resolved = resolveOffsets(
            ranges,
            block->asChecked<FixedWidthDataBlock>("Binary offsets"),
            nullAdjustment);
        return bytes->scheduleRanges(resolved.byteRanges, io, topLevelRow)
            .deferValue([ends = std::move(resolved.ends),
                         validity = std::move(resolved.validity),
                         bitsPerOffset](PageDecoderPtr bytes) mutable
                        -> PageDecoderPtr {
              return std::make_unique<BinaryPageDecoder>(
                  std::move(ends),
                  std::move(validity),
                  std::move(bytes),
                  bitsPerOffset);
            });
      });
}

std::string BinaryPageScheduler::toString() const {
  return fmt::format(
      "BinaryPageScheduler{{bitsPerOffset: {}, nullAdjustment: {}, indices: {}, bytes: {}}}",
      bitsPerOffset_,
      nullAdjustment_,
      indices_->toString(),
      bytes_->toString());
}

DataBlockPtr BinaryPageDecoder::decode(uint64_t rowsToSkip, uint64_t numRows)
    const {
  LANCET_CHECK_LE(
      rowsToSkip + numRows, ends_.size(), "Read past the scheduled rows");
  const auto bytesStart = rowsToSkip == 0 ? 0 : ends_[rowsToSkip - 1];
  const auto bytesEnd = numRows == 0 ? bytesStart : ends_[rowsToSkip + numRows - 1];
  const auto numBytes = bytesEnd - bytesStart;
  if (bitsPerOffset_ == 32 &&
      numBytes > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
    LANCET_CORRUPT_DATA(
        "{} bytes of binary data do not fit 32-bit offsets", numBytes);
  }

  auto data = bytes_->decode(bytesStart, numBytes);
  const auto& bytes = data->asChecked<FixedWidthDataBlock>("Binary bytes");
  if (bytes.bitsPerValue() != 8) {
    LANCET_CORRUPT_DATA(
        "Binary bytes must decode to bytes but have {} bits per value",
        bytes.bitsPerValue());
  }

  auto offsets = allocateBuffer((numRows + 1) * bitsPerOffset_ / 8);
  for (uint64_t i = 0; i <= numRows; ++i) {
    const auto offset = i == 0 ? 0 : ends_[rowsToSkip + i - 1] - bytesStart;
    if (bitsPerOffset_ == 64) {
      reinterpret_cast<int64_t*>(offsets->mutable_data())[i] = offset;
    } else {
      reinterpret_cast<int32_t*>(offsets->mutable_data())[i] = offset;
    }
  }
  DataBlockPtr result = std::make_unique<VariableWidthDataBlock>(
      std::move(offsets), bytes.data(), bitsPerOffset_, numRows);

  if (validity_.empty()) {
    return result;
  }
  auto nulls = allocateBuffer(bits::nbytes(numRows));
  bool anyNull = false;
  for (uint64_t i = 0; i < numRows; ++i) {
    const bool valid = validity_[rowsToSkip + i];
    bits::setBit(nulls->mutable_data(), i, valid);
    anyNull |= !valid;
  }
  if (!anyNull) {
    return result;
  }
  return std::make_unique<NullableDataBlock>(std::move(result), std::move(nulls));
}

} // namespace facebook::lancet::encoding
