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

/// Variable-width values stored as a column of end offsets (the indices)
/// plus a column of concatenated bytes. Scheduling first fetches the
/// offsets, then the bytes they cover.
///
/// When 'nullAdjustment' is positive, an offset greater than or equal to it
/// marks a null row whose real end offset is the stored value minus
/// 'nullAdjustment'.
class BinaryPageScheduler : public PageScheduler {
 public:
  BinaryPageScheduler(
      std::shared_ptr<const PageScheduler> indices,
      std::shared_ptr<const PageScheduler> bytes,
      uint32_t bitsPerOffset,
      uint64_t nullAdjustment);

  folly::SemiFuture<PageDecoderPtr> scheduleRanges(
      const std::vector<RowRange>& ranges,
      const std::shared_ptr<EncodingsIo>& io,
      uint64_t topLevelRow) const override;

  std::string toString() const override;

  uint32_t bitsPerOffset() const {
    return bitsPerOffset_;
  }

  uint64_t nullAdjustment() const {
    return nullAdjustment_;
  }

  /// Returns the offset ranges needed for the rows in 'ranges'. A range not
  /// starting at row 0 also needs the previous row's end offset.
  static std::vector<RowRange> indexRanges(const std::vector<RowRange>& ranges);

 private:
  const std::shared_ptr<const PageScheduler> indices_;
  const std::shared_ptr<const PageScheduler> bytes_;
  const uint32_t bitsPerOffset_;
  const uint64_t nullAdjustment_;
};

class BinaryPageDecoder : public PageDecoder {
 public:
  /// 'ends[i]' is the position right after row i in the concatenation of the
  /// fetched byte ranges. 'validity' is empty when no scheduled row is null.
  BinaryPageDecoder(
      std::vector<uint64_t> ends,
      std::vector<bool> validity,
      PageDecoderPtr bytes,
      uint32_t bitsPerOffset)
      : ends_(std::move(ends)),
        validity_(std::move(validity)),
        bytes_(std::move(bytes)),
        bitsPerOffset_(bitsPerOffset) {}

  DataBlockPtr decode(uint64_t rowsToSkip, uint64_t numRows) const override;

 private:
  const std::vector<uint64_t> ends_;
  const std::vector<bool> validity_;
  const PageDecoderPtr bytes_;
  const uint32_t bitsPerOffset_;
};

} // namespace facebook::lancet::encoding
