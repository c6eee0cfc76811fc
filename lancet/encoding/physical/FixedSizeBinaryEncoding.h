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

/// Binary values that all have 'byteWidth' bytes, stored without offsets.
/// The bytes scheduler reads one fixed-width value per row; decode()
/// synthesizes offsets of 'bytesPerOffset' bytes so the result looks like
/// any other binary column.
class FixedSizeBinaryPageScheduler : public PageScheduler {
 public:
  FixedSizeBinaryPageScheduler(
      PageSchedulerPtr bytes,
      uint32_t byteWidth,
      uint32_t bytesPerOffset);

  folly::SemiFuture<PageDecoderPtr> scheduleRanges(
      const std::vector<RowRange>& ranges,
      const std::shared_ptr<EncodingsIo>& io,
      uint64_t topLevelRow) const override;

  std::string toString() const override;

  uint32_t byteWidth() const {
    return byteWidth_;
  }

  uint32_t bytesPerOffset() const {
    return bytesPerOffset_;
  }

 private:
  const PageSchedulerPtr bytes_;
  const uint32_t byteWidth_;
  const uint32_t bytesPerOffset_;
};

class FixedSizeBinaryDecoder : public PageDecoder {
 public:
  FixedSizeBinaryDecoder(
      PageDecoderPtr bytes,
      uint32_t byteWidth,
      uint32_t bytesPerOffset)
      : bytes_(std::move(bytes)),
        byteWidth_(byteWidth),
        bytesPerOffset_(bytesPerOffset) {}

  DataBlockPtr decode(uint64_t rowsToSkip, uint64_t numRows) const override;

 private:
  DataBlockPtr toVariableWidth(const FixedWidthDataBlock& values) const;

  const PageDecoderPtr bytes_;
  const uint32_t byteWidth_;
  const uint32_t bytesPerOffset_;
};

} // namespace facebook::lancet::encoding
