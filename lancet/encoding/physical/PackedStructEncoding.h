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

/// Struct of fixed-width fields stored row-major: each row holds every field
/// back to back, so reading a row range takes one contiguous read. The field
/// schedulers describe the fields and are not used to read them.
class PackedStructPageScheduler : public PageScheduler {
 public:
  PackedStructPageScheduler(
      std::vector<PageSchedulerPtr> fields,
      std::vector<uint32_t> fieldByteWidths,
      uint64_t bufferOffset);

  folly::SemiFuture<PageDecoderPtr> scheduleRanges(
      const std::vector<RowRange>& ranges,
      const std::shared_ptr<EncodingsIo>& io,
      uint64_t topLevelRow) const override;

  std::string toString() const override;

  uint64_t bytesPerRow() const {
    return bytesPerRow_;
  }

  const std::vector<uint32_t>& fieldByteWidths() const {
    return fieldByteWidths_;
  }

  uint64_t bufferOffset() const {
    return bufferOffset_;
  }

 private:
  const std::vector<PageSchedulerPtr> fields_;
  const std::vector<uint32_t> fieldByteWidths_;
  const uint64_t bufferOffset_;
  const uint64_t bytesPerRow_;
};

class PackedStructPageDecoder : public PageDecoder {
 public:
  PackedStructPageDecoder(
      std::vector<uint32_t> fieldByteWidths,
      uint64_t bytesPerRow,
      std::vector<BufferPtr> chunks)
      : fieldByteWidths_(std::move(fieldByteWidths)),
        bytesPerRow_(bytesPerRow),
        chunks_(std::move(chunks)) {}

  DataBlockPtr decode(uint64_t rowsToSkip, uint64_t numRows) const override;

 private:
  const std::vector<uint32_t> fieldByteWidths_;
  const uint64_t bytesPerRow_;
  const std::vector<BufferPtr> chunks_;
};

} // namespace facebook::lancet::encoding
