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

#include "lancet/encoding/physical/FixedSizeListEncoding.h"

#include "lancet/common/base/Exceptions.h"

namespace facebook::lancet::encoding {

FixedListScheduler::FixedListScheduler(
    PageSchedulerPtr items,
    uint32_t dimension)
    : items_(std::move(items)), dimension_(dimension) {
  LANCET_CHECK_NOT_NULL(items_);
  LANCET_USER_CHECK_GT(dimension_, 0, "Fixed size list dimension");
}

std::vector<RowRange> FixedListScheduler::itemRanges(
    const std::vector<RowRange>& ranges) const {
  std::vector<RowRange> result;
  result.reserve(ranges.size());
  for (const auto& range : ranges) {
    result.push_back(
        RowRange{range.begin * dimension_, range.end * dimension_});
  }
  return result;
}

folly::SemiFuture<PageDecoderPtr> FixedListScheduler::scheduleRanges(
    const std::vector<RowRange>& ranges,
    const std::shared_ptr<EncodingsIo>& io,
    uint64_t topLevelRow) const {
  return items_->scheduleRanges(itemRanges(ranges), io, topLevelRow)
      .deferValue(
          [dimension = dimension_](PageDecoderPtr items) -> PageDecoderPtr {
            return std::make_unique<FixedListDecoder>(
                std::move(items), dimension);
          });
}

std::string FixedListScheduler::toString() const {
  return fmt::format(
      "FixedListScheduler{{dimension: {}, items: {}}}",
      dimension_,
      items_->toString());
}

DataBlockPtr FixedListDecoder::decode(uint64_t rowsToSkip, uint64_t numRows)
    const {
  auto items = items_->decode(rowsToSkip * dimension_, numRows * dimension_);
  return std::make_unique<FixedSizeListDataBlock>(std::move(items), dimension_);
}

} // namespace facebook::lancet::encoding
