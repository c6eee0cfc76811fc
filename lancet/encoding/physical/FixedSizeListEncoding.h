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

/// Lists of exactly 'dimension' items each, stored as the flattened items.
/// Row range [b, e) maps to item range [b * dimension, e * dimension).
class FixedListScheduler : public PageScheduler {
 public:
  FixedListScheduler(PageSchedulerPtr items, uint32_t dimension);

  folly::SemiFuture<PageDecoderPtr> scheduleRanges(
      const std::vector<RowRange>& ranges,
      const std::shared_ptr<EncodingsIo>& io,
      uint64_t topLevelRow) const override;

  std::string toString() const override;

  uint32_t dimension() const {
    return dimension_;
  }

  /// Returns the item ranges covering the list rows in 'ranges'.
  std::vector<RowRange> itemRanges(const std::vector<RowRange>& ranges) const;

 private:
  const PageSchedulerPtr items_;
  const uint32_t dimension_;
};

class FixedListDecoder : public PageDecoder {
 public:
  FixedListDecoder(PageDecoderPtr items, uint32_t dimension)
      : items_(std::move(items)), dimension_(dimension) {}

  DataBlockPtr decode(uint64_t rowsToSkip, uint64_t numRows) const override;

 private:
  const PageDecoderPtr items_;
  const uint32_t dimension_;
};

} // namespace facebook::lancet::encoding
