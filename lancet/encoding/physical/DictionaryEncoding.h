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

/// Values stored as integer indices into a per-page dictionary of
/// 'numDictionaryItems' items. With 'shouldDecodeDict' the decoder returns
/// the looked-up values, otherwise it returns the indices together with the
/// dictionary.
class DictionaryPageScheduler : public PageScheduler {
 public:
  DictionaryPageScheduler(
      std::shared_ptr<const PageScheduler> indices,
      std::shared_ptr<const PageScheduler> items,
      uint32_t numDictionaryItems,
      bool shouldDecodeDict);

  folly::SemiFuture<PageDecoderPtr> scheduleRanges(
      const std::vector<RowRange>& ranges,
      const std::shared_ptr<EncodingsIo>& io,
      uint64_t topLevelRow) const override;

  std::string toString() const override;

  uint32_t numDictionaryItems() const {
    return numDictionaryItems_;
  }

  bool shouldDecodeDict() const {
    return shouldDecodeDict_;
  }

 private:
  const std::shared_ptr<const PageScheduler> indices_;
  const std::shared_ptr<const PageScheduler> items_;
  const uint32_t numDictionaryItems_;
  const bool shouldDecodeDict_;
};

class DictionaryPageDecoder : public PageDecoder {
 public:
  DictionaryPageDecoder(
      PageDecoderPtr indices,
      std::shared_ptr<const DataBlock> items,
      bool shouldDecodeDict)
      : indices_(std::move(indices)),
        items_(std::move(items)),
        shouldDecodeDict_(shouldDecodeDict) {}

  DataBlockPtr decode(uint64_t rowsToSkip, uint64_t numRows) const override;

 private:
  const PageDecoderPtr indices_;
  const std::shared_ptr<const DataBlock> items_;
  const bool shouldDecodeDict_;
};

/// Returns the rows of 'items' selected by 'indices'. Rows whose bit in
/// 'indexNulls' is unset are null in the result; 'indexNulls' may be null
/// when every index is valid. Throws corrupt-data on an index outside
/// 'items'.
DataBlockPtr takeRows(
    const DataBlock& items,
    const std::vector<uint64_t>& indices,
    const uint8_t* indexNulls);

} // namespace facebook::lancet::encoding
