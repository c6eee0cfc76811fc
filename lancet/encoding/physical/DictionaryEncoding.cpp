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

#include "lancet/encoding/physical/DictionaryEncoding.h"

#include <cstring>
#include <limits>

#include "lancet/common/base/BitUtil.h"
#include "lancet/common/base/Exceptions.h"

namespace facebook::lancet::encoding {
namespace {

bool isIndexValid(const uint8_t* indexNulls, uint64_t row) {
  return indexNulls == nullptr || bits::isBitSet(indexNulls, row);
}

DataBlockPtr takeFixedWidth(
    const FixedWidthDataBlock& items,
    const std::vector<uint64_t>& indices,
    const uint8_t* indexNulls) {
  const auto bitsPerValue = items.bitsPerValue();
  auto result = allocateBuffer(bits::nbytes(indices.size() * bitsPerValue));
  auto* out = result->mutable_data();
  const auto* in = items.data()->data();
  if (bitsPerValue == 1) {
    for (uint64_t row = 0; row < indices.size(); ++row) {
      if (isIndexValid(indexNulls, row)) {
        bits::setBit(out, row, bits::isBitSet(in, indices[row]));
      }
    }
  } else {
    if (bitsPerValue % 8 != 0) {
      LANCET_CORRUPT_DATA(
          "Cannot take rows of {} bits from a dictionary", bitsPerValue);
    }
    const auto width = bitsPerValue / 8;
    for (uint64_t row = 0; row < indices.size(); ++row) {
      if (isIndexValid(indexNulls, row)) {
        std::memcpy(out + row * width, in + indices[row] * width, width);
      }
    }
  }
  return std::make_unique<FixedWidthDataBlock>(
      std::move(result), bitsPerValue, indices.size());
}

DataBlockPtr takeVariableWidth(
    const VariableWidthDataBlock& items,
    const std::vector<uint64_t>& indices,
    const uint8_t* indexNulls) {
  const auto bitsPerOffset = items.bitsPerOffset();
  auto offsets = allocateBuffer((indices.size() + 1) * bitsPerOffset / 8);
  std::string bytes;
  for (uint64_t row = 0; row < indices.size(); ++row) {
    if (isIndexValid(indexNulls, row)) {
      bytes.append(items.valueAt(indices[row]));
    }
    if (bitsPerOffset == 64) {
      reinterpret_cast<int64_t*>(offsets->mutable_data())[row + 1] =
          bytes.size();
    } else {
      if (bytes.size() >
          static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        LANCET_CORRUPT_DATA(
            "Dictionary values do not fit 32-bit offsets");
      }
      reinterpret_cast<int32_t*>(offsets->mutable_data())[row + 1] =
          bytes.size();
    }
  }
  return std::make_unique<VariableWidthDataBlock>(
      std::move(offsets), copyBuffer(bytes), bitsPerOffset, indices.size());
}

} // namespace

DataBlockPtr takeRows(
    const DataBlock& items,
    const std::vector<uint64_t>& indices,
    const uint8_t* indexNulls) {
  const auto numItems = items.numValues();
  for (uint64_t row = 0; row < indices.size(); ++row) {
    if (isIndexValid(indexNulls, row) && indices[row] >= numItems) {
      LANCET_CORRUPT_DATA(
          "Dictionary index {} at row {} is outside the {} dictionary items",
          indices[row],
          row,
          numItems);
    }
  }

  switch (items.kind()) {
    case DataBlockKind::kAllNull:
      return std::make_unique<AllNullDataBlock>(indices.size());
    case DataBlockKind::kFixedWidth: {
      auto values =
          takeFixedWidth(*items.as<FixedWidthDataBlock>(), indices, indexNulls);
      if (indexNulls == nullptr) {
        return values;
      }
      return std::make_unique<NullableDataBlock>(
          std::move(values), copyBuffer(std::string_view(
                                 reinterpret_cast<const char*>(indexNulls),
                                 bits::nbytes(indices.size()))));
    }
    case DataBlockKind::kVariableWidth: {
      auto values = takeVariableWidth(
          *items.as<VariableWidthDataBlock>(), indices, indexNulls);
      if (indexNulls == nullptr) {
        return values;
      }
      return std::make_unique<NullableDataBlock>(
          std::move(values), copyBuffer(std::string_view(
                                 reinterpret_cast<const char*>(indexNulls),
                                 bits::nbytes(indices.size()))));
    }
    case DataBlockKind::kNullable: {
      const auto& nullable = *items.as<NullableDataBlock>();
      // A row is valid when both its index and the item it selects are.
      auto nulls = allocateBuffer(bits::nbytes(indices.size()));
      for (uint64_t row = 0; row < indices.size(); ++row) {
        if (isIndexValid(indexNulls, row) && nullable.isValid(indices[row])) {
          bits::setBit(nulls->mutable_data(), row);
        }
      }
      auto values = takeRows(nullable.data(), indices, nulls->data());
      if (auto* inner = values->as<NullableDataBlock>()) {
        values = inner->releaseData();
      }
      return std::make_unique<NullableDataBlock>(
          std::move(values), std::move(nulls));
    }
    default:
      LANCET_CORRUPT_DATA(
          "Cannot decode dictionary items of kind {}",
          encoding::toString(items.kind()));
  }
}

DictionaryPageScheduler::DictionaryPageScheduler(
    std::shared_ptr<const PageScheduler> indices,
    std::shared_ptr<const PageScheduler> items,
    uint32_t numDictionaryItems,
    bool shouldDecodeDict)
    : indices_(std::move(indices)),
      items_(std::move(items)),
      numDictionaryItems_(numDictionaryItems),
      shouldDecodeDict_(shouldDecodeDict) {
  LANCET_CHECK_NOT_NULL(indices_);
  LANCET_CHECK_NOT_NULL(items_);
}

folly::SemiFuture<PageDecoderPtr> DictionaryPageScheduler::scheduleRanges(
    const std::vector<RowRange>& ranges,
    const std::shared_ptr<EncodingsIo>& io,
    uint64_t topLevelRow) const {
  // The whole dictionary is needed to resolve any subset of rows.
  auto items = items_->scheduleRanges(
      {RowRange{0, numDictionaryItems_}}, io, topLevelRow);
  auto indices = indices_->scheduleRanges(ranges, io, topLevelRow);
  return folly::collect(std::move(indices), std::move(items))
      .deferValue(
          [numItems = numDictionaryItems_, shouldDecodeDict = shouldDecodeDict_](
              std::tuple<PageDecoderPtr, PageDecoderPtr> decoders)
              -> PageDecoderPtr {
            std::shared_ptr<const DataBlock> items =
                std::get<1>(decoders)->decode(0, numItems);
            return std::make_unique<DictionaryPageDecoder>(
                std::move(std::get<0>(decoders)),
                std::move(items),
                shouldDecodeDict);
          });
}

std::string DictionaryPageScheduler::toString() const {
  return fmt::format(
      "DictionaryPageScheduler{{numDictionaryItems: {}, shouldDecodeDict: {}, indices: {}, items: {}}}",
      numDictionaryItems_,
      shouldDecodeDict_,
      indices_->toString(),
      items_->toString());
}

DataBlockPtr DictionaryPageDecoder::decode(uint64_t rowsToSkip, uint64_t numRows)
    const {
  auto indices = indices_->decode(rowsToSkip, numRows);
  if (!shouldDecodeDict_) {
    return std::make_unique<DictionaryDataBlock>(std::move(indices), items_);
  }

  const uint8_t* indexNulls = nullptr;
  const DataBlock* indexValues = indices.get();
  if (const auto* nullable = indices->as<NullableDataBlock>()) {
    indexNulls = nullable->nulls()->data();
    indexValues = &nullable->data();
  }
  const auto& fixedWidth =
      indexValues->asChecked<FixedWidthDataBlock>("Dictionary indices");
  std::vector<uint64_t> positions(numRows);
  for (uint64_t row = 0; row < numRows; ++row) {
    if (indexNulls == nullptr || bits::isBitSet(indexNulls, row)) {
      positions[row] = readUnsigned(fixedWidth, row);
    }
  }
  return takeRows(*items_, positions, indexNulls);
}

} // namespace facebook::lancet::encoding
