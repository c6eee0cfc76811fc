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

#include "lancet/encoding/DataBlock.h"

#include <fmt/format.h>

#include "lancet/common/base/BitUtil.h"

namespace facebook::lancet::encoding {

std::string_view toString(DataBlockKind kind) {
  switch (kind) {
    case DataBlockKind::kAllNull:
      return "AllNull";
    case DataBlockKind::kNullable:
      return "Nullable";
    case DataBlockKind::kFixedWidth:
      return "FixedWidth";
    case DataBlockKind::kVariableWidth:
      return "VariableWidth";
    case DataBlockKind::kFixedSizeList:
      return "FixedSizeList";
    case DataBlockKind::kStruct:
      return "Struct";
    case DataBlockKind::kDictionary:
      return "Dictionary";
  }
  LANCET_UNREACHABLE("Unknown DataBlockKind {}", static_cast<int>(kind));
}

std::string AllNullDataBlock::toString() const {
  return fmt::format("AllNull[{}]", numValues_);
}

FixedWidthDataBlock::FixedWidthDataBlock(
    BufferPtr data,
    uint64_t bitsPerValue,
    uint64_t numValues)
    : DataBlock(kKind),
      data_(std::move(data)),
      bitsPerValue_(bitsPerValue),
      numValues_(numValues) {
  LANCET_CHECK_NOT_NULL(data_);
  LANCET_CHECK_GE(
      static_cast<uint64_t>(data_->size()),
      bits::nbytes(bitsPerValue_ * numValues_),
      "Buffer too small for {} values of {} bits",
      numValues_,
      bitsPerValue_);
}

std::string FixedWidthDataBlock::toString() const {
  return fmt::format("FixedWidth[{} x {} bits]", numValues_, bitsPerValue_);
}

VariableWidthDataBlock::VariableWidthDataBlock(
    BufferPtr offsets,
    BufferPtr data,
    uint32_t bitsPerOffset,
    uint64_t numValues)
    : DataBlock(kKind),
      offsets_(std::move(offsets)),
      data_(std::move(data)),
      bitsPerOffset_(bitsPerOffset),
      numValues_(numValues) {
  LANCET_CHECK(
      bitsPerOffset_ == 32 || bitsPerOffset_ == 64,
      "Unsupported offset width {}",
      bitsPerOffset_);
  LANCET_CHECK_GE(
      static_cast<uint64_t>(offsets_->size()),
      (numValues_ + 1) * (bitsPerOffset_ / 8));
}

std::string VariableWidthDataBlock::toString() const {
  return fmt::format(
      "VariableWidth[{} values, {} bytes, {}-bit offsets]",
      numValues_,
      data_->size(),
      bitsPerOffset_);
}

NullableDataBlock::NullableDataBlock(DataBlockPtr data, BufferPtr nulls)
    : DataBlock(kKind), data_(std::move(data)), nulls_(std::move(nulls)) {
  LANCET_CHECK_NOT_NULL(data_);
  LANCET_CHECK_NOT_NULL(nulls_);
  LANCET_CHECK_GE(
      static_cast<uint64_t>(nulls_->size()), bits::nbytes(data_->numValues()));
}

bool NullableDataBlock::isValid(uint64_t index) const {
  return bits::isBitSet(nulls_->data(), index);
}

std::string NullableDataBlock::toString() const {
  return fmt::format("Nullable[{}]", data_->toString());
}

FixedSizeListDataBlock::FixedSizeListDataBlock(
    DataBlockPtr child,
    uint64_t dimension)
    : DataBlock(kKind), child_(std::move(child)), dimension_(dimension) {
  LANCET_CHECK_GT(dimension_, 0);
  LANCET_CHECK_EQ(child_->numValues() % dimension_, 0);
}

std::string FixedSizeListDataBlock::toString() const {
  return fmt::format(
      "FixedSizeList[{} x {}]", dimension_, child_->toString());
}

StructDataBlock::StructDataBlock(
    std::vector<DataBlockPtr> children,
    uint64_t numValues)
    : DataBlock(kKind), children_(std::move(children)), numValues_(numValues) {
  for (const auto& child : children_) {
    LANCET_CHECK_EQ(child->numValues(), numValues_);
  }
}

std::string StructDataBlock::toString() const {
  std::string fields;
  for (const auto& child : children_) {
    if (!fields.empty()) {
      fields += ", ";
    }
    fields += child->toString();
  }
  return fmt::format("Struct[{}]", fields);
}

DictionaryDataBlock::DictionaryDataBlock(
    DataBlockPtr indices,
    std::shared_ptr<const DataBlock> dictionary)
    : DataBlock(kKind),
      indices_(std::move(indices)),
      dictionary_(std::move(dictionary)) {
  LANCET_CHECK_NOT_NULL(indices_);
  LANCET_CHECK_NOT_NULL(dictionary_);
}

std::string DictionaryDataBlock::toString() const {
  return fmt::format(
      "Dictionary[indices: {}, items: {}]",
      indices_->toString(),
      dictionary_->toString());
}

uint64_t readUnsigned(const FixedWidthDataBlock& block, uint64_t index) {
  switch (block.bitsPerValue()) {
    case 8:
      return block.rawValues<uint8_t>()[index];
    case 16:
      return block.rawValues<uint16_t>()[index];
    case 32:
      return block.rawValues<uint32_t>()[index];
    case 64:
      return block.rawValues<uint64_t>()[index];
    default:
      LANCET_CORRUPT_DATA(
          "Expected an integer block but got {} bits per value",
          block.bitsPerValue());
  }
}

} // namespace facebook::lancet::encoding
