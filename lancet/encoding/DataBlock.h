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

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "lancet/common/base/Exceptions.h"
#include "lancet/encoding/BufferUtils.h"

namespace facebook::lancet::encoding {

/// The physical shape of decoded page data, before it is given a logical
/// type. Page decoders produce DataBlocks and toArrow() turns them into
/// typed arrays.
enum class DataBlockKind {
  kAllNull,
  kNullable,
  kFixedWidth,
  kVariableWidth,
  kFixedSizeList,
  kStruct,
  kDictionary,
};

std::string_view toString(DataBlockKind kind);

class DataBlock;
using DataBlockPtr = std::unique_ptr<DataBlock>;

class DataBlock {
 public:
  explicit DataBlock(DataBlockKind kind) : kind_(kind) {}

  virtual ~DataBlock() = default;

  DataBlockKind kind() const {
    return kind_;
  }

  virtual uint64_t numValues() const = 0;

  virtual std::string toString() const = 0;

  template <typename T>
  const T* as() const {
    return dynamic_cast<const T*>(this);
  }

  template <typename T>
  T* as() {
    return dynamic_cast<T*>(this);
  }

  /// Casts to 'T' and fails with a corrupt-data error naming 'context' when
  /// the block has a different shape.
  template <typename T>
  const T& asChecked(std::string_view context) const {
    const auto* result = as<T>();
    if (result == nullptr) {
      LANCET_CORRUPT_DATA(
          "{} expected a {} block but got {}",
          context,
          lancet::encoding::toString(T::kKind),
          lancet::encoding::toString(kind_));
    }
    return *result;
  }

 private:
  const DataBlockKind kind_;
};

/// Every value is null. Carries no buffers.
class AllNullDataBlock final : public DataBlock {
 public:
  static constexpr DataBlockKind kKind = DataBlockKind::kAllNull;

  explicit AllNullDataBlock(uint64_t numValues)
      : DataBlock(kKind), numValues_(numValues) {}

  uint64_t numValues() const override {
    return numValues_;
  }

  std::string toString() const override;

 private:
  const uint64_t numValues_;
};

/// Values of 'bitsPerValue' bits each, packed back to back. A width of 1 is a
/// little-endian bitmap.
class FixedWidthDataBlock final : public DataBlock {
 public:
  static constexpr DataBlockKind kKind = DataBlockKind::kFixedWidth;

  FixedWidthDataBlock(BufferPtr data, uint64_t bitsPerValue, uint64_t numValues);

  uint64_t numValues() const override {
    return numValues_;
  }

  uint64_t bitsPerValue() const {
    return bitsPerValue_;
  }

  const BufferPtr& data() const {
    return data_;
  }

  template <typename T>
  const T* rawValues() const {
    return encoding::rawValues<T>(*data_);
  }

  std::string toString() const override;

 private:
  const BufferPtr data_;
  const uint64_t bitsPerValue_;
  const uint64_t numValues_;
};

/// Offsets (numValues + 1 entries of 'bitsPerOffset' bits, starting at 0)
/// into a byte buffer.
class VariableWidthDataBlock final : public DataBlock {
 public:
  static constexpr DataBlockKind kKind = DataBlockKind::kVariableWidth;

  VariableWidthDataBlock(
      BufferPtr offsets,
      BufferPtr data,
      uint32_t bitsPerOffset,
      uint64_t numValues);

  uint64_t numValues() const override {
    return numValues_;
  }

  uint32_t bitsPerOffset() const {
    return bitsPerOffset_;
  }

  const BufferPtr& offsets() const {
    return offsets_;
  }

  const BufferPtr& data() const {
    return data_;
  }

  /// Offset 'index' widened to 64 bits, 0 <= index <= numValues().
  uint64_t offsetAt(uint64_t index) const {
    return bitsPerOffset_ == 64 ? rawValues<int64_t>(*offsets_)[index]
                                : rawValues<int32_t>(*offsets_)[index];
  }

  std::string_view valueAt(uint64_t index) const {
    const auto start = offsetAt(index);
    return std::string_view(
        reinterpret_cast<const char*>(data_->data()) + start,
        offsetAt(index + 1) - start);
  }

  std::string toString() const override;

 private:
  const BufferPtr offsets_;
  const BufferPtr data_;
  const uint32_t bitsPerOffset_;
  const uint64_t numValues_;
};

/// Wraps a block with a validity bitmap. A set bit marks a valid row; the
/// inner block's content at unset positions is unspecified.
class NullableDataBlock final : public DataBlock {
 public:
  static constexpr DataBlockKind kKind = DataBlockKind::kNullable;

  NullableDataBlock(DataBlockPtr data, BufferPtr nulls);

  uint64_t numValues() const override {
    return data_->numValues();
  }

  const DataBlock& data() const {
    return *data_;
  }

  DataBlockPtr releaseData() {
    return std::move(data_);
  }

  const BufferPtr& nulls() const {
    return nulls_;
  }

  bool isValid(uint64_t index) const;

  std::string toString() const override;

 private:
  DataBlockPtr data_;
  const BufferPtr nulls_;
};

/// 'dimension' consecutive child values per row.
class FixedSizeListDataBlock final : public DataBlock {
 public:
  static constexpr DataBlockKind kKind = DataBlockKind::kFixedSizeList;

  FixedSizeListDataBlock(DataBlockPtr child, uint64_t dimension);

  uint64_t numValues() const override {
    return child_->numValues() / dimension_;
  }

  uint64_t dimension() const {
    return dimension_;
  }

  const DataBlock& child() const {
    return *child_;
  }

  std::string toString() const override;

 private:
  const DataBlockPtr child_;
  const uint64_t dimension_;
};

/// One child block per struct field, all with the same number of values.
class StructDataBlock final : public DataBlock {
 public:
  static constexpr DataBlockKind kKind = DataBlockKind::kStruct;

  StructDataBlock(std::vector<DataBlockPtr> children, uint64_t numValues);

  uint64_t numValues() const override {
    return numValues_;
  }

  const std::vector<DataBlockPtr>& children() const {
    return children_;
  }

  std::string toString() const override;

 private:
  const std::vector<DataBlockPtr> children_;
  const uint64_t numValues_;
};

/// Indices into a separately decoded dictionary. The dictionary is shared by
/// every block decoded from the same page.
class DictionaryDataBlock final : public DataBlock {
 public:
  static constexpr DataBlockKind kKind = DataBlockKind::kDictionary;

  DictionaryDataBlock(
      DataBlockPtr indices,
      std::shared_ptr<const DataBlock> dictionary);

  uint64_t numValues() const override {
    return indices_->numValues();
  }

  const DataBlock& indices() const {
    return *indices_;
  }

  const DataBlock& dictionary() const {
    return *dictionary_;
  }

  std::string toString() const override;

 private:
  const DataBlockPtr indices_;
  const std::shared_ptr<const DataBlock> dictionary_;
};

/// Reads value 'index' of an integer block of 8, 16, 32 or 64 bits as an
/// unsigned 64-bit number.
uint64_t readUnsigned(const FixedWidthDataBlock& block, uint64_t index);

} // namespace facebook::lancet::encoding
