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

#include "lancet/encoding/ArrowConversion.h"

#include <glog/logging.h>

#include "lancet/common/base/BitUtil.h"
#include "lancet/common/base/Exceptions.h"

namespace facebook::lancet::encoding {
namespace {

std::shared_ptr<arrow::ArrayData> toArrayData(
    const DataBlock& block,
    const std::shared_ptr<arrow::DataType>& type);

[[noreturn]] void shapeMismatch(
    const DataBlock& block,
    const arrow::DataType& type) {
  LANCET_CORRUPT_DATA(
      "Cannot decode {} as {}", block.toString(), type.ToString());
}

std::shared_ptr<arrow::ArrayData> fixedWidthToArrayData(
    const FixedWidthDataBlock& block,
    const std::shared_ptr<arrow::DataType>& type) {
  const auto* fixedWidth =
      dynamic_cast<const arrow::FixedWidthType*>(type.get());
  if (fixedWidth == nullptr || type->id() == arrow::Type::DICTIONARY ||
      static_cast<uint64_t>(fixedWidth->bit_width()) != block.bitsPerValue()) {
    shapeMismatch(block, *type);
  }
  return arrow::ArrayData::Make(
      type, block.numValues(), {nullptr, block.data()}, 0);
}

std::shared_ptr<arrow::ArrayData> variableWidthToArrayData(
    const VariableWidthDataBlock& block,
    const std::shared_ptr<arrow::DataType>& type) {
  uint32_t bitsPerOffset;
  switch (type->id()) {
    case arrow::Type::BINARY:
    case arrow::Type::STRING:
      bitsPerOffset = 32;
      break;
    case arrow::Type::LARGE_BINARY:
    case arrow::Type::LARGE_STRING:
      bitsPerOffset = 64;
      break;
    default:
      shapeMismatch(block, *type);
  }
  if (bitsPerOffset != block.bitsPerOffset()) {
    shapeMismatch(block, *type);
  }
  return arrow::ArrayData::Make(
      type, block.numValues(), {nullptr, block.offsets(), block.data()}, 0);
}

std::shared_ptr<arrow::ArrayData> fixedSizeListToArrayData(
    const FixedSizeListDataBlock& block,
    const std::shared_ptr<arrow::DataType>& type) {
  if (type->id() != arrow::Type::FIXED_SIZE_LIST) {
    shapeMismatch(block, *type);
  }
  const auto& listType = static_cast<const arrow::FixedSizeListType&>(*type);
  if (static_cast<uint64_t>(listType.list_size()) != block.dimension()) {
    shapeMismatch(block, *type);
  }
  auto result =
      arrow::ArrayData::Make(type, block.numValues(), {nullptr}, 0);
  result->child_data.push_back(
      toArrayData(block.child(), listType.value_type()));
  return result;
}

std::shared_ptr<arrow::ArrayData> structToArrayData(
    const StructDataBlock& block,
    const std::shared_ptr<arrow::DataType>& type) {
  if (type->id() != arrow::Type::STRUCT ||
      static_cast<size_t>(type->num_fields()) != block.children().size()) {
    shapeMismatch(block, *type);
  }
  auto result =
      arrow::ArrayData::Make(type, block.numValues(), {nullptr}, 0);
  for (int i = 0; i < type->num_fields(); ++i) {
    result->child_data.push_back(
        toArrayData(*block.children()[i], type->field(i)->type()));
  }
  return result;
}

std::shared_ptr<arrow::ArrayData> dictionaryToArrayData(
    const DictionaryDataBlock& block,
    const std::shared_ptr<arrow::DataType>& type) {
  if (type->id() != arrow::Type::DICTIONARY) {
    shapeMismatch(block, *type);
  }
  const auto& dictionaryType = static_cast<const arrow::DictionaryType&>(*type);
  auto indices = toArrayData(block.indices(), dictionaryType.index_type());
  auto result = indices->Copy();
  result->type = type;
  result->dictionary =
      toArrayData(block.dictionary(), dictionaryType.value_type());
  return result;
}

std::shared_ptr<arrow::ArrayData> toArrayData(
    const DataBlock& block,
    const std::shared_ptr<arrow::DataType>& type) {
  switch (block.kind()) {
    case DataBlockKind::kAllNull: {
      auto nulls = arrow::MakeArrayOfNull(type, block.numValues());
      if (!nulls.ok()) {
        LANCET_FAIL(
            "Cannot make {} nulls of {}: {}",
            block.numValues(),
            type->ToString(),
            nulls.status().ToString());
      }
      return (*nulls)->data();
    }
    case DataBlockKind::kNullable: {
      const auto& nullable = static_cast<const NullableDataBlock&>(block);
      LANCET_CHECK(
          nullable.data().kind() != DataBlockKind::kNullable,
          "Nested nullable block {}",
          block.toString());
      auto result = toArrayData(nullable.data(), type)->Copy();
      result->buffers[0] = nullable.nulls();
      result->null_count =
          block.numValues() -
          bits::countBits(nullable.nulls()->data(), 0, block.numValues());
      return result;
    }
    case DataBlockKind::kFixedWidth:
      return fixedWidthToArrayData(
          static_cast<const FixedWidthDataBlock&>(block), type);
    case DataBlockKind::kVariableWidth:
      return variableWidthToArrayData(
          static_cast<const VariableWidthDataBlock&>(block), type);
    case DataBlockKind::kFixedSizeList:
      return fixedSizeListToArrayData(
          static_cast<const FixedSizeListDataBlock&>(block), type);
    case DataBlockKind::kStruct:
      return structToArrayData(
          static_cast<const StructDataBlock&>(block), type);
    case DataBlockKind::kDictionary:
      return dictionaryToArrayData(
          static_cast<const DictionaryDataBlock&>(block), type);
  }
  LANCET_UNREACHABLE();
}

} // namespace

std::shared_ptr<arrow::Array> toArrow(
    const DataBlock& block,
    const std::shared_ptr<arrow::DataType>& type,
    bool validate) {
  auto array = arrow::MakeArray(toArrayData(block, type));
  if (validate) {
    auto status = array->ValidateFull();
    if (!status.ok()) {
      LOG(WARNING) << "Decoded " << block.toString() << " is not a valid "
                   << type->ToString() << ": " << status.ToString();
      LANCET_CORRUPT_DATA(
          "Decoded array failed validation: {}", status.ToString());
    }
  }
  return array;
}

std::shared_ptr<arrow::Array> toArrow(
    const DataBlock& block,
    const std::shared_ptr<arrow::DataType>& type,
    const DecoderOptions& options) {
  return toArrow(block, type, options.validateOnDecode);
}

} // namespace facebook::lancet::encoding
