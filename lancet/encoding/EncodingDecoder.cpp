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

#include "lancet/encoding/EncodingDecoder.h"

#include <arrow/type.h>
#include <glog/logging.h>

#include "lancet/common/base/Exceptions.h"
#include "lancet/encoding/physical/BasicEncoding.h"
#include "lancet/encoding/physical/BinaryEncoding.h"
#include "lancet/encoding/physical/BitmapEncoding.h"
#include "lancet/encoding/physical/BitpackEncoding.h"
#include "lancet/encoding/physical/DictionaryEncoding.h"
#include "lancet/encoding/physical/FixedSizeBinaryEncoding.h"
#include "lancet/encoding/physical/FixedSizeListEncoding.h"
#include "lancet/encoding/physical/FsstEncoding.h"
#include "lancet/encoding/physical/PackedStructEncoding.h"
#include "lancet/encoding/physical/ValueEncoding.h"

namespace facebook::lancet::encoding {
namespace {

class SchedulerBuilder {
 public:
  SchedulerBuilder(const PageBuffers& buffers, const DecoderOptions& options)
      : buffers_(buffers), options_(options) {}

  PageSchedulerPtr build(
      const proto::ArrayEncoding& encoding,
      const arrow::DataType& type) const;

 private:
  PageSchedulerPtr buildChild(
      bool present,
      const proto::ArrayEncoding& child,
      std::string_view name,
      const arrow::DataType& type) const {
    LANCET_USER_CHECK(present, "Encoding is missing its {} child", name);
    return build(child, type);
  }

  PageSchedulerPtr buildNullable(
      const proto::Nullable& nullable,
      const arrow::DataType& type) const;

  PageSchedulerPtr buildBinary(
      const proto::Binary& binary,
      const arrow::DataType& type) const;

  PageSchedulerPtr buildDictionary(
      const proto::Dictionary& dictionary,
      const arrow::DataType& type) const;

  PageSchedulerPtr buildFixedSizeBinary(
      const proto::FixedSizeBinary& fixedSizeBinary,
      const arrow::DataType& type) const;

  PageSchedulerPtr buildPackedStruct(
      const proto::PackedStruct& packedStruct,
      const arrow::DataType& type) const;

  const PageBuffers& buffers_;
  const DecoderOptions& options_;
};

#define LANCET_BUILD_CHILD(message, field, type) \
  buildChild((message).has_##field(), (message).field(), #field, type)

PageSchedulerPtr SchedulerBuilder::build(
    const proto::ArrayEncoding& encoding,
    const arrow::DataType& type) const {
  switch (encoding.array_encoding_case()) {
    case proto::ArrayEncoding::kFlat:
      return decoderFromFlat(encoding.flat(), buffers_, options_);
    case proto::ArrayEncoding::kBitpacked: {
      const auto& bitpacked = encoding.bitpacked();
      const auto region =
          resolveRequiredBuffer(bitpacked, "Bitpacked", buffers_);
      return std::make_unique<BitpackedScheduler>(
          bitpacked.compressed_bits_per_value(),
          bitpacked.uncompressed_bits_per_value(),
          region.offset,
          bitpacked.signed_());
    }
    case proto::ArrayEncoding::kBitpackedForNonNeg: {
      const auto& bitpacked = encoding.bitpacked_for_non_neg();
      const auto region =
          resolveRequiredBuffer(bitpacked, "BitpackedForNonNeg", buffers_);
      return std::make_unique<BitpackedForNonNegScheduler>(
          bitpacked.compressed_bits_per_value(),
          bitpacked.uncompressed_bits_per_value(),
          region.offset);
    }
    case proto::ArrayEncoding::kNullable:
      return buildNullable(encoding.nullable(), type);
    case proto::ArrayEncoding::kFixedSizeList: {
      const auto& list = encoding.fixed_size_list();
      return std::make_unique<FixedListScheduler>(
          LANCET_BUILD_CHILD(list, items, type), list.dimension());
    }
    case proto::ArrayEncoding::kList:
      // The logical type already says this is a list; only the offsets are
      // stored here.
      return LANCET_BUILD_CHILD(encoding.list(), offsets, type);
    case proto::ArrayEncoding::kBinary:
      return buildBinary(encoding.binary(), type);
    case proto::ArrayEncoding::kFsst: {
      const auto& fsst = encoding.fsst();
      auto inner = LANCET_BUILD_CHILD(fsst, binary, type);
      return std::make_unique<FsstPageScheduler>(
          std::move(inner), FsstSymbolTable::parse(fsst.symbol_table()));
    }
    case proto::ArrayEncoding::kDictionary:
      return buildDictionary(encoding.dictionary(), type);
    case proto::ArrayEncoding::kFixedSizeBinary:
      return buildFixedSizeBinary(encoding.fixed_size_binary(), type);
    case proto::ArrayEncoding::kPackedStruct:
      return buildPackedStruct(encoding.packed_struct(), type);
    case proto::ArrayEncoding::kStruct:
      // Struct validity lives in a header column with no data, which is never
      // decoded.
      LANCET_UNREACHABLE("Struct encodings are never decoded");
    case proto::ArrayEncoding::ARRAY_ENCODING_NOT_SET:
      break;
  }
  LANCET_UNSUPPORTED(
      "Unsupported array encoding: {}", encoding.ShortDebugString());
}

PageSchedulerPtr SchedulerBuilder::buildNullable(
    const proto::Nullable& nullable,
    const arrow::DataType& type) const {
  switch (nullable.nullability_case()) {
    case proto::Nullable::kNoNulls:
      return BasicPageScheduler::makeNonNullable(
          LANCET_BUILD_CHILD(nullable.no_nulls(), values, type));
    case proto::Nullable::kSomeNulls: {
      const auto& someNulls = nullable.some_nulls();
      auto validity = LANCET_BUILD_CHILD(someNulls, validity, type);
      auto values = LANCET_BUILD_CHILD(someNulls, values, type);
      return BasicPageScheduler::makeNullable(
          std::move(validity), std::move(values));
    }
    case proto::Nullable::kAllNulls:
      return BasicPageScheduler::makeAllNull();
    case proto::Nullable::NULLABILITY_NOT_SET:
      break;
  }
  LANCET_USER_FAIL("Nullable encoding does not say which rows are null");
}

PageSchedulerPtr SchedulerBuilder::buildBinary(
    const proto::Binary& binary,
    const arrow::DataType& type) const {
  auto indices = LANCET_BUILD_CHILD(binary, indices, type);
  auto bytes = LANCET_BUILD_CHILD(binary, bytes, type);
  return std::make_unique<BinaryPageScheduler>(
      std::move(indices),
      std::move(bytes),
      binaryOffsetBits(type),
      binary.null_adjustment());
}

PageSchedulerPtr SchedulerBuilder::buildDictionary(
    const proto::Dictionary& dictionary,
    const arrow::DataType& type) const {
  // A dictionary type asks for the indices and the dictionary. Any other type
  // asks for the values, and dictionary encoding is a storage detail.
  const arrow::DataType* valueType = &type;
  if (type.id() == arrow::Type::DICTIONARY) {
    valueType =
        static_cast<const arrow::DictionaryType&>(type).value_type().get();
  }
  const bool shouldDecodeDict = type.id() != arrow::Type::DICTIONARY;

  // Indices are integers whatever 'type' says, so the outer type is enough.
  auto indices = LANCET_BUILD_CHILD(dictionary, indices, type);
  auto items = LANCET_BUILD_CHILD(dictionary, items, *valueType);
  return std::make_unique<DictionaryPageScheduler>(
      std::move(indices),
      std::move(items),
      dictionary.num_dictionary_items(),
      shouldDecodeDict);
}

PageSchedulerPtr SchedulerBuilder::buildFixedSizeBinary(
    const proto::FixedSizeBinary& fixedSizeBinary,
    const arrow::DataType& type) const {
  uint32_t bytesPerOffset;
  switch (type.id()) {
    case arrow::Type::LARGE_BINARY:
    case arrow::Type::LARGE_STRING:
      bytesPerOffset = 8;
      break;
    case arrow::Type::BINARY:
    case arrow::Type::STRING:
      bytesPerOffset = 4;
      break;
    default:
      LANCET_USER_FAIL(
          "FixedSizeBinary only supports binary and utf8 types, got {}",
          type.ToString());
  }
  auto bytes = LANCET_BUILD_CHILD(fixedSizeBinary, bytes, type);
  return std::make_unique<FixedSizeBinaryPageScheduler>(
      std::move(bytes), fixedSizeBinary.byte_width(), bytesPerOffset);
}

PageSchedulerPtr SchedulerBuilder::buildPackedStruct(
    const proto::PackedStruct& packedStruct,
    const arrow::DataType& type) const {
  LANCET_USER_CHECK(
      type.id() == arrow::Type::STRUCT,
      "PackedStruct requires a struct type, got {}",
      type.ToString());
  LANCET_USER_CHECK_EQ(
      type.num_fields(),
      packedStruct.inner_size(),
      "PackedStruct must have one encoding per field of {}",
      type.ToString());

  std::vector<PageSchedulerPtr> fields;
  std::vector<uint32_t> fieldByteWidths;
  fields.reserve(type.num_fields());
  fieldByteWidths.reserve(type.num_fields());
  for (int i = 0; i < type.num_fields(); ++i) {
    const auto& fieldType = *type.field(i)->type();
    const auto* fixedWidth =
        dynamic_cast<const arrow::FixedWidthType*>(&fieldType);
    LANCET_USER_CHECK(
        fixedWidth != nullptr && fixedWidth->bit_width() % 8 == 0,
        "PackedStruct field {} must have a fixed byte width, got {}",
        type.field(i)->name(),
        fieldType.ToString());
    fields.push_back(build(packedStruct.inner(i), fieldType));
    fieldByteWidths.push_back(fixedWidth->bit_width() / 8);
  }
  const auto region =
      resolveRequiredBuffer(packedStruct, "PackedStruct", buffers_);
  return std::make_unique<PackedStructPageScheduler>(
      std::move(fields), std::move(fieldByteWidths), region.offset);
}

#undef LANCET_BUILD_CHILD

} // namespace

uint32_t binaryOffsetBits(const arrow::DataType& type) {
  switch (type.id()) {
    case arrow::Type::LARGE_BINARY:
    case arrow::Type::LARGE_STRING:
      return 64;
    default:
      return 32;
  }
}

common::CompressionConfig toCompressionConfig(const proto::Flat& flat) {
  common::CompressionConfig config;
  if (!flat.has_compression()) {
    return config;
  }
  config.kind = common::stringToCompressionKind(flat.compression().scheme());
  if (flat.compression().has_level()) {
    config.level = flat.compression().level();
  }
  return config;
}

PageSchedulerPtr decoderFromFlat(
    const proto::Flat& flat,
    const PageBuffers& buffers,
    const DecoderOptions& options) {
  const auto region = resolveRequiredBuffer(flat, "Flat", buffers);
  const auto bitsPerValue = flat.bits_per_value();
  if (bitsPerValue == 1) {
    return std::make_unique<DenseBitmapScheduler>(region.offset);
  }
  if (bitsPerValue == 0 || bitsPerValue % 8 != 0) {
    LANCET_UNSUPPORTED(
        "Flat encoding with {} bits per value, which is not a multiple of 8",
        bitsPerValue);
  }

  auto config = toCompressionConfig(flat);
  auto codec = common::createCodec(
      config.kind, config.level.value_or(common::kUseDefaultCompressionLevel));
  if (codec.hasError()) {
    LANCET_UNSUPPORTED(
        "Cannot decode {} compressed values: {}",
        config.toString(),
        codec.error().message());
  }
  return std::make_unique<ValuePageScheduler>(
      bitsPerValue / 8,
      region.offset,
      region.length,
      std::move(config),
      std::shared_ptr<const common::Codec>(std::move(codec.value())),
      options.maxDecompressedPageBytes);
}

PageSchedulerPtr decoderFromArrayEncoding(
    const proto::ArrayEncoding& encoding,
    const PageBuffers& buffers,
    const arrow::DataType& type,
    const DecoderOptions& options) {
  auto scheduler = SchedulerBuilder(buffers, options).build(encoding, type);
  VLOG(1) << "Built " << scheduler->toString() << " for " << type.ToString();
  return scheduler;
}

} // namespace facebook::lancet::encoding
