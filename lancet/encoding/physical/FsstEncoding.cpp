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

#include "lancet/encoding/physical/FsstEncoding.h"

#include <cstring>
#include <limits>

#include "lancet/common/base/Exceptions.h"

namespace facebook::lancet::encoding {

FsstSymbolTable FsstSymbolTable::parse(std::string_view serialized) {
  LANCET_USER_CHECK_EQ(
      serialized.size(),
      kSerializedSize,
      "FSST symbol table has an unexpected size");
  FsstSymbolTable table;
  uint64_t header;
  std::memcpy(&header, serialized.data(), sizeof(header));
  table.numSymbols_ = header & 0xff;
  const char* cursor = serialized.data() + 8;
  std::memcpy(table.symbols_.data(), cursor, table.symbols_.size() * 8);
  cursor += table.symbols_.size() * 8;
  std::memcpy(table.lengths_.data(), cursor, table.lengths_.size());
  for (uint32_t code = 0; code < table.numSymbols_; ++code) {
    LANCET_USER_CHECK(
        table.lengths_[code] >= 1 && table.lengths_[code] <= 8,
        "FSST symbol {} has invalid length {}",
        code,
        table.lengths_[code]);
  }
  return table;
}

FsstSymbolTable FsstSymbolTable::fromSymbols(
    const std::vector<std::string>& symbols) {
  LANCET_USER_CHECK_LE(symbols.size(), kMaxSymbols, "Too many FSST symbols");
  FsstSymbolTable table;
  table.numSymbols_ = symbols.size();
  for (size_t code = 0; code < symbols.size(); ++code) {
    const auto& symbol = symbols[code];
    LANCET_USER_CHECK(
        !symbol.empty() && symbol.size() <= 8,
        "FSST symbol '{}' must have 1 to 8 bytes",
        symbol);
    std::memcpy(&table.symbols_[code], symbol.data(), symbol.size());
    table.lengths_[code] = symbol.size();
  }
  return table;
}

std::string FsstSymbolTable::serialize() const {
  std::string result(kSerializedSize, '\0');
  const uint64_t header = numSymbols_;
  std::memcpy(result.data(), &header, sizeof(header));
  std::memcpy(result.data() + 8, symbols_.data(), symbols_.size() * 8);
  std::memcpy(
      result.data() + 8 + symbols_.size() * 8,
      lengths_.data(),
      lengths_.size());
  return result;
}

void FsstSymbolTable::decompress(std::string_view compressed, std::string& out)
    const {
  for (size_t i = 0; i < compressed.size(); ++i) {
    const auto code = static_cast<uint8_t>(compressed[i]);
    if (code == kEscapeCode) {
      if (++i == compressed.size()) {
        LANCET_CORRUPT_DATA("FSST value ends with an escape code");
      }
      out.push_back(compressed[i]);
    } else if (code < numSymbols_) {
      out.append(symbol(code));
    } else {
      LANCET_CORRUPT_DATA(
          "FSST code {} is outside the symbol table of {} symbols",
          code,
          numSymbols_);
    }
  }
}

FsstPageScheduler::FsstPageScheduler(
    PageSchedulerPtr inner,
    FsstSymbolTable symbolTable)
    : inner_(std::move(inner)),
      symbolTable_(
          std::make_shared<const FsstSymbolTable>(std::move(symbolTable))) {
  LANCET_CHECK_NOT_NULL(inner_);
}

folly::SemiFuture<PageDecoderPtr> FsstPageScheduler::scheduleRanges(
    const std::vector<RowRange>& ranges,
    const std::shared_ptr<EncodingsIo>& io,
    uint64_t topLevelRow) const {
  return inner_->scheduleRanges(ranges, io, topLevelRow)
      .deferValue(
          [symbolTable = symbolTable_](PageDecoderPtr inner) -> PageDecoderPtr {
            return std::make_unique<FsstPageDecoder>(
                std::move(inner), symbolTable);
          });
}

std::string FsstPageScheduler::toString() const {
  return fmt::format(
      "FsstPageScheduler{{numSymbols: {}, inner: {}}}",
      symbolTable_->numSymbols(),
      inner_->toString());
}

DataBlockPtr FsstPageDecoder::decode(uint64_t rowsToSkip, uint64_t numRows)
    const {
  auto compressed = inner_->decode(rowsToSkip, numRows);
  if (auto* nullable = compressed->as<NullableDataBlock>()) {
    auto values = decompress(
        nullable->data().asChecked<VariableWidthDataBlock>("FSST values"));
    return std::make_unique<NullableDataBlock>(
        std::move(values), nullable->nulls());
  }
  return decompress(
      compressed->asChecked<VariableWidthDataBlock>("FSST values"));
}

DataBlockPtr FsstPageDecoder::decompress(
    const VariableWidthDataBlock& compressed) const {
  const auto numValues = compressed.numValues();
  const auto bitsPerOffset = compressed.bitsPerOffset();
  auto offsets = allocateBuffer((numValues + 1) * bitsPerOffset / 8);
  std::string bytes;
  bytes.reserve(compressed.data()->size() * 2);
  for (uint64_t i = 0; i < numValues; ++i) {
    symbolTable_->decompress(compressed.valueAt(i), bytes);
    if (bitsPerOffset == 64) {
      reinterpret_cast<int64_t*>(offsets->mutable_data())[i + 1] = bytes.size();
    } else {
      if (bytes.size() >
          static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        LANCET_CORRUPT_DATA(
            "Decompressed FSST values do not fit 32-bit offsets");
      }
      reinterpret_cast<int32_t*>(offsets->mutable_data())[i + 1] = bytes.size();
    }
  }
  return std::make_unique<VariableWidthDataBlock>(
      std::move(offsets), copyBuffer(bytes), bitsPerOffset, numValues);
}

} // namespace facebook::lancet::encoding
