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

#include <array>

#include "lancet/encoding/PageScheduler.h"

namespace facebook::lancet::encoding {

/// Static symbol table of an FSST page. Serialized as an 8-byte
/// little-endian header whose low byte is the symbol count, followed by
/// kMaxSymbols 8-byte symbols and kMaxSymbols symbol lengths. Codes below
/// the symbol count expand to their symbol; kEscapeCode is followed by one
/// literal byte.
class FsstSymbolTable {
 public:
  static constexpr uint32_t kMaxSymbols = 255;
  static constexpr uint8_t kEscapeCode = 255;
  static constexpr uint64_t kSerializedSize =
      8 + (kMaxSymbols + 1) * 8 + (kMaxSymbols + 1);

  /// Throws a user error when 'serialized' is not a well-formed table.
  static FsstSymbolTable parse(std::string_view serialized);

  /// Builds a table from 'symbols', each of 1 to 8 bytes.
  static FsstSymbolTable fromSymbols(const std::vector<std::string>& symbols);

  std::string serialize() const;

  uint32_t numSymbols() const {
    return numSymbols_;
  }

  std::string_view symbol(uint8_t code) const {
    return std::string_view(
        reinterpret_cast<const char*>(&symbols_[code]), lengths_[code]);
  }

  /// Appends the expansion of 'compressed' to 'out'. Throws corrupt-data
  /// on an unknown code or a dangling escape.
  void decompress(std::string_view compressed, std::string& out) const;

 private:
  FsstSymbolTable() = default;

  uint32_t numSymbols_{0};
  std::array<uint64_t, kMaxSymbols + 1> symbols_{};
  std::array<uint8_t, kMaxSymbols + 1> lengths_{};
};

/// Binary values compressed with a per-page FSST symbol table. The inner
/// scheduler reads the compressed values; decode() expands them.
class FsstPageScheduler : public PageScheduler {
 public:
  FsstPageScheduler(PageSchedulerPtr inner, FsstSymbolTable symbolTable);

  folly::SemiFuture<PageDecoderPtr> scheduleRanges(
      const std::vector<RowRange>& ranges,
      const std::shared_ptr<EncodingsIo>& io,
      uint64_t topLevelRow) const override;

  std::string toString() const override;

 private:
  const PageSchedulerPtr inner_;
  const std::shared_ptr<const FsstSymbolTable> symbolTable_;
};

class FsstPageDecoder : public PageDecoder {
 public:
  FsstPageDecoder(
      PageDecoderPtr inner,
      std::shared_ptr<const FsstSymbolTable> symbolTable)
      : inner_(std::move(inner)), symbolTable_(std::move(symbolTable)) {}

  DataBlockPtr decode(uint64_t rowsToSkip, uint64_t numRows) const override;

 private:
  DataBlockPtr decompress(const VariableWidthDataBlock& compressed) const;

  const PageDecoderPtr inner_;
  const std::shared_ptr<const FsstSymbolTable> symbolTable_;
};

} // namespace facebook::lancet::encoding
