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
#include "lancet/common/base/tests/GTestUtils.h"
#include "lancet/encoding/physical/BinaryEncoding.h"
#include "lancet/encoding/physical/ValueEncoding.h"
#include "lancet/encoding/tests/EncodingTestUtils.h"

#include <gtest/gtest.h>

namespace facebook::lancet::encoding {
namespace {

using namespace facebook::lancet::encoding::test;

FsstSymbolTable makeTable() {
  return FsstSymbolTable::fromSymbols({"http://", "www.", ".com", "e", "ab"});
}

TEST(FsstSymbolTableTest, serialize) {
  const auto table = makeTable();
  const auto serialized = table.serialize();
  EXPECT_EQ(serialized.size(), FsstSymbolTable::kSerializedSize);
  EXPECT_EQ(static_cast<uint8_t>(serialized[0]), 5);

  const auto parsed = FsstSymbolTable::parse(serialized);
  EXPECT_EQ(parsed.numSymbols(), 5u);
  EXPECT_EQ(parsed.symbol(0), "http://");
  EXPECT_EQ(parsed.symbol(2), ".com");
  EXPECT_EQ(parsed.symbol(4), "ab");
}

TEST(FsstSymbolTableTest, parseErrors) {
  LANCET_ASSERT_USER_THROW(
      FsstSymbolTable::parse("short"),
      "FSST symbol table has an unexpected size");

  auto serialized = makeTable().serialize();
  // Symbol 1 claims zero bytes.
  serialized[8 + 256 * 8 + 1] = 0;
  LANCET_ASSERT_USER_THROW(
      FsstSymbolTable::parse(serialized), "FSST symbol 1 has invalid length 0");
}

TEST(FsstSymbolTableTest, fromSymbolsErrors) {
  LANCET_ASSERT_USER_THROW(
      FsstSymbolTable::fromSymbols({"ok", ""}), "must have 1 to 8 bytes");
  LANCET_ASSERT_USER_THROW(
      FsstSymbolTable::fromSymbols({"ninebytes"}), "must have 1 to 8 bytes");
}

TEST(FsstSymbolTableTest, decompress) {
  const auto table = makeTable();
  for (const std::string value :
       {"http://www.example.com", "", "abe", "zzz", "http://"}) {
    std::string out;
    table.decompress(fsstCompress(table, value), out);
    EXPECT_EQ(out, value);
  }

  // Codes 0 and 2 around an escaped 'x'.
  std::string out = "prefix:";
  table.decompress(std::string("\x00\xffx\x02", 4), out);
  EXPECT_EQ(out, "prefix:http://x.com");
}

TEST(FsstSymbolTableTest, corruptInput) {
  const auto table = makeTable();
  std::string out;
  LANCET_ASSERT_RUNTIME_THROW(
      table.decompress("\x01\xff", out), "FSST value ends with an escape code");
  LANCET_ASSERT_RUNTIME_THROW(
      table.decompress("\x07", out),
      "FSST code 7 is outside the symbol table of 5 symbols");
}

class FsstPageSchedulerTest : public testing::Test {
 protected:
  void SetUp() override {
    values_ = {
        "http://www.facebook.com",
        "",
        "http://abc.com",
        "eee",
        "plain",
        "http://www.x.com"};
    std::vector<std::string> compressed;
    for (const auto& value : values_) {
      compressed.push_back(fsstCompress(table_, value));
    }
    const auto offsets = encodeEndOffsets(compressed);
    const auto bytes = concat(compressed);
    io_ = std::make_shared<RecordingEncodingsIo>(offsets + bytes);

    auto none = [] {
      return std::shared_ptr<const common::Codec>(
          common::createCodec(common::CompressionKind_NONE).value());
    };
    scheduler_ = std::make_unique<FsstPageScheduler>(
        std::make_unique<BinaryPageScheduler>(
            std::make_shared<ValuePageScheduler>(
                4, 0, offsets.size(), common::CompressionConfig{}, none(), 1 << 20),
            std::make_shared<ValuePageScheduler>(
                1,
                offsets.size(),
                bytes.size(),
                common::CompressionConfig{},
                none(),
                1 << 20),
            32,
            0),
        makeTable());
  }

  std::vector<std::string> decodeAll(
      const PageDecoder& decoder,
      uint64_t rowsToSkip,
      uint64_t numRows) const {
    auto block = decoder.decode(rowsToSkip, numRows);
    const auto& values = block->asChecked<VariableWidthDataBlock>("test");
    std::vector<std::string> result;
    for (uint64_t i = 0; i < values.numValues(); ++i) {
      result.emplace_back(values.valueAt(i));
    }
    return result;
  }

  const FsstSymbolTable table_ = makeTable();
  std::vector<std::string> values_;
  std::shared_ptr<RecordingEncodingsIo> io_;
  std::unique_ptr<FsstPageScheduler> scheduler_;
};

TEST_F(FsstPageSchedulerTest, decode) {
  auto decoder = schedule(*scheduler_, {{0, 6}}, io_);
  EXPECT_EQ(decodeAll(*decoder, 0, 6), values_);
  EXPECT_EQ(
      decodeAll(*decoder, 2, 2),
      std::vector<std::string>(values_.begin() + 2, values_.begin() + 4));
}

TEST_F(FsstPageSchedulerTest, ranges) {
  auto decoder = schedule(*scheduler_, {{1, 3}, {5, 6}}, io_);
  EXPECT_EQ(
      decodeAll(*decoder, 0, 3),
      std::vector<std::string>({values_[1], values_[2], values_[5]}));
}

TEST_F(FsstPageSchedulerTest, toString) {
  EXPECT_EQ(
      scheduler_->toString().rfind("FsstPageScheduler{numSymbols: 5, inner: "
                                   "BinaryPageScheduler{",
                                   0),
      0);
}

} // namespace
} // namespace facebook::lancet::encoding
