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

#include "lancet/encoding/physical/BitpackEncoding.h"
#include "lancet/common/base/tests/GTestUtils.h"
#include "lancet/encoding/tests/EncodingTestUtils.h"

#include <gtest/gtest.h>

namespace facebook::lancet::encoding {
namespace {

using namespace facebook::lancet::encoding::test;

template <typename T>
std::vector<T> valuesOf(const DataBlock& block) {
  const auto& fixedWidth = block.asChecked<FixedWidthDataBlock>("test");
  EXPECT_EQ(fixedWidth.bitsPerValue(), sizeof(T) * 8);
  const auto* values = fixedWidth.rawValues<T>();
  return std::vector<T>(values, values + fixedWidth.numValues());
}

TEST(BitpackEncodingTest, loadPackedBits) {
  const auto packed = encodeBitpacked({5, 0, 7, 3, 6}, 3);
  const auto* data = reinterpret_cast<const uint8_t*>(packed.data());
  EXPECT_EQ(loadPackedBits(data, 0, 3), 5);
  EXPECT_EQ(loadPackedBits(data, 6, 3), 7);
  EXPECT_EQ(loadPackedBits(data, 12, 3), 6);

  const auto wide = encodeBitpacked({0x123456789abcdefULL, ~0ULL}, 64);
  EXPECT_EQ(
      loadPackedBits(reinterpret_cast<const uint8_t*>(wide.data()), 0, 64),
      0x123456789abcdefULL);
}

TEST(BitpackEncodingTest, signExtend) {
  EXPECT_EQ(signExtend(0b111, 3), -1);
  EXPECT_EQ(signExtend(0b011, 3), 3);
  EXPECT_EQ(signExtend(0x1ffff, 17), -1);
  EXPECT_EQ(signExtend(~0ULL, 64), -1);
}

TEST(BitpackEncodingTest, unsignedValues) {
  std::vector<uint64_t> values;
  for (uint64_t i = 0; i < 50; ++i) {
    values.push_back((i * 37) % 128);
  }
  auto io = std::make_shared<RecordingEncodingsIo>(encodeBitpacked(values, 7));
  BitpackedScheduler scheduler(7, 16, 0, false);

  auto decoder = schedule(scheduler, {{3, 10}, {40, 50}}, io);
  // Rows 3 to 9 are bits 21 to 69, bytes 2 to 8.
  EXPECT_EQ(io->requests()[0][0], common::Region(2, 7));
  std::vector<uint16_t> expected;
  for (auto i : {3, 4, 5, 6, 7, 8, 9, 40, 41, 42, 43, 44, 45, 46, 47, 48, 49}) {
    expected.push_back(values[i]);
  }
  EXPECT_EQ(valuesOf<uint16_t>(*decoder->decode(0, 17)), expected);
  EXPECT_EQ(
      valuesOf<uint16_t>(*decoder->decode(6, 2)),
      std::vector<uint16_t>({static_cast<uint16_t>(values[9]),
                             static_cast<uint16_t>(values[40])}));
}

TEST(BitpackEncodingTest, signedValues) {
  const std::vector<int32_t> values = {-5, 3, 0, -1, 7, -8, 2};
  std::vector<uint64_t> raw(values.begin(), values.end());
  auto io = std::make_shared<RecordingEncodingsIo>(encodeBitpacked(raw, 4));
  BitpackedScheduler scheduler(4, 32, 0, true);
  auto decoder = schedule(scheduler, {{0, 7}}, io);
  EXPECT_EQ(valuesOf<int32_t>(*decoder->decode(0, 7)), values);
}

TEST(BitpackEncodingTest, wideValues) {
  const std::vector<uint64_t> values = {
      (1ULL << 40) + 3, 17, (1ULL << 47) - 1, 0};
  auto io = std::make_shared<RecordingEncodingsIo>(encodeBitpacked(values, 48));
  BitpackedScheduler scheduler(48, 64, 0, false);
  auto decoder = schedule(scheduler, {{1, 4}}, io);
  EXPECT_EQ(
      valuesOf<uint64_t>(*decoder->decode(0, 3)),
      std::vector<uint64_t>(values.begin() + 1, values.end()));
}

TEST(BitpackEncodingTest, nonNegative) {
  const std::vector<uint64_t> values = {1, 2, 3, 255, 128, 0};
  auto io = std::make_shared<RecordingEncodingsIo>(
      "xx" + encodeBitpacked(values, 8));
  BitpackedForNonNegScheduler scheduler(8, 32, 2);
  EXPECT_FALSE(scheduler.isSigned());
  auto decoder = schedule(scheduler, {{2, 6}}, io);
  EXPECT_EQ(
      valuesOf<uint32_t>(*decoder->decode(0, 4)),
      std::vector<uint32_t>({3, 255, 128, 0}));
  EXPECT_EQ(
      scheduler.toString(),
      "BitpackedForNonNegScheduler{compressedBits: 8, uncompressedBits: 32, bufferOffset: 2, signed: false}");
}

TEST(BitpackEncodingTest, invalidWidths) {
  LANCET_ASSERT_USER_THROW(
      BitpackedScheduler(3, 12, 0, false), "cannot widen values to 12 bits");
  LANCET_ASSERT_USER_THROW(
      BitpackedScheduler(0, 32, 0, false), "must be between 1 and 32");
  LANCET_ASSERT_USER_THROW(
      BitpackedScheduler(33, 32, 0, false), "must be between 1 and 32");
}

TEST(BitpackEncodingTest, truncatedChunk) {
  std::vector<PackedChunk> chunks;
  chunks.push_back(PackedChunk{copyBuffer(std::string(3, '\0')), 0, 2});
  BitpackedPageDecoder decoder(16, 16, false, std::move(chunks));
  LANCET_ASSERT_THROW_CODE(decoder.decode(0, 2), error_code::kCorruptData);
}

TEST(BitpackEncodingTest, readPastScheduledRows) {
  auto io = std::make_shared<RecordingEncodingsIo>(std::string(4, '\0'));
  BitpackedScheduler scheduler(16, 16, 0, false);
  auto decoder = schedule(scheduler, {{0, 2}}, io);
  LANCET_ASSERT_THROW(
      decoder->decode(0, 3), "Read past the scheduled bit packed ranges");
}

} // namespace
} // namespace facebook::lancet::encoding
