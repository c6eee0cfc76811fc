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
#include "lancet/common/base/BitUtil.h"
#include "lancet/common/base/tests/GTestUtils.h"
#include "lancet/encoding/physical/BasicEncoding.h"
#include "lancet/encoding/physical/BinaryEncoding.h"
#include "lancet/encoding/physical/BitmapEncoding.h"
#include "lancet/encoding/physical/ValueEncoding.h"
#include "lancet/encoding/tests/EncodingTestUtils.h"

#include <algorithm>

#include <gtest/gtest.h>

namespace facebook::lancet::encoding {
namespace {

using namespace facebook::lancet::encoding::test;

std::unique_ptr<ValuePageScheduler> valueScheduler(
    uint64_t bytesPerValue,
    uint64_t offset,
    uint64_t size) {
  return std::make_unique<ValuePageScheduler>(
      bytesPerValue,
      offset,
      size,
      common::CompressionConfig{},
      common::createCodec(common::CompressionKind_NONE).value(),
      1 << 20);
}

std::vector<int32_t> intsOf(const DataBlock& block) {
  const auto& values = block.asChecked<FixedWidthDataBlock>("test");
  EXPECT_EQ(values.bitsPerValue(), 32);
  return std::vector<int32_t>(
      values.rawValues<int32_t>(),
      values.rawValues<int32_t>() + values.numValues());
}

class DictionaryEncodingTest : public testing::Test {
 protected:
  void SetUp() override {
    indicesOffset_ = append(toBytes(std::vector<uint8_t>{2, 0, 1, 2, 2, 0}));
    itemsOffset_ = append(toBytes(std::vector<int32_t>{100, 200, 300}));
    validityOffset_ =
        append(encodeBitmap({true, false, true, true, false, true}));
    const std::vector<std::string> strings = {"red", "green", "blue"};
    stringOffsetsOffset_ = append(encodeEndOffsets(strings));
    stringBytesOffset_ = append(concat(strings));
    io_ = std::make_shared<RecordingEncodingsIo>(image_);
  }

  uint64_t append(const std::string& bytes) {
    const auto offset = image_.size();
    image_ += bytes;
    return offset;
  }

  std::shared_ptr<const PageScheduler> indices() const {
    return valueScheduler(1, indicesOffset_, 6);
  }

  std::shared_ptr<const PageScheduler> intItems() const {
    return valueScheduler(4, itemsOffset_, 12);
  }

  std::shared_ptr<const PageScheduler> stringItems() const {
    return std::make_shared<BinaryPageScheduler>(
        valueScheduler(4, stringOffsetsOffset_, 12),
        valueScheduler(1, stringBytesOffset_, 12),
        32,
        0);
  }

  bool requested(const common::Region& region) const {
    for (const auto& request : io_->requests()) {
      if (std::find(request.begin(), request.end(), region) != request.end()) {
        return true;
      }
    }
    return false;
  }

  std::string image_;
  uint64_t indicesOffset_;
  uint64_t itemsOffset_;
  uint64_t validityOffset_;
  uint64_t stringOffsetsOffset_;
  uint64_t stringBytesOffset_;
  std::shared_ptr<RecordingEncodingsIo> io_;
};

TEST_F(DictionaryEncodingTest, decodeValues) {
  DictionaryPageScheduler scheduler(indices(), intItems(), 3, true);
  auto decoder = schedule(scheduler, {{0, 6}}, io_);
  EXPECT_EQ(
      intsOf(*decoder->decode(0, 6)),
      std::vector<int32_t>({300, 100, 200, 300, 300, 100}));
  EXPECT_TRUE(requested({indicesOffset_, 6}));
  EXPECT_TRUE(requested({itemsOffset_, 12}));
}

TEST_F(DictionaryEncodingTest, subRanges) {
  DictionaryPageScheduler scheduler(indices(), intItems(), 3, true);
  auto decoder = schedule(scheduler, {{1, 3}, {4, 6}}, io_);
  // The whole dictionary is read even for a few rows.
  EXPECT_TRUE(requested({itemsOffset_, 12}));
  EXPECT_EQ(
      intsOf(*decoder->decode(0, 4)),
      std::vector<int32_t>({100, 200, 300, 100}));
  EXPECT_EQ(
      intsOf(*decoder->decode(1, 2)), std::vector<int32_t>({200, 300}));
}

TEST_F(DictionaryEncodingTest, keepIndices) {
  DictionaryPageScheduler scheduler(indices(), intItems(), 3, false);
  auto decoder = schedule(scheduler, {{0, 6}}, io_);
  auto block = decoder->decode(2, 3);
  const auto& dictionary = block->asChecked<DictionaryDataBlock>("test");
  EXPECT_EQ(dictionary.numValues(), 3);
  const auto& keys =
      dictionary.indices().asChecked<FixedWidthDataBlock>("test");
  EXPECT_EQ(keys.bitsPerValue(), 8);
  EXPECT_EQ(keys.rawValues<uint8_t>()[0], 1);
  EXPECT_EQ(keys.rawValues<uint8_t>()[2], 2);
  EXPECT_EQ(
      intsOf(dictionary.dictionary()), std::vector<int32_t>({100, 200, 300}));
}

TEST_F(DictionaryEncodingTest, stringItems) {
  DictionaryPageScheduler scheduler(indices(), stringItems(), 3, true);
  auto decoder = schedule(scheduler, {{0, 6}}, io_);
  auto block = decoder->decode(0, 6);
  const auto& values = block->asChecked<VariableWidthDataBlock>("test");
  const std::vector<std::string> expected = {
      "blue", "red", "green", "blue", "blue", "red"};
  ASSERT_EQ(values.numValues(), expected.size());
  for (size_t i = 0; i < expected.size(); ++i) {
    EXPECT_EQ(values.valueAt(i), expected[i]);
  }
}

TEST_F(DictionaryEncodingTest, nullableIndices) {
  std::shared_ptr<const PageScheduler> nullableIndices =
      BasicPageScheduler::makeNullable(
          std::make_unique<DenseBitmapScheduler>(validityOffset_),
          valueScheduler(1, indicesOffset_, 6));
  DictionaryPageScheduler scheduler(nullableIndices, intItems(), 3, true);
  auto decoder = schedule(scheduler, {{0, 6}}, io_);
  auto block = decoder->decode(0, 6);
  const auto& nullable = block->asChecked<NullableDataBlock>("test");
  const auto values = intsOf(nullable.data());
  const std::vector<bool> valid = {true, false, true, true, false, true};
  for (size_t i = 0; i < valid.size(); ++i) {
    EXPECT_EQ(nullable.isValid(i), valid[i]) << i;
  }
  EXPECT_EQ(values[0], 300);
  EXPECT_EQ(values[2], 200);
  EXPECT_EQ(values[5], 100);
}

TEST_F(DictionaryEncodingTest, indexOutOfRange) {
  // Only two items although the indices reach 2.
  DictionaryPageScheduler scheduler(
      indices(), valueScheduler(4, itemsOffset_, 8), 2, true);
  auto decoder = schedule(scheduler, {{0, 6}}, io_);
  LANCET_ASSERT_RUNTIME_THROW(
      decoder->decode(0, 6),
      "Dictionary index 2 at row 0 is outside the 2 dictionary items");
}

TEST_F(DictionaryEncodingTest, toString) {
  DictionaryPageScheduler scheduler(indices(), intItems(), 3, false);
  EXPECT_EQ(
      scheduler.toString().rfind(
          "DictionaryPageScheduler{numDictionaryItems: 3, shouldDecodeDict: false, indices: ValuePageScheduler{",
          0),
      0);
}

TEST(TakeRowsTest, nullableItems) {
  auto nulls = allocateBuffer(1);
  bits::setBit(nulls->mutable_data(), 0);
  bits::setBit(nulls->mutable_data(), 2);
  NullableDataBlock items(
      std::make_unique<FixedWidthDataBlock>(
          copyBuffer(toBytes(std::vector<int32_t>{10, -1, 30})), 32, 3),
      std::move(nulls));

  auto block = takeRows(items, {2, 1, 0, 2}, nullptr);
  const auto& nullable = block->asChecked<NullableDataBlock>("test");
  EXPECT_TRUE(nullable.isValid(0));
  EXPECT_FALSE(nullable.isValid(1));
  EXPECT_TRUE(nullable.isValid(2));
  EXPECT_TRUE(nullable.isValid(3));
  const auto values = intsOf(nullable.data());
  EXPECT_EQ(values[0], 30);
  EXPECT_EQ(values[2], 10);
  EXPECT_EQ(values[3], 30);
}

TEST(TakeRowsTest, bits) {
  FixedWidthDataBlock items(copyBuffer(encodeBitmap({true, false})), 1, 2);
  auto block = takeRows(items, {1, 1, 0, 1, 0}, nullptr);
  const auto& bitmap = block->asChecked<FixedWidthDataBlock>("test");
  EXPECT_EQ(bitmap.bitsPerValue(), 1);
  const std::vector<bool> expected = {false, false, true, false, true};
  for (size_t i = 0; i < expected.size(); ++i) {
    EXPECT_EQ(bits::isBitSet(bitmap.data()->data(), i), expected[i]) << i;
  }
}

TEST(TakeRowsTest, allNullItems) {
  AllNullDataBlock items(4);
  auto block = takeRows(items, {3, 0}, nullptr);
  EXPECT_EQ(block->kind(), DataBlockKind::kAllNull);
  EXPECT_EQ(block->numValues(), 2);
}

} // namespace
} // namespace facebook::lancet::encoding
