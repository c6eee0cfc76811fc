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

#include "lancet/encoding/physical/BasicEncoding.h"
#include "lancet/encoding/physical/BitmapEncoding.h"
#include "lancet/encoding/physical/ValueEncoding.h"
#include "lancet/encoding/tests/EncodingTestUtils.h"

#include <gtest/gtest.h>

namespace facebook::lancet::encoding {
namespace {

using namespace facebook::lancet::encoding::test;

constexpr uint64_t kNumRows = 128;

class BasicEncodingTest : public testing::Test {
 protected:
  void SetUp() override {
    std::vector<bool> validity;
    std::vector<int64_t> values;
    for (uint64_t i = 0; i < kNumRows; ++i) {
      validity.push_back(i % 2 == 0);
      // Rows with a null get a marker that must never surface.
      values.push_back(i % 2 == 0 ? static_cast<int64_t>(i * 10) : -999);
    }
    validityBytes_ = encodeBitmap(validity);
    image_ = validityBytes_ + toBytes(values);
    io_ = std::make_shared<RecordingEncodingsIo>(image_);
  }

  PageSchedulerPtr values() const {
    return std::make_unique<ValuePageScheduler>(
        8,
        validityBytes_.size(),
        kNumRows * 8,
        common::CompressionConfig{},
        common::createCodec(common::CompressionKind_NONE).value(),
        1 << 20);
  }

  std::string validityBytes_;
  std::string image_;
  std::shared_ptr<RecordingEncodingsIo> io_;
};

TEST_F(BasicEncodingTest, someNullsAlternating) {
  auto scheduler = BasicPageScheduler::makeNullable(
      std::make_unique<DenseBitmapScheduler>(0), values());
  auto decoder = schedule(*scheduler, {{0, kNumRows}}, io_);
  auto block = decoder->decode(0, kNumRows);

  const auto& nullable = block->asChecked<NullableDataBlock>("test");
  ASSERT_EQ(nullable.numValues(), kNumRows);
  const auto& data = nullable.data().asChecked<FixedWidthDataBlock>("test");
  for (uint64_t i = 0; i < kNumRows; ++i) {
    if (i % 2 == 0) {
      ASSERT_TRUE(nullable.isValid(i)) << i;
      EXPECT_EQ(data.rawValues<int64_t>()[i], i * 10);
    } else {
      EXPECT_FALSE(nullable.isValid(i)) << i;
    }
  }
}

TEST_F(BasicEncodingTest, someNullsSubRange) {
  auto scheduler = BasicPageScheduler::makeNullable(
      std::make_unique<DenseBitmapScheduler>(0), values());
  auto decoder = schedule(*scheduler, {{101, 111}}, io_);
  auto block = decoder->decode(2, 5);
  const auto& nullable = block->asChecked<NullableDataBlock>("test");
  const auto& data = nullable.data().asChecked<FixedWidthDataBlock>("test");
  ASSERT_EQ(nullable.numValues(), 5);
  // Row 103 is first: odd rows are null.
  for (uint64_t i = 0; i < 5; ++i) {
    const auto row = 103 + i;
    EXPECT_EQ(nullable.isValid(i), row % 2 == 0) << row;
    if (row % 2 == 0) {
      EXPECT_EQ(data.rawValues<int64_t>()[i], row * 10);
    }
  }
  // One request for the validity bitmap and one for the values.
  EXPECT_EQ(io_->requests().size(), 2);
}

TEST_F(BasicEncodingTest, noNulls) {
  auto scheduler = BasicPageScheduler::makeNonNullable(values());
  EXPECT_EQ(scheduler->nullability(), BasicPageScheduler::Nullability::kNoNulls);
  auto decoder = schedule(*scheduler, {{4, 6}}, io_);
  auto block = decoder->decode(0, 2);
  const auto& data = block->asChecked<FixedWidthDataBlock>("test");
  EXPECT_EQ(data.rawValues<int64_t>()[0], 40);
  EXPECT_EQ(data.rawValues<int64_t>()[1], -999);
}

TEST_F(BasicEncodingTest, allNullsReadsNothing) {
  auto scheduler = BasicPageScheduler::makeAllNull();
  auto decoder = schedule(*scheduler, {{0, 1000}}, io_);
  EXPECT_TRUE(io_->requests().empty());
  auto block = decoder->decode(10, 25);
  EXPECT_EQ(block->kind(), DataBlockKind::kAllNull);
  EXPECT_EQ(block->numValues(), 25);
  EXPECT_EQ(scheduler->toString(), "BasicPageScheduler{ALL_NULLS}");
}

TEST_F(BasicEncodingTest, toString) {
  auto scheduler = BasicPageScheduler::makeNullable(
      std::make_unique<DenseBitmapScheduler>(0), values());
  EXPECT_EQ(
      scheduler->toString(),
      "BasicPageScheduler{SOME_NULLS, validity: DenseBitmapScheduler{bufferOffset: 0}, "
      "values: ValuePageScheduler{bytesPerValue: 8, bufferOffset: 16, bufferSize: 1024, compression: none}}");
}

} // namespace
} // namespace facebook::lancet::encoding
