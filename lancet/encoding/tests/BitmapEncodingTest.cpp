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

#include "lancet/encoding/physical/BitmapEncoding.h"
#include "lancet/common/base/BitUtil.h"
#include "lancet/encoding/tests/EncodingTestUtils.h"

#include <gtest/gtest.h>

namespace facebook::lancet::encoding {
namespace {

using namespace facebook::lancet::encoding::test;

std::string bitsOf(const DataBlock& block) {
  const auto& bitmap = block.asChecked<FixedWidthDataBlock>("test");
  EXPECT_EQ(bitmap.bitsPerValue(), 1);
  return bits::toString(bitmap.data()->data(), 0, bitmap.numValues());
}

std::string expectedBits(
    const std::vector<bool>& bools,
    uint64_t begin,
    uint64_t end) {
  std::string result;
  for (auto i = begin; i < end; ++i) {
    result.push_back(bools[i] ? '1' : '0');
  }
  return result;
}

class BitmapEncodingTest : public testing::Test {
 protected:
  void SetUp() override {
    for (int i = 0; i < 70; ++i) {
      bools_.push_back(i % 3 == 0 || i % 7 == 0);
    }
    io_ = std::make_shared<RecordingEncodingsIo>("pad" + encodeBitmap(bools_));
  }

  std::vector<bool> bools_;
  std::shared_ptr<RecordingEncodingsIo> io_;
};

TEST_F(BitmapEncodingTest, unalignedRange) {
  DenseBitmapScheduler scheduler(3);
  auto decoder = schedule(scheduler, {{5, 21}}, io_);
  // Bits 5 to 20 live in bytes 0 to 2.
  EXPECT_EQ(io_->requests()[0], std::vector<common::Region>({{3, 3}}));
  EXPECT_EQ(bitsOf(*decoder->decode(0, 16)), expectedBits(bools_, 5, 21));
  EXPECT_EQ(bitsOf(*decoder->decode(3, 10)), expectedBits(bools_, 8, 18));
}

TEST_F(BitmapEncodingTest, multipleRanges) {
  DenseBitmapScheduler scheduler(3);
  auto decoder = schedule(scheduler, {{0, 3}, {17, 17}, {60, 70}}, io_);
  EXPECT_EQ(
      bitsOf(*decoder->decode(0, 13)),
      expectedBits(bools_, 0, 3) + expectedBits(bools_, 60, 70));
  EXPECT_EQ(
      bitsOf(*decoder->decode(2, 3)),
      expectedBits(bools_, 2, 3) + expectedBits(bools_, 60, 62));
}

TEST_F(BitmapEncodingTest, toString) {
  EXPECT_EQ(
      DenseBitmapScheduler(42).toString(),
      "DenseBitmapScheduler{bufferOffset: 42}");
}

} // namespace
} // namespace facebook::lancet::encoding
