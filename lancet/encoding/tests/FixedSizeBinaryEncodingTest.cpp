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

#include "lancet/encoding/physical/FixedSizeBinaryEncoding.h"
#include "lancet/common/base/tests/GTestUtils.h"
#include "lancet/encoding/physical/BasicEncoding.h"
#include "lancet/encoding/physical/BitmapEncoding.h"
#include "lancet/encoding/physical/ValueEncoding.h"
#include "lancet/encoding/tests/EncodingTestUtils.h"

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

class FixedSizeBinaryEncodingTest : public testing::Test {
 protected:
  void SetUp() override {
    validity_ = encodeBitmap({true, true, false, true, true});
    io_ = std::make_shared<RecordingEncodingsIo>(
        std::string("abcdefghijklmno") + validity_);
  }

  std::string validity_;
  std::shared_ptr<RecordingEncodingsIo> io_;
};

TEST_F(FixedSizeBinaryEncodingTest, decode) {
  FixedSizeBinaryPageScheduler scheduler(valueScheduler(3, 0, 15), 3, 4);
  auto decoder = schedule(scheduler, {{1, 4}}, io_);
  EXPECT_EQ(io_->requests()[0], std::vector<common::Region>({{3, 9}}));

  auto block = decoder->decode(0, 3);
  const auto& values = block->asChecked<VariableWidthDataBlock>("test");
  EXPECT_EQ(values.bitsPerOffset(), 32);
  ASSERT_EQ(values.numValues(), 3);
  EXPECT_EQ(values.valueAt(0), "def");
  EXPECT_EQ(values.valueAt(1), "ghi");
  EXPECT_EQ(values.valueAt(2), "jkl");

  block = decoder->decode(2, 1);
  EXPECT_EQ(
      block->asChecked<VariableWidthDataBlock>("test").valueAt(0), "jkl");
}

TEST_F(FixedSizeBinaryEncodingTest, largeOffsets) {
  FixedSizeBinaryPageScheduler scheduler(valueScheduler(5, 0, 15), 5, 8);
  auto decoder = schedule(scheduler, {{0, 3}}, io_);
  auto block = decoder->decode(0, 3);
  const auto& values = block->asChecked<VariableWidthDataBlock>("test");
  EXPECT_EQ(values.bitsPerOffset(), 64);
  EXPECT_EQ(values.offsetAt(3), 15);
  EXPECT_EQ(values.valueAt(1), "fghij");
}

TEST_F(FixedSizeBinaryEncodingTest, nullable) {
  FixedSizeBinaryPageScheduler scheduler(
      BasicPageScheduler::makeNullable(
          std::make_unique<DenseBitmapScheduler>(15), valueScheduler(3, 0, 15)),
      3,
      4);
  auto decoder = schedule(scheduler, {{0, 5}}, io_);
  auto block = decoder->decode(0, 5);
  const auto& nullable = block->asChecked<NullableDataBlock>("test");
  EXPECT_TRUE(nullable.isValid(1));
  EXPECT_FALSE(nullable.isValid(2));
  const auto& values =
      nullable.data().asChecked<VariableWidthDataBlock>("test");
  EXPECT_EQ(values.valueAt(4), "mno");
}

TEST_F(FixedSizeBinaryEncodingTest, widthMismatch) {
  FixedSizeBinaryPageScheduler scheduler(valueScheduler(3, 0, 15), 4, 4);
  auto decoder = schedule(scheduler, {{0, 2}}, io_);
  LANCET_ASSERT_THROW_CODE(decoder->decode(0, 2), error_code::kCorruptData);
}

TEST_F(FixedSizeBinaryEncodingTest, toString) {
  FixedSizeBinaryPageScheduler scheduler(valueScheduler(3, 0, 15), 3, 4);
  EXPECT_EQ(
      scheduler.toString().rfind(
          "FixedSizeBinaryPageScheduler{byteWidth: 3, bytesPerOffset: 4, bytes: ValuePageScheduler{",
          0),
      0);
}

} // namespace
} // namespace facebook::lancet::encoding
