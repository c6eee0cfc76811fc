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

#include "lancet/encoding/DecoderOptions.h"

#include <gflags/gflags.h>
#include <gtest/gtest.h>

#include "lancet/common/base/tests/GTestUtils.h"
#include "lancet/common/config/ConfigBase.h"

namespace facebook::lancet::encoding {
namespace {

TEST(DecoderOptionsTest, defaultsFromFlags) {
  DecoderOptions options;
  EXPECT_FALSE(options.validateOnDecode);
  EXPECT_EQ(options.maxDecompressedPageBytes, 1UL << 30);
  EXPECT_EQ(options.maxCoalesceDistanceBytes, 512 << 10);

  gflags::FlagSaver flagSaver;
  FLAGS_lancet_validate_on_decode = true;
  FLAGS_lancet_max_coalesce_distance_bytes = 0;
  DecoderOptions fromFlags;
  EXPECT_TRUE(fromFlags.validateOnDecode);
  EXPECT_EQ(fromFlags.maxCoalesceDistanceBytes, 0);
}

TEST(DecoderOptionsTest, fromConfig) {
  const config::ConfigBase config(
      {{DecoderOptions::kValidateOnDecode, "true"},
       {DecoderOptions::kMaxDecompressedPageBytes, "4096"}});
  const auto options = DecoderOptions::fromConfig(config);
  EXPECT_TRUE(options.validateOnDecode);
  EXPECT_EQ(options.maxDecompressedPageBytes, 4096);
  // Absent keys keep the flag value.
  EXPECT_EQ(
      options.maxCoalesceDistanceBytes,
      FLAGS_lancet_max_coalesce_distance_bytes);
}

TEST(DecoderOptionsTest, badConfigValue) {
  const config::ConfigBase config(
      {{DecoderOptions::kMaxCoalesceDistanceBytes, "near"}});
  LANCET_ASSERT_USER_THROW(
      DecoderOptions::fromConfig(config),
      "Invalid value 'near' for config 'io.max-coalesce-distance-bytes'");

  const config::ConfigBase flag(
      {{DecoderOptions::kValidateOnDecode, "sometimes"}});
  LANCET_ASSERT_THROW_CODE(
      DecoderOptions::fromConfig(flag), error_code::kInvalidArgument);
}

} // namespace
} // namespace facebook::lancet::encoding
