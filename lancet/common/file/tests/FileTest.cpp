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

#include "lancet/common/file/File.h"
#include "lancet/common/base/tests/GTestUtils.h"

#include <fstream>

#include <gtest/gtest.h>

namespace facebook::lancet {
namespace {

TEST(InMemoryReadFileTest, pread) {
  const std::string bytes = "hello world";
  InMemoryReadFile file(bytes);
  EXPECT_EQ(file.size(), bytes.size());
  EXPECT_EQ(file.pread(6, 5), "world");
  EXPECT_EQ(file.pread(0, 0), "");
  EXPECT_EQ(file.bytesRead(), 5);
}

TEST(InMemoryReadFileTest, readPastEnd) {
  const std::string bytes = "hello";
  InMemoryReadFile file(bytes);
  LANCET_ASSERT_THROW_CODE(file.pread(3, 5), error_code::kIoError);
}

TEST(LocalReadFileTest, pread) {
  const auto path = ::testing::TempDir() + "/lancet_local_read_file";
  {
    std::ofstream out(path, std::ios::binary);
    out << "0123456789";
  }
  LocalReadFile file(path);
  EXPECT_EQ(file.size(), 10);
  EXPECT_EQ(file.pread(2, 3), "234");
  LANCET_ASSERT_THROW_CODE(file.pread(8, 5), error_code::kIoError);
}

TEST(LocalReadFileTest, missingFile) {
  LANCET_ASSERT_THROW_CODE(
      LocalReadFile("/nonexistent/lancet/file"), error_code::kIoError);
}

} // namespace
} // namespace facebook::lancet
