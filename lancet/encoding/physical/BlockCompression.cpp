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

#include "lancet/encoding/physical/BlockCompression.h"

#include <cstring>

#include <folly/lang/Bits.h>

#include "lancet/common/base/Exceptions.h"

namespace facebook::lancet::encoding {

BufferPtr compressBlock(const common::Codec& codec, const arrow::Buffer& input) {
  const uint64_t inputLength = input.size();
  const auto maxLength = codec.maxCompressedLength(inputLength);
  auto output = allocateBuffer(kCompressedLengthPrefixSize + maxLength);
  const uint64_t prefix = folly::Endian::little(inputLength);
  std::memcpy(output->mutable_data(), &prefix, sizeof(prefix));
  auto compressed = codec.compress(
      input.data(),
      inputLength,
      output->mutable_data() + kCompressedLengthPrefixSize,
      maxLength);
  if (compressed.hasError()) {
    LANCET_FAIL(
        "{} compression failed: {}", codec.name(), compressed.error().message());
  }
  const auto status = output->Resize(
      static_cast<int64_t>(kCompressedLengthPrefixSize + compressed.value()));
  LANCET_CHECK(status.ok(), "Resize failed: {}", status.ToString());
  return output;
}

BufferPtr decompressBlock(
    const common::Codec& codec,
    const arrow::Buffer& input,
    uint64_t maxDecompressedBytes) {
  if (static_cast<uint64_t>(input.size()) < kCompressedLengthPrefixSize) {
    LANCET_CORRUPT_DATA(
        "{} buffer of {} bytes is too short to hold its length prefix",
        codec.name(),
        input.size());
  }
  uint64_t prefix;
  std::memcpy(&prefix, input.data(), sizeof(prefix));
  const uint64_t uncompressedLength = folly::Endian::little(prefix);
  if (uncompressedLength > maxDecompressedBytes) {
    LANCET_CORRUPT_DATA(
        "{} buffer claims {} uncompressed bytes, more than the limit of {}",
        codec.name(),
        uncompressedLength,
        maxDecompressedBytes);
  }
  auto output = allocateBuffer(uncompressedLength);
  auto decompressed = codec.decompress(
      input.data() + kCompressedLengthPrefixSize,
      input.size() - kCompressedLengthPrefixSize,
      output->mutable_data(),
      uncompressedLength);
  if (decompressed.hasError()) {
    LANCET_CORRUPT_DATA("{}", decompressed.error().message());
  }
  if (decompressed.value() != uncompressedLength) {
    LANCET_CORRUPT_DATA(
        "{} buffer decompressed to {} bytes, expected {}",
        codec.name(),
        decompressed.value(),
        uncompressedLength);
  }
  return output;
}

} // namespace facebook::lancet::encoding
