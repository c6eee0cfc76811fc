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

#include "lancet/common/compression/ZstdCompression.h"
#include "lancet/common/base/Exceptions.h"

#include <zstd.h>
#include <zstd_errors.h>

namespace facebook::lancet::common {
namespace {
constexpr int32_t kZstdDefaultCompressionLevel = 1;

Status zstdError(const char* prefixMessage, size_t errorCode) {
  return Status::IOError("{}{}", prefixMessage, ZSTD_getErrorName(errorCode));
}
} // namespace

class ZstdCodec : public Codec {
 public:
  explicit ZstdCodec(int32_t compressionLevel);

  uint64_t maxCompressedLength(uint64_t inputLength) const override;

  Expected<uint64_t> compress(
      const uint8_t* input,
      uint64_t inputLength,
      uint8_t* output,
      uint64_t outputLength) const override;

  Expected<uint64_t> decompress(
      const uint8_t* input,
      uint64_t inputLength,
      uint8_t* output,
      uint64_t outputLength) const override;

  int32_t compressionLevel() const override;

  CompressionKind compressionKind() const override;

  std::string_view name() const override;

 private:
  const int32_t compressionLevel_;
};

ZstdCodec::ZstdCodec(int32_t compressionLevel)
    : compressionLevel_(
          compressionLevel == kUseDefaultCompressionLevel
              ? kZstdDefaultCompressionLevel
              : compressionLevel) {}

uint64_t ZstdCodec::maxCompressedLength(uint64_t inputLength) const {
  return ZSTD_compressBound(inputLength);
}

Expected<uint64_t> ZstdCodec::compress(
    const uint8_t* input,
    uint64_t inputLength,
    uint8_t* output,
    uint64_t outputLength) const {
  LANCET_CHECK_NOT_NULL(output);

  auto compressedSize = ZSTD_compress(
      output, outputLength, input, inputLength, compressionLevel_);
  LANCET_RETURN_UNEXPECTED_IF(
      ZSTD_isError(compressedSize),
      zstdError("ZSTD compression failed: ", compressedSize));
  return compressedSize;
}

Expected<uint64_t> ZstdCodec::decompress(
    const uint8_t* input,
    uint64_t inputLength,
    uint8_t* output,
    uint64_t outputLength) const {
  LANCET_CHECK_NOT_NULL(input);

  auto decompressedSize =
      ZSTD_decompress(output, outputLength, input, inputLength);
  LANCET_RETURN_UNEXPECTED_IF(
      ZSTD_isError(decompressedSize),
      zstdError("ZSTD decompression failed: ", decompressedSize));
  return decompressedSize;
}

int32_t ZstdCodec::compressionLevel() const {
  return compressionLevel_;
}

CompressionKind ZstdCodec::compressionKind() const {
  return CompressionKind_ZSTD;
}

std::string_view ZstdCodec::name() const {
  return "zstd";
}

std::unique_ptr<Codec> makeZstdCodec(int32_t compressionLevel) {
  return std::make_unique<ZstdCodec>(compressionLevel);
}
} // namespace facebook::lancet::common
