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

#include "lancet/common/compression/Compression.h"

#include <cstring>
#include <unordered_map>

#include "lancet/common/base/Exceptions.h"
#include "lancet/common/compression/ZstdCompression.h"

namespace facebook::lancet::common {
namespace {

/// Passes bytes through unchanged. Used for the "none" scheme so that every
/// value buffer goes through the same codec contract.
class IdentityCodec : public Codec {
 public:
  uint64_t maxCompressedLength(uint64_t inputLength) const override {
    return inputLength;
  }

  Expected<uint64_t> compress(
      const uint8_t* input,
      uint64_t inputLength,
      uint8_t* output,
      uint64_t outputLength) const override {
    return copy(input, inputLength, output, outputLength);
  }

  Expected<uint64_t> decompress(
      const uint8_t* input,
      uint64_t inputLength,
      uint8_t* output,
      uint64_t outputLength) const override {
    return copy(input, inputLength, output, outputLength);
  }

  int32_t compressionLevel() const override {
    return kUseDefaultCompressionLevel;
  }

  CompressionKind compressionKind() const override {
    return CompressionKind_NONE;
  }

  std::string_view name() const override {
    return "none";
  }

 private:
  static Expected<uint64_t> copy(
      const uint8_t* input,
      uint64_t inputLength,
      uint8_t* output,
      uint64_t outputLength) {
    LANCET_RETURN_UNEXPECTED_IF(
        outputLength < inputLength,
        Status::IOError(
            "Output buffer too small: {} < {}", outputLength, inputLength));
    if (inputLength > 0) {
      std::memcpy(output, input, inputLength);
    }
    return inputLength;
  }
};

} // namespace

std::string compressionKindToString(CompressionKind kind) {
  switch (static_cast<int64_t>(kind)) {
    case CompressionKind_NONE:
      return "none";
    case CompressionKind_ZSTD:
      return "zstd";
    case CompressionKind_FSST:
      return "fsst";
  }
  return fmt::format("unknown - {}", static_cast<int64_t>(kind));
}

CompressionKind stringToCompressionKind(std::string_view kind) {
  static const std::unordered_map<std::string_view, CompressionKind>
      stringToCompressionKindMap = {
          {"", CompressionKind_NONE},
          {"none", CompressionKind_NONE},
          {"zstd", CompressionKind_ZSTD},
          {"fsst", CompressionKind_FSST}};
  auto iter = stringToCompressionKindMap.find(kind);
  if (iter != stringToCompressionKindMap.end()) {
    return iter->second;
  }
  LANCET_UNSUPPORTED("Unsupported compression scheme: '{}'", kind);
}

std::string CompressionConfig::toString() const {
  if (!level.has_value()) {
    return compressionKindToString(kind);
  }
  return fmt::format("{}(level={})", compressionKindToString(kind), *level);
}

std::string Codec::toString() const {
  if (compressionLevel() == kUseDefaultCompressionLevel) {
    return std::string(name());
  }
  return fmt::format("{}(level={})", name(), compressionLevel());
}

Expected<std::unique_ptr<Codec>> createCodec(
    CompressionKind kind,
    int32_t compressionLevel) {
  switch (static_cast<int64_t>(kind)) {
    case CompressionKind_NONE:
      return std::unique_ptr<Codec>(std::make_unique<IdentityCodec>());
    case CompressionKind_ZSTD:
      return makeZstdCodec(compressionLevel);
    default:
      break;
  }
  return folly::makeUnexpected(Status::NotImplemented(
      "No block codec for compression scheme '{}'",
      compressionKindToString(kind)));
}

} // namespace facebook::lancet::common
