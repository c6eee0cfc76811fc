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

#pragma once

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "lancet/common/base/Status.h"

namespace facebook::lancet::common {

enum CompressionKind {
  CompressionKind_NONE = 0,
  CompressionKind_ZSTD = 1,
  /// Known to the descriptor format but implemented as an array encoding,
  /// not as a block codec.
  CompressionKind_FSST = 2,
  CompressionKind_MAX = INT64_MAX
};

/// Returns the scheme name as written into encoding descriptors, e.g. "zstd".
std::string compressionKindToString(CompressionKind kind);

/// Parses a scheme name from an encoding descriptor. An empty name means no
/// compression. Throws a user error for names this build does not know.
CompressionKind stringToCompressionKind(std::string_view kind);

constexpr int32_t kUseDefaultCompressionLevel =
    std::numeric_limits<int32_t>::min();

/// Compression scheme and level as carried by an encoding descriptor.
struct CompressionConfig {
  CompressionKind kind{CompressionKind_NONE};
  std::optional<int32_t> level;

  bool operator==(const CompressionConfig& other) const {
    return kind == other.kind && level == other.level;
  }

  std::string toString() const;
};

class Codec {
 public:
  virtual ~Codec() = default;

  /// Returns an upper bound of the compressed size of 'inputLength' bytes.
  virtual uint64_t maxCompressedLength(uint64_t inputLength) const = 0;

  /// Compresses 'input' into 'output' and returns the number of bytes
  /// written. 'outputLength' must be at least maxCompressedLength().
  virtual Expected<uint64_t> compress(
      const uint8_t* input,
      uint64_t inputLength,
      uint8_t* output,
      uint64_t outputLength) const = 0;

  /// Decompresses 'input' into 'output' and returns the number of bytes
  /// written. Fails with an IOError status on corrupt input or when 'output'
  /// is too small. Safe to call concurrently.
  virtual Expected<uint64_t> decompress(
      const uint8_t* input,
      uint64_t inputLength,
      uint8_t* output,
      uint64_t outputLength) const = 0;

  virtual int32_t compressionLevel() const = 0;

  virtual CompressionKind compressionKind() const = 0;

  virtual std::string_view name() const = 0;

  std::string toString() const;
};

/// Resolves a codec for 'kind'. CompressionKind_NONE yields the identity
/// codec. Kinds without a block codec yield a NotImplemented status.
Expected<std::unique_ptr<Codec>> createCodec(
    CompressionKind kind,
    int32_t compressionLevel = kUseDefaultCompressionLevel);

} // namespace facebook::lancet::common
