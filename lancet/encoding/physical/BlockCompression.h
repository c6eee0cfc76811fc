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

#include "lancet/common/compression/Compression.h"
#include "lancet/encoding/BufferUtils.h"

namespace facebook::lancet::encoding {

/// A compressed buffer is an 8-byte little-endian uncompressed length
/// followed by the codec's output.
constexpr uint64_t kCompressedLengthPrefixSize = sizeof(uint64_t);

/// Compresses 'input' into the framed layout above. Used by writers and
/// tests.
BufferPtr compressBlock(const common::Codec& codec, const arrow::Buffer& input);

/// Reverses compressBlock(). Throws CORRUPT_DATA when the frame is truncated,
/// claims more than 'maxDecompressedBytes', or the codec rejects the bytes.
BufferPtr decompressBlock(
    const common::Codec& codec,
    const arrow::Buffer& input,
    uint64_t maxDecompressedBytes);

} // namespace facebook::lancet::encoding
