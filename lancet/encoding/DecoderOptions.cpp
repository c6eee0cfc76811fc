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

DEFINE_bool(
    lancet_validate_on_decode,
    false,
    "Run full Arrow validation on every decoded page array");

DEFINE_uint64(
    lancet_max_decompressed_page_bytes,
    1UL << 30,
    "Upper bound on the uncompressed size of a compressed page buffer");

DEFINE_uint64(
    lancet_max_coalesce_distance_bytes,
    512 << 10,
    "Max gap between two ranges of one I/O request that are read together");

namespace facebook::lancet::encoding {

DecoderOptions::DecoderOptions()
    : validateOnDecode(FLAGS_lancet_validate_on_decode),
      maxDecompressedPageBytes(FLAGS_lancet_max_decompressed_page_bytes),
      maxCoalesceDistanceBytes(FLAGS_lancet_max_coalesce_distance_bytes) {}

DecoderOptions DecoderOptions::fromConfig(const config::IConfig& config) {
  DecoderOptions options;
  options.validateOnDecode =
      config.get<bool>(kValidateOnDecode, options.validateOnDecode);
  options.maxDecompressedPageBytes = config.get<uint64_t>(
      kMaxDecompressedPageBytes, options.maxDecompressedPageBytes);
  options.maxCoalesceDistanceBytes = config.get<uint64_t>(
      kMaxCoalesceDistanceBytes, options.maxCoalesceDistanceBytes);
  return options;
}

} // namespace facebook::lancet::encoding
