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

#include <gflags/gflags_declare.h>

#include "lancet/common/config/IConfig.h"

DECLARE_bool(lancet_validate_on_decode);
DECLARE_uint64(lancet_max_decompressed_page_bytes);
DECLARE_uint64(lancet_max_coalesce_distance_bytes);

namespace facebook::lancet::encoding {

/// Knobs of the page decoding layer. Defaults come from the process-wide
/// gflags and can be overridden per reader through an IConfig.
struct DecoderOptions {
  /// Run full Arrow validation on every array produced by toArrow().
  static constexpr const char* kValidateOnDecode = "decoder.validate-on-decode";
  /// Upper bound on the uncompressed size claimed by a compressed buffer.
  /// Larger claims are treated as corrupt data.
  static constexpr const char* kMaxDecompressedPageBytes =
      "decoder.max-decompressed-page-bytes";
  /// Ranges of one I/O request at most this many bytes apart are read with
  /// a single file read.
  static constexpr const char* kMaxCoalesceDistanceBytes =
      "io.max-coalesce-distance-bytes";

  bool validateOnDecode;
  uint64_t maxDecompressedPageBytes;
  uint64_t maxCoalesceDistanceBytes;

  /// Options taken from the gflags.
  DecoderOptions();

  /// Options taken from 'config', falling back to the gflags for absent keys.
  static DecoderOptions fromConfig(const config::IConfig& config);
};

} // namespace facebook::lancet::encoding
