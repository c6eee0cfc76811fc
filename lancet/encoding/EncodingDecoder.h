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

#include <arrow/type_fwd.h>

#include "lancet/encoding/BufferLocator.h"
#include "lancet/encoding/DecoderOptions.h"
#include "lancet/encoding/PageScheduler.h"
#include "lancet/encoding/proto/encodings.pb.h"

namespace facebook::lancet::encoding {

/// Builds the page scheduler for one page from its encoding descriptor.
///
/// 'type' is the logical type the caller wants the page decoded as. It is
/// passed unchanged to child encodings except under a dictionary, whose
/// items are decoded as the dictionary value type, and under a packed
/// struct, whose children get their field types.
///
/// Performs no I/O. Throws a LancetUserError for descriptors that cannot be
/// decoded: a buffer index outside its table, a missing child, an unknown
/// compression scheme, a flat width that is neither 1 nor a multiple of 8,
/// or an encoding that does not fit 'type'. Throws a LancetRuntimeError with
/// code kUnreachableCode for a bare struct encoding.
PageSchedulerPtr decoderFromArrayEncoding(
    const proto::ArrayEncoding& encoding,
    const PageBuffers& buffers,
    const arrow::DataType& type,
    const DecoderOptions& options = DecoderOptions());

/// Builds the scheduler of a flat encoding: a bitmap for 1 bit per value,
/// otherwise a value scheduler.
PageSchedulerPtr decoderFromFlat(
    const proto::Flat& flat,
    const PageBuffers& buffers,
    const DecoderOptions& options = DecoderOptions());

/// Offset width in bits of binary values of 'type': 64 for the large
/// variants, 32 otherwise.
uint32_t binaryOffsetBits(const arrow::DataType& type);

/// Resolves the compression of a flat encoding. An absent message or scheme
/// means no compression.
common::CompressionConfig toCompressionConfig(const proto::Flat& flat);

} // namespace facebook::lancet::encoding
