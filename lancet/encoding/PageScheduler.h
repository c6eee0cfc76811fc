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
#include <memory>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <folly/futures/Future.h>

#include "lancet/encoding/DataBlock.h"
#include "lancet/encoding/EncodingsIo.h"

namespace facebook::lancet::encoding {

/// Half-open range of rows [begin, end) within a page.
struct RowRange {
  uint64_t begin;
  uint64_t end;

  uint64_t size() const {
    return end - begin;
  }

  bool operator==(const RowRange& other) const {
    return begin == other.begin && end == other.end;
  }

  std::string toString() const {
    return fmt::format("[{}, {})", begin, end);
  }
};

/// Sum of the sizes of 'ranges'.
uint64_t totalRows(const std::vector<RowRange>& ranges);

/// Turns fetched page bytes into values. Decoders are immutable once built,
/// so decode() may be called from several threads and any number of times.
class PageDecoder {
 public:
  virtual ~PageDecoder() = default;

  /// Decodes 'numRows' rows, starting 'rowsToSkip' rows into the
  /// concatenation of the ranges the decoder was scheduled for.
  virtual DataBlockPtr decode(uint64_t rowsToSkip, uint64_t numRows) const = 0;
};

using PageDecoderPtr = std::unique_ptr<PageDecoder>;

/// A physical decoding strategy for one page. Construction performs no I/O.
/// scheduleRanges() asks 'io' for the bytes covering 'ranges' and returns a
/// future decoder over them; the future fails with a retriable error when a
/// read fails or the fetched bytes cannot be decoded.
class PageScheduler {
 public:
  virtual ~PageScheduler() = default;

  /// 'ranges' are sorted and non-overlapping. 'topLevelRow' is the first row
  /// of the column the request serves and is used as the I/O priority.
  virtual folly::SemiFuture<PageDecoderPtr> scheduleRanges(
      const std::vector<RowRange>& ranges,
      const std::shared_ptr<EncodingsIo>& io,
      uint64_t topLevelRow) const = 0;

  /// Renders the strategy and its parameters.
  virtual std::string toString() const = 0;
};

using PageSchedulerPtr = std::unique_ptr<PageScheduler>;

} // namespace facebook::lancet::encoding
