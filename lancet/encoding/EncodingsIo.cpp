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

#include "lancet/encoding/EncodingsIo.h"

#include <algorithm>
#include <numeric>

#include <glog/logging.h>

#include "lancet/common/base/Exceptions.h"

namespace facebook::lancet::encoding {

ReadFileEncodingsIo::ReadFileEncodingsIo(
    std::shared_ptr<const ReadFile> file,
    uint64_t maxCoalesceDistance,
    folly::Executor* executor)
    : state_(std::make_shared<State>(std::move(file), maxCoalesceDistance)),
      executor_(executor) {
  LANCET_CHECK_NOT_NULL(state_->file);
}

folly::SemiFuture<std::vector<BufferPtr>> ReadFileEncodingsIo::submitRequest(
    std::vector<common::Region> ranges,
    uint64_t priority) {
  VLOG(2) << "Submitting " << ranges.size()
          << " ranges with priority " << priority;
  if (executor_ != nullptr) {
    return folly::via(
               executor_,
               [state = state_, ranges = std::move(ranges)]() {
                 return read(*state, ranges);
               })
        .semi();
  }
  return folly::makeSemiFuture().deferValue(
      [state = state_, ranges = std::move(ranges)](folly::Unit) {
        return read(*state, ranges);
      });
}

std::vector<BufferPtr> ReadFileEncodingsIo::read(
    State& state,
    const std::vector<common::Region>& ranges) {
  std::vector<BufferPtr> result(ranges.size());
  std::vector<size_t> order(ranges.size());
  std::iota(order.begin(), order.end(), 0);
  std::sort(order.begin(), order.end(), [&](size_t left, size_t right) {
    return ranges[left] < ranges[right];
  });

  size_t next = 0;
  while (next < order.size()) {
    // Grow 'merged' while the next range starts within the coalesce distance
    // of its end.
    common::Region merged = ranges[order[next]];
    size_t last = next + 1;
    while (last < order.size()) {
      const auto& candidate = ranges[order[last]];
      if (candidate.offset > merged.end() + state.maxCoalesceDistance) {
        break;
      }
      merged.length = std::max(merged.end(), candidate.end()) - merged.offset;
      ++last;
    }

    auto buffer = allocateBuffer(merged.length);
    if (merged.length > 0) {
      state.file->pread(merged.offset, merged.length, buffer->mutable_data());
      ++state.numReads;
    }
    for (auto i = next; i < last; ++i) {
      const auto& range = ranges[order[i]];
      result[order[i]] =
          sliceBuffer(buffer, range.offset - merged.offset, range.length);
    }
    next = last;
  }
  return result;
}

} // namespace facebook::lancet::encoding
