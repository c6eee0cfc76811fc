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

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include <folly/Executor.h>
#include <folly/futures/Future.h>

#include "lancet/common/file/File.h"
#include "lancet/common/file/Region.h"
#include "lancet/encoding/BufferUtils.h"
#include "lancet/encoding/DecoderOptions.h"

namespace facebook::lancet::encoding {

/// The I/O capability handed to page schedulers. Schedulers describe the byte
/// ranges they need; the implementation decides when and how to fetch them
/// and may coalesce or reorder requests across pages and columns.
class EncodingsIo {
 public:
  virtual ~EncodingsIo() = default;

  /// Requests 'ranges'. The result holds one buffer per range, in the order
  /// the ranges were given. 'priority' is the first top-level row the request
  /// serves; lower values are more urgent. Read failures surface as a
  /// retriable IO_ERROR through the returned future.
  virtual folly::SemiFuture<std::vector<BufferPtr>> submitRequest(
      std::vector<common::Region> ranges,
      uint64_t priority) = 0;
};

/// EncodingsIo over a ReadFile. Ranges of one request that are at most
/// 'maxCoalesceDistance' bytes apart are fetched with a single read. Reads
/// run on 'executor' when one is given, otherwise when the caller waits on
/// the returned future. The futures share the file and the read counter with
/// this object, so they stay valid after it is destroyed.
class ReadFileEncodingsIo : public EncodingsIo {
 public:
  ReadFileEncodingsIo(
      std::shared_ptr<const ReadFile> file,
      uint64_t maxCoalesceDistance,
      folly::Executor* executor = nullptr);

  /// Takes the coalesce distance from 'options'.
  ReadFileEncodingsIo(
      std::shared_ptr<const ReadFile> file,
      const DecoderOptions& options,
      folly::Executor* executor = nullptr)
      : ReadFileEncodingsIo(
            std::move(file), options.maxCoalesceDistanceBytes, executor) {}

  folly::SemiFuture<std::vector<BufferPtr>> submitRequest(
      std::vector<common::Region> ranges,
      uint64_t priority) override;

  /// Number of reads issued against the file so far.
  uint64_t numReads() const {
    return state_->numReads;
  }

 private:
  struct State {
    State(std::shared_ptr<const ReadFile> file, uint64_t maxCoalesceDistance)
        : file(std::move(file)), maxCoalesceDistance(maxCoalesceDistance) {}

    const std::shared_ptr<const ReadFile> file;
    const uint64_t maxCoalesceDistance;
    std::atomic<uint64_t> numReads{0};
  };

  static std::vector<BufferPtr> read(
      State& state,
      const std::vector<common::Region>& ranges);

  const std::shared_ptr<State> state_;
  folly::Executor* const executor_;
};

} // namespace facebook::lancet::encoding
