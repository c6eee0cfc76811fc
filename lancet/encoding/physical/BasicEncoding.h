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

#include "lancet/encoding/PageScheduler.h"

namespace facebook::lancet::encoding {

/// Adds validity to a page of values. A page either has no nulls (values
/// only), some nulls (a validity bitmap beside the values) or only nulls (no
/// buffers at all).
class BasicPageScheduler : public PageScheduler {
 public:
  enum class Nullability { kNoNulls, kSomeNulls, kAllNulls };

  static std::unique_ptr<BasicPageScheduler> makeNonNullable(
      PageSchedulerPtr values);

  static std::unique_ptr<BasicPageScheduler> makeNullable(
      PageSchedulerPtr validity,
      PageSchedulerPtr values);

  static std::unique_ptr<BasicPageScheduler> makeAllNull();

  folly::SemiFuture<PageDecoderPtr> scheduleRanges(
      const std::vector<RowRange>& ranges,
      const std::shared_ptr<EncodingsIo>& io,
      uint64_t topLevelRow) const override;

  std::string toString() const override;

  Nullability nullability() const {
    return nullability_;
  }

 private:
  BasicPageScheduler(
      Nullability nullability,
      PageSchedulerPtr validity,
      PageSchedulerPtr values);

  const Nullability nullability_;
  const PageSchedulerPtr validity_;
  const PageSchedulerPtr values_;
};

std::string_view toString(BasicPageScheduler::Nullability nullability);

class NullablePageDecoder : public PageDecoder {
 public:
  NullablePageDecoder(PageDecoderPtr validity, PageDecoderPtr values)
      : validity_(std::move(validity)), values_(std::move(values)) {}

  DataBlockPtr decode(uint64_t rowsToSkip, uint64_t numRows) const override;

 private:
  const PageDecoderPtr validity_;
  const PageDecoderPtr values_;
};

class AllNullPageDecoder : public PageDecoder {
 public:
  DataBlockPtr decode(uint64_t rowsToSkip, uint64_t numRows) const override;
};

} // namespace facebook::lancet::encoding
