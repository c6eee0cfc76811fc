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

#include "lancet/encoding/physical/BasicEncoding.h"

#include "lancet/common/base/BitUtil.h"
#include "lancet/common/base/Exceptions.h"

namespace facebook::lancet::encoding {

std::string_view toString(BasicPageScheduler::Nullability nullability) {
  switch (nullability) {
    case BasicPageScheduler::Nullability::kNoNulls:
      return "NO_NULLS";
    case BasicPageScheduler::Nullability::kSomeNulls:
      return "SOME_NULLS";
    case BasicPageScheduler::Nullability::kAllNulls:
      return "ALL_NULLS";
  }
  LANCET_UNREACHABLE();
}

BasicPageScheduler::BasicPageScheduler(
    Nullability nullability,
    PageSchedulerPtr validity,
    PageSchedulerPtr values)
    : nullability_(nullability),
      validity_(std::move(validity)),
      values_(std::move(values)) {}

std::unique_ptr<BasicPageScheduler> BasicPageScheduler::makeNonNullable(
    PageSchedulerPtr values) {
  LANCET_CHECK_NOT_NULL(values);
  return std::unique_ptr<BasicPageScheduler>(new BasicPageScheduler(
      Nullability::kNoNulls, nullptr, std::move(values)));
}

std::unique_ptr<BasicPageScheduler> BasicPageScheduler::makeNullable(
    PageSchedulerPtr validity,
    PageSchedulerPtr values) {
  LANCET_CHECK_NOT_NULL(validity);
  LANCET_CHECK_NOT_NULL(values);
  return std::unique_ptr<BasicPageScheduler>(new BasicPageScheduler(
      Nullability::kSomeNulls, std::move(validity), std::move(values)));
}

std::unique_ptr<BasicPageScheduler> BasicPageScheduler::makeAllNull() {
  return std::unique_ptr<BasicPageScheduler>(
      new BasicPageScheduler(Nullability::kAllNulls, nullptr, nullptr));
}

folly::SemiFuture<PageDecoderPtr> BasicPageScheduler::scheduleRanges(
    const std::vector<RowRange>& ranges,
    const std::shared_ptr<EncodingsIo>& io,
    uint64_t topLevelRow) const {
  switch (nullability_) {
    case Nullability::kNoNulls:
      return values_->scheduleRanges(ranges, io, topLevelRow);
    case Nullability::kSomeNulls: {
      auto validity = validity_->scheduleRanges(ranges, io, topLevelRow);
      auto values = values_->scheduleRanges(ranges, io, topLevelRow);
      return folly::collect(std::move(validity), std::move(values))
          .deferValue(
              [](std::tuple<PageDecoderPtr, PageDecoderPtr> decoders)
                  -> PageDecoderPtr {
                return std::make_unique<NullablePageDecoder>(
                    std::move(std::get<0>(decoders)),
                    std::move(std::get<1>(decoders)));
              });
    }
    case Nullability::kAllNulls:
      return folly::makeSemiFuture<PageDecoderPtr>(
          std::make_unique<AllNullPageDecoder>());
  }
  LANCET_UNREACHABLE();
}

std::string BasicPageScheduler::toString() const {
  switch (nullability_) {
    case Nullability::kNoNulls:
      return fmt::format(
          "BasicPageScheduler{{{}, values: {}}}",
          encoding::toString(nullability_),
          values_->toString());
    case Nullability::kSomeNulls:
      return fmt::format(
          "BasicPageScheduler{{{}, validity: {}, values: {}}}",
          encoding::toString(nullability_),
          validity_->toString(),
          values_->toString());
    case Nullability::kAllNulls:
      return fmt::format(
          "BasicPageScheduler{{{}}}", encoding::toString(nullability_));
  }
  LANCET_UNREACHABLE();
}

DataBlockPtr NullablePageDecoder::decode(uint64_t rowsToSkip, uint64_t numRows)
    const {
  auto validity = validity_->decode(rowsToSkip, numRows);
  const auto& bitmap =
      validity->asChecked<FixedWidthDataBlock>("Validity decoder");
  if (bitmap.bitsPerValue() != 1) {
    LANCET_CORRUPT_DATA(
        "Validity must decode to a bitmap but has {} bits per value",
        bitmap.bitsPerValue());
  }
  auto values = values_->decode(rowsToSkip, numRows);
  auto* inner = values->as<NullableDataBlock>();
  if (inner == nullptr) {
    return std::make_unique<NullableDataBlock>(
        std::move(values), bitmap.data());
  }
  // The values carry nulls of their own, e.g. from a binary null adjustment.
  // A row is valid only when both bitmaps say so.
  const auto numBytes = bits::nbytes(numRows);
  auto nulls = allocateBuffer(numBytes);
  const auto* outer = bitmap.data()->data();
  const auto* innerNulls = inner->nulls()->data();
  auto* merged = nulls->mutable_data();
  for (uint64_t i = 0; i < numBytes; ++i) {
    merged[i] = outer[i] & innerNulls[i];
  }
  return std::make_unique<NullableDataBlock>(
      inner->releaseData(), std::move(nulls));
}

DataBlockPtr AllNullPageDecoder::decode(
    uint64_t /*rowsToSkip*/,
    uint64_t numRows) const {
  return std::make_unique<AllNullDataBlock>(numRows);
}

} // namespace facebook::lancet::encoding
