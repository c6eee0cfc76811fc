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

#include "lancet/common/base/BitUtil.h"

#include <bit>
#include <cstring>

namespace facebook::lancet::bits {

void copyBits(
    const uint8_t* source,
    uint64_t sourceOffset,
    uint8_t* target,
    uint64_t targetOffset,
    uint64_t numBits) {
  if (numBits == 0) {
    return;
  }
  if (sourceOffset % 8 == 0 && targetOffset % 8 == 0) {
    // Byte aligned on both sides: copy whole bytes and finish the tail.
    const auto wholeBytes = numBits / 8;
    // @lint-ignore CLANGSECURITY facebook-security-vulnerable-memcpy
    std::memcpy(target + targetOffset / 8, source + sourceOffset / 8, wholeBytes);
    for (auto i = wholeBytes * 8; i < numBits; ++i) {
      setBit(target, targetOffset + i, isBitSet(source, sourceOffset + i));
    }
    return;
  }
  for (uint64_t i = 0; i < numBits; ++i) {
    setBit(target, targetOffset + i, isBitSet(source, sourceOffset + i));
  }
}

uint64_t countBits(const uint8_t* bits, uint64_t begin, uint64_t end) {
  uint64_t count = 0;
  uint64_t i = begin;
  for (; i < end && i % 8 != 0; ++i) {
    count += isBitSet(bits, i);
  }
  for (; i + 8 <= end; i += 8) {
    count += std::popcount(bits[i / 8]);
  }
  for (; i < end; ++i) {
    count += isBitSet(bits, i);
  }
  return count;
}

void packBitmap(std::span<const bool> bools, uint8_t* bitmap) {
  for (size_t i = 0; i < bools.size(); ++i) {
    if (bools[i]) {
      setBit(bitmap, i);
    }
  }
}

std::string toString(const void* bits, uint64_t offset, uint64_t size) {
  std::string result(size, '\0');
  for (uint64_t i = 0; i < size; ++i) {
    result[i] =
        '0' + isBitSet(reinterpret_cast<const uint8_t*>(bits), offset + i);
  }
  return result;
}

} // namespace facebook::lancet::bits
