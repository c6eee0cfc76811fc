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
#include <span>
#include <string>

namespace facebook::lancet::bits {

/// Bitmaps are little endian: bit 'i' lives in byte i / 8 at position i % 8,
/// matching the Arrow validity layout.

constexpr inline uint64_t nbytes(uint64_t numBits) {
  return (numBits + 7) / 8;
}

constexpr inline uint64_t roundUp(uint64_t value, uint64_t factor) {
  return (value + (factor - 1)) / factor * factor;
}

constexpr inline uint64_t lowMask(int32_t bits) {
  return bits >= 64 ? ~0ULL : (1ULL << bits) - 1;
}

inline bool isBitSet(const uint8_t* bits, uint64_t idx) {
  return bits[idx / 8] & (1 << (idx % 8));
}

inline void setBit(uint8_t* bits, uint64_t idx) {
  bits[idx / 8] |= (1 << (idx % 8));
}

inline void clearBit(uint8_t* bits, uint64_t idx) {
  bits[idx / 8] &= ~(1 << (idx % 8));
}

inline void setBit(uint8_t* bits, uint64_t idx, bool value) {
  value ? setBit(bits, idx) : clearBit(bits, idx);
}

/// Copies 'numBits' bits starting at bit 'sourceOffset' of 'source' to bit
/// 'targetOffset' of 'target'. Bits of 'target' outside the copied range are
/// left untouched.
void copyBits(
    const uint8_t* source,
    uint64_t sourceOffset,
    uint8_t* target,
    uint64_t targetOffset,
    uint64_t numBits);

/// Returns the number of set bits in [begin, end).
uint64_t countBits(const uint8_t* bits, uint64_t begin, uint64_t end);

/// Packs 'bools' into the bitmap 'bitmap', which must hold at least
/// nbytes(bools.size()) zeroed bytes.
void packBitmap(std::span<const bool> bools, uint8_t* bitmap);

/// Renders bits [offset, offset + size) as a string of '0' and '1'.
std::string toString(const void* bits, uint64_t offset, uint64_t size);

} // namespace facebook::lancet::bits
