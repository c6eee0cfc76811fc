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

#include "lancet/common/base/SuccinctPrinter.h"

#include <iomanip>
#include <sstream>
#include <string_view>

namespace facebook::lancet {
static constexpr std::string_view kByteUnits[] = {"B", "KB", "MB", "GB", "TB"};
static constexpr int kByteScale = 1'024;

namespace {
// Divides 'value' by 'unitScale' until it drops below one unit or the units
// run out. 'precision' sets the decimal digits; plain bytes print none.
std::string succinctPrint(
    uint64_t value,
    const std::string_view* units,
    int unitsSize,
    int unitScale,
    int precision) {
  std::stringstream out;
  int offset = 0;
  double decimalValue = static_cast<double>(value);
  while ((decimalValue / unitScale) >= 1 && offset < (unitsSize - 1)) {
    decimalValue = decimalValue / unitScale;
    offset++;
  }
  if (offset == 0) {
    precision = 0;
  }
  out << std::fixed << std::setprecision(precision) << decimalValue
      << units[offset];
  return out.str();
}
} // namespace

std::string succinctBytes(uint64_t bytes, int precision) {
  return succinctPrint(
      bytes,
      &kByteUnits[0],
      sizeof(kByteUnits) / sizeof(std::string_view),
      kByteScale,
      precision);
}

} // namespace facebook::lancet
