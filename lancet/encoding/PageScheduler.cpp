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

#include "lancet/encoding/PageScheduler.h"

namespace facebook::lancet::encoding {

uint64_t totalRows(const std::vector<RowRange>& ranges) {
  uint64_t total = 0;
  for (const auto& range : ranges) {
    total += range.size();
  }
  return total;
}

} // namespace facebook::lancet::encoding
