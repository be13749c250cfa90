/*
 * Copyright 2021 Google LLC.
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "boosting_ingest/dataset/tabular_row.h"

#include <string>
#include <variant>

namespace boosting_ingest {
namespace dataset {

std::string CellTypeName(const Cell& cell) {
  if (std::holds_alternative<float>(cell)) {
    return "float";
  } else if (std::holds_alternative<int32_t>(cell)) {
    return "int32";
  } else {
    return std::get<FeatureVector>(cell).is_sparse() ? "sparse_vector"
                                                     : "dense_vector";
  }
}

}  // namespace dataset
}  // namespace boosting_ingest
