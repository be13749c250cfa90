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

// In-memory representation of the rows produced by the tabular selection
// layer. The selection layer has already cast the cells to their final types.

#ifndef BOOSTING_INGEST_DATASET_TABULAR_ROW_H_
#define BOOSTING_INGEST_DATASET_TABULAR_ROW_H_

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "boosting_ingest/dataset/labeled_point.h"

namespace boosting_ingest {
namespace dataset {

// A single value of a row.
using Cell = std::variant<float, int32_t, FeatureVector>;

// Ordered list of cells.
using TabularRow = std::vector<Cell>;

// A partition is a list of rows processed by the same execution unit.
using TabularPartition = std::vector<TabularRow>;

// A dataset is a list of partitions.
using TabularDataset = std::vector<TabularPartition>;

// Name of the type of a cell e.g. "float". Used in error messages.
std::string CellTypeName(const Cell& cell);

}  // namespace dataset
}  // namespace boosting_ingest

#endif  // BOOSTING_INGEST_DATASET_TABULAR_ROW_H_
