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

// End-to-end preparation of tabular datasets for the distributed training
// workers.
//
// Usage example:
//
//   // Training and validation datasets, aligned on the same workers.
//   ASSIGN_OR_RETURN(auto partitions,
//       ConvertToLabeledPointPartitions(columns, partition_config,
//                                       {train_rows, valid_rows}));
//   for (auto& dataset_partitions : partitions) {
//     RETURN_IF_ERROR(SanitizeWorkerPartitions(missing_value_config,
//                                              /*num_threads=*/8,
//                                              &dataset_partitions));
//   }
//
// Then, the i-th partition of each dataset is sent to the i-th worker.

#ifndef BOOSTING_INGEST_DISTRIBUTE_CONVERSION_H_
#define BOOSTING_INGEST_DISTRIBUTE_CONVERSION_H_

#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "boosting_ingest/dataset/ingest_config.pb.h"
#include "boosting_ingest/dataset/labeled_point.h"
#include "boosting_ingest/dataset/tabular_row.h"
#include "boosting_ingest/distribute/dataset_aligner.h"

namespace boosting_ingest {
namespace distribute {

// Converts the rows of each dataset into labeled points, and distributes them
// among "config.num_workers()" partitions. The row layout is resolved once
// from "columns" and shared by all the datasets. Returns one set of worker
// partitions per dataset, in the same order as "datasets".
//
// When "columns" has a group column, the rows are distributed by group: all
// the consecutive rows of a ranking group end up consecutive on the same
// worker (in deterministic mode, all the rows of a group id do).
absl::StatusOr<std::vector<WorkerPartitions>> ConvertToLabeledPointPartitions(
    const dataset::proto::ColumnSelection& columns,
    const dataset::proto::PartitionConfig& config,
    const std::vector<dataset::TabularDataset>& datasets);

// Removes the missing values of all the partitions in place. The partitions
// are processed in parallel on "num_threads" threads. Returns the error of the
// first failing partition, in which case "partitions" is left unchanged.
absl::Status SanitizeWorkerPartitions(
    const dataset::proto::MissingValueConfig& config, int num_threads,
    WorkerPartitions* partitions);

// Ranking groups of each worker partition.
using WorkerGroups = std::vector<std::vector<dataset::LabeledPointGroup>>;

// Cuts each worker partition into ranking groups of consecutive points, and
// removes their missing values (see "SanitizeGroups").
absl::StatusOr<WorkerGroups> SanitizeWorkerGroups(
    const dataset::proto::MissingValueConfig& config, int num_threads,
    WorkerPartitions partitions);

}  // namespace distribute
}  // namespace boosting_ingest

#endif  // BOOSTING_INGEST_DISTRIBUTE_CONVERSION_H_
