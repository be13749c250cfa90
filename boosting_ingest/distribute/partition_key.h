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

// Assignment of partition keys to rows.
//
// With deterministic partitioning, the key of a row is the index of the worker
// that will receive the row. It only depends on the content of the row, so
// two datasets containing the same rows (e.g. features and labels computed
// separately) send them to the same workers, and a re-computed dataset has
// the same partitions.
//
// Rows of a ranking group are keyed by their group id instead of their
// content, so all the rows of a group land on the same worker.
//
// Without deterministic partitioning, all the rows get the same placeholder
// key, and the rows are later redistributed (see "dataset_aligner.h").

#ifndef BOOSTING_INGEST_DISTRIBUTE_PARTITION_KEY_H_
#define BOOSTING_INGEST_DISTRIBUTE_PARTITION_KEY_H_

#include <cstdint>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "boosting_ingest/dataset/labeled_point.h"
#include "boosting_ingest/dataset/tabular_row.h"

namespace boosting_ingest {
namespace distribute {

// Key given to all the rows when the partitioning is not deterministic.
constexpr int kPlaceholderPartitionKey = 1;

// A labeled point and the key of its partition.
struct KeyedLabeledPoint {
  int key;
  dataset::LabeledPoint point;
};

// Fails with an "Invalid partition configuration" error if "num_workers" is
// not strictly positive.
absl::Status CheckNumWorkers(int num_workers);

// Fingerprint of the content of a row. The fingerprint is stable across
// processes and runs.
uint64_t RowFingerprint(const dataset::TabularRow& row);

// Fingerprint of a ranking group id. Stable across processes and runs.
uint64_t GroupFingerprint(int32_t group);

// Partition key of a row with the given fingerprint.
absl::StatusOr<int> AssignPartitionKey(uint64_t row_fingerprint,
                                       bool deterministic_partition,
                                       int num_workers);

// Attaches the partition key of "row" to "point", the labeled point converted
// from "row".
absl::StatusOr<KeyedLabeledPoint> AttachPartitionKey(
    const dataset::TabularRow& row, bool deterministic_partition,
    int num_workers, dataset::LabeledPoint point);

// Attaches a partition key computed from the group of "point". Fails if
// "point" has no group.
absl::StatusOr<KeyedLabeledPoint> AttachGroupPartitionKey(
    bool deterministic_partition, int num_workers,
    dataset::LabeledPoint point);

}  // namespace distribute
}  // namespace boosting_ingest

#endif  // BOOSTING_INGEST_DISTRIBUTE_PARTITION_KEY_H_
