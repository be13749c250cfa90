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

// Distribution of several keyed datasets among a fixed number of workers.
//
// Each dataset is a list of input partitions of keyed labeled points (see
// "partition_key.h"). The output of each dataset is a list of exactly
// "num_workers" partitions; the i-th partition is consumed by the i-th worker.
//
// With deterministic partitioning, the points are bucketed by key: points with
// the same key land on the same worker for all the datasets. Otherwise, each
// dataset is evenly redistributed independently of the other datasets, without
// splitting the ranking groups. A dataset that already has "num_workers"
// partitions is left untouched.

#ifndef BOOSTING_INGEST_DISTRIBUTE_DATASET_ALIGNER_H_
#define BOOSTING_INGEST_DISTRIBUTE_DATASET_ALIGNER_H_

#include <vector>

#include "absl/status/statusor.h"
#include "boosting_ingest/dataset/ingest_config.pb.h"
#include "boosting_ingest/dataset/labeled_point.h"
#include "boosting_ingest/distribute/partition_key.h"

namespace boosting_ingest {
namespace distribute {

using KeyedPartition = std::vector<KeyedLabeledPoint>;
using KeyedDataset = std::vector<KeyedPartition>;

// Labeled points of a dataset, indexed by worker.
using WorkerPartitions = std::vector<std::vector<dataset::LabeledPoint>>;

// Worker of a point with the given key. Negative keys are supported.
int WorkerOfKey(int key, int num_workers);

// Buckets the points by "WorkerOfKey(key)". The relative order of the points
// (input partition index, then position in the partition) is preserved in each
// bucket.
absl::StatusOr<WorkerPartitions> PartitionByKey(KeyedDataset dataset,
                                                int num_workers);

// Evenly redistributes the points among "num_workers" partitions. If the
// dataset already has "num_workers" partitions, the partitions are kept as is.
//
// Otherwise, the runs of points of the input partition "p" are assigned in a
// round-robin fashion starting at a position drawn by a random generator
// seeded with "p". A run is a single point without group, or a maximal
// sequence of consecutive points with the same group (possibly continuing
// from the previous input partition). The points of a run stay together and
// in order on one worker. The result only depends on the input partitions,
// and the number of runs of the output partitions differ by at most the
// number of input partitions.
absl::StatusOr<WorkerPartitions> Redistribute(KeyedDataset dataset,
                                              int num_workers);

// Distributes all the datasets according to "config". Fails before processing
// any data if the configuration is invalid.
absl::StatusOr<std::vector<WorkerPartitions>> AlignDatasets(
    std::vector<KeyedDataset> datasets,
    const dataset::proto::PartitionConfig& config);

}  // namespace distribute
}  // namespace boosting_ingest

#endif  // BOOSTING_INGEST_DISTRIBUTE_DATASET_ALIGNER_H_
