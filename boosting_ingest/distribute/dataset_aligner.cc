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

#include "boosting_ingest/distribute/dataset_aligner.h"

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "boosting_ingest/dataset/ingest_config.pb.h"
#include "boosting_ingest/dataset/labeled_point.h"
#include "boosting_ingest/distribute/partition_key.h"
#include "boosting_ingest/utils/logging.h"
#include "boosting_ingest/utils/random.h"
#include "boosting_ingest/utils/status_macros.h"

namespace boosting_ingest {
namespace distribute {
namespace {

// Removes the keys of a dataset without changing the partitions.
WorkerPartitions DropKeys(KeyedDataset dataset) {
  WorkerPartitions partitions(dataset.size());
  for (size_t partition_idx = 0; partition_idx < dataset.size();
       partition_idx++) {
    auto& src = dataset[partition_idx];
    auto& dst = partitions[partition_idx];
    dst.reserve(src.size());
    for (auto& keyed_point : src) {
      dst.push_back(std::move(keyed_point.point));
    }
  }
  return partitions;
}

}  // namespace

int WorkerOfKey(const int key, const int num_workers) {
  const int worker = key % num_workers;
  return worker < 0 ? worker + num_workers : worker;
}

absl::StatusOr<WorkerPartitions> PartitionByKey(KeyedDataset dataset,
                                                const int num_workers) {
  RETURN_IF_ERROR(CheckNumWorkers(num_workers));
  WorkerPartitions buckets(num_workers);
  for (auto& partition : dataset) {
    for (auto& keyed_point : partition) {
      buckets[WorkerOfKey(keyed_point.key, num_workers)].push_back(
          std::move(keyed_point.point));
    }
  }
  return buckets;
}

absl::StatusOr<WorkerPartitions> Redistribute(KeyedDataset dataset,
                                              const int num_workers) {
  RETURN_IF_ERROR(CheckNumWorkers(num_workers));
  if (dataset.size() == static_cast<size_t>(num_workers)) {
    return DropKeys(std::move(dataset));
  }

  WorkerPartitions partitions(num_workers);
  // Group and worker of the last dealt run of points.
  std::optional<int32_t> run_group;
  size_t run_worker = 0;
  for (size_t partition_idx = 0; partition_idx < dataset.size();
       partition_idx++) {
    utils::RandomEngine rnd(static_cast<uint32_t>(partition_idx));
    size_t worker = rnd() % num_workers;
    for (auto& keyed_point : dataset[partition_idx]) {
      auto& point = keyed_point.point;
      if (point.group.has_value() && point.group == run_group) {
        partitions[run_worker].push_back(std::move(point));
        continue;
      }
      run_group = point.group;
      run_worker = worker;
      partitions[worker].push_back(std::move(point));
      worker = (worker + 1) % num_workers;
    }
  }
  return partitions;
}

absl::StatusOr<std::vector<WorkerPartitions>> AlignDatasets(
    std::vector<KeyedDataset> datasets,
    const dataset::proto::PartitionConfig& config) {
  const int num_workers = config.num_workers();
  RETURN_IF_ERROR(CheckNumWorkers(num_workers));

  std::vector<WorkerPartitions> aligned;
  aligned.reserve(datasets.size());
  for (size_t dataset_idx = 0; dataset_idx < datasets.size(); dataset_idx++) {
    auto& dataset = datasets[dataset_idx];
    if (config.deterministic_partition()) {
      LOG(INFO) << "Partition dataset #" << dataset_idx << " by key into "
                << num_workers << " worker partition(s)";
      ASSIGN_OR_RETURN(auto partitions,
                       PartitionByKey(std::move(dataset), num_workers));
      aligned.push_back(std::move(partitions));
    } else {
      if (dataset.size() == static_cast<size_t>(num_workers)) {
        LOG(INFO) << "Dataset #" << dataset_idx << " already has "
                  << num_workers << " partition(s)";
      } else {
        LOG(INFO) << "Redistribute dataset #" << dataset_idx << " from "
                  << dataset.size() << " to " << num_workers
                  << " partition(s)";
      }
      ASSIGN_OR_RETURN(auto partitions,
                       Redistribute(std::move(dataset), num_workers));
      aligned.push_back(std::move(partitions));
    }
  }
  return aligned;
}

}  // namespace distribute
}  // namespace boosting_ingest
