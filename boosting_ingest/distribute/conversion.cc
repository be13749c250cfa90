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

#include "boosting_ingest/distribute/conversion.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "boosting_ingest/dataset/ingest_config.pb.h"
#include "boosting_ingest/dataset/labeled_point.h"
#include "boosting_ingest/dataset/missing_values.h"
#include "boosting_ingest/dataset/row_converter.h"
#include "boosting_ingest/dataset/tabular_row.h"
#include "boosting_ingest/distribute/dataset_aligner.h"
#include "boosting_ingest/distribute/partition_key.h"
#include "boosting_ingest/utils/concurrency.h"
#include "boosting_ingest/utils/logging.h"
#include "boosting_ingest/utils/status_macros.h"

namespace boosting_ingest {
namespace distribute {
namespace {

absl::StatusOr<KeyedDataset> ConvertDataset(
    const dataset::TabularDataset& rows, const dataset::RowSchema schema,
    const dataset::proto::PartitionConfig& config, int64_t* num_rows) {
  KeyedDataset keyed_dataset(rows.size());
  for (size_t partition_idx = 0; partition_idx < rows.size();
       partition_idx++) {
    const auto& src = rows[partition_idx];
    auto& dst = keyed_dataset[partition_idx];
    dst.reserve(src.size());
    for (const auto& row : src) {
      ASSIGN_OR_RETURN(auto point, dataset::ConvertRow(schema, row));
      // The rows of a ranking group are sent to the same worker.
      if (schema == dataset::RowSchema::kWithGroup) {
        ASSIGN_OR_RETURN(
            auto keyed_point,
            AttachGroupPartitionKey(config.deterministic_partition(),
                                    config.num_workers(), std::move(point)));
        dst.push_back(std::move(keyed_point));
      } else {
        ASSIGN_OR_RETURN(
            auto keyed_point,
            AttachPartitionKey(row, config.deterministic_partition(),
                               config.num_workers(), std::move(point)));
        dst.push_back(std::move(keyed_point));
      }
      (*num_rows)++;
      LOG_INFO_EVERY_N_SEC(30, _ << "Converted " << *num_rows << " row(s)");
    }
  }
  return keyed_dataset;
}

}  // namespace

absl::StatusOr<std::vector<WorkerPartitions>> ConvertToLabeledPointPartitions(
    const dataset::proto::ColumnSelection& columns,
    const dataset::proto::PartitionConfig& config,
    const std::vector<dataset::TabularDataset>& datasets) {
  RETURN_IF_ERROR(CheckNumWorkers(config.num_workers()));
  ASSIGN_OR_RETURN(const auto schema, dataset::ResolveRowSchema(columns));

  int64_t num_rows = 0;
  std::vector<KeyedDataset> keyed_datasets;
  keyed_datasets.reserve(datasets.size());
  for (const auto& rows : datasets) {
    ASSIGN_OR_RETURN(auto keyed_dataset,
                     ConvertDataset(rows, schema, config, &num_rows));
    keyed_datasets.push_back(std::move(keyed_dataset));
  }
  LOG(INFO) << "Converted " << num_rows << " row(s) from " << datasets.size()
            << " dataset(s) with schema " << dataset::RowSchemaName(schema);
  return AlignDatasets(std::move(keyed_datasets), config);
}

absl::Status SanitizeWorkerPartitions(
    const dataset::proto::MissingValueConfig& config, const int num_threads,
    WorkerPartitions* partitions) {
  WorkerPartitions sanitized(partitions->size());
  RETURN_IF_ERROR(utils::concurrency::ConcurrentForEach(
      num_threads, partitions->size(),
      [&](const size_t worker_idx) -> absl::Status {
        ASSIGN_OR_RETURN(sanitized[worker_idx],
                         dataset::SanitizeMissingValues(
                             (*partitions)[worker_idx], config));
        return absl::OkStatus();
      }));
  *partitions = std::move(sanitized);
  return absl::OkStatus();
}

absl::StatusOr<WorkerGroups> SanitizeWorkerGroups(
    const dataset::proto::MissingValueConfig& config, const int num_threads,
    WorkerPartitions partitions) {
  WorkerGroups groups(partitions.size());
  RETURN_IF_ERROR(utils::concurrency::ConcurrentForEach(
      num_threads, partitions.size(),
      [&](const size_t worker_idx) -> absl::Status {
        ASSIGN_OR_RETURN(
            groups[worker_idx],
            dataset::SanitizeGroups(dataset::GroupConsecutivePoints(std::move(
                                        partitions[worker_idx])),
                                    config));
        return absl::OkStatus();
      }));
  return groups;
}

}  // namespace distribute
}  // namespace boosting_ingest
