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

#include "boosting_ingest/distribute/partition_key.h"

#include <cstdint>
#include <utility>
#include <variant>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "boosting_ingest/dataset/labeled_point.h"
#include "boosting_ingest/dataset/tabular_row.h"
#include "boosting_ingest/utils/hash.h"
#include "boosting_ingest/utils/status_macros.h"

namespace boosting_ingest {
namespace distribute {
namespace {

// Type tags of the cells in the fingerprint.
enum CellTag : uint8_t {
  kFloatCell = 1,
  kInt32Cell = 2,
  kDenseVectorCell = 3,
  kSparseVectorCell = 4,
  kGroupId = 5,
};

void AddCell(const dataset::Cell& cell,
             utils::hash::FingerprintBuilder* builder) {
  if (const auto* value = std::get_if<float>(&cell)) {
    builder->AddUint8(kFloatCell);
    builder->AddFloat(*value);
  } else if (const auto* value = std::get_if<int32_t>(&cell)) {
    builder->AddUint8(kInt32Cell);
    builder->AddInt32(*value);
  } else {
    const auto& vector = std::get<dataset::FeatureVector>(cell);
    builder->AddUint8(vector.is_sparse() ? kSparseVectorCell
                                         : kDenseVectorCell);
    builder->AddInt32(vector.size());
    builder->AddInt64(static_cast<int64_t>(vector.values().size()));
    for (const auto index : vector.indices()) {
      builder->AddInt32(index);
    }
    for (const auto value : vector.values()) {
      builder->AddDouble(value);
    }
  }
}

}  // namespace

absl::Status CheckNumWorkers(const int num_workers) {
  if (num_workers <= 0) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Invalid partition configuration: The number of workers should be "
        "strictly positive. Got num_workers=",
        num_workers));
  }
  return absl::OkStatus();
}

uint64_t RowFingerprint(const dataset::TabularRow& row) {
  utils::hash::FingerprintBuilder builder;
  builder.AddInt64(static_cast<int64_t>(row.size()));
  for (const auto& cell : row) {
    AddCell(cell, &builder);
  }
  return builder.Fingerprint();
}

uint64_t GroupFingerprint(const int32_t group) {
  utils::hash::FingerprintBuilder builder;
  builder.AddUint8(kGroupId);
  builder.AddInt32(group);
  return builder.Fingerprint();
}

absl::StatusOr<int> AssignPartitionKey(const uint64_t row_fingerprint,
                                       const bool deterministic_partition,
                                       const int num_workers) {
  RETURN_IF_ERROR(CheckNumWorkers(num_workers));
  if (!deterministic_partition) {
    return kPlaceholderPartitionKey;
  }
  // The fingerprint is unsigned, so the modulo is already in [0, num_workers).
  return static_cast<int>(row_fingerprint %
                          static_cast<uint64_t>(num_workers));
}

absl::StatusOr<KeyedLabeledPoint> AttachPartitionKey(
    const dataset::TabularRow& row, const bool deterministic_partition,
    const int num_workers, dataset::LabeledPoint point) {
  // The fingerprint is only needed for deterministic partitioning.
  const uint64_t fingerprint =
      deterministic_partition ? RowFingerprint(row) : 0;
  ASSIGN_OR_RETURN(const int key,
                   AssignPartitionKey(fingerprint, deterministic_partition,
                                      num_workers));
  return KeyedLabeledPoint{key, std::move(point)};
}

absl::StatusOr<KeyedLabeledPoint> AttachGroupPartitionKey(
    const bool deterministic_partition, const int num_workers,
    dataset::LabeledPoint point) {
  if (!point.group.has_value()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Cannot key a point without group by its group: ",
                     dataset::LabeledPointToString(point)));
  }
  const uint64_t fingerprint =
      deterministic_partition ? GroupFingerprint(*point.group) : 0;
  ASSIGN_OR_RETURN(const int key,
                   AssignPartitionKey(fingerprint, deterministic_partition,
                                      num_workers));
  return KeyedLabeledPoint{key, std::move(point)};
}

}  // namespace distribute
}  // namespace boosting_ingest
