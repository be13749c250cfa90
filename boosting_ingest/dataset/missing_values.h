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

// Removal of the missing values from the feature vectors of labeled points.
//
// A feature value is missing if it is equal to the "missing" value of the
// configuration (NaN matches NaN). Missing values are removed from the
// feature vectors, and the remaining values are stored sparsely: after
// sanitization, all the points are sparse, "size" is unchanged, and the
// indices are the positions of the remaining values in the original vector.
//
// A non-zero "missing" value is only allowed with dense feature vectors,
// unless "allow_non_zero_missing" is set: a sparse vector does not store its
// zero values, so those cannot be distinguished from the missing values once
// the missing values are removed.

#ifndef BOOSTING_INGEST_DATASET_MISSING_VALUES_H_
#define BOOSTING_INGEST_DATASET_MISSING_VALUES_H_

#include <cmath>
#include <memory>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "boosting_ingest/dataset/ingest_config.pb.h"
#include "boosting_ingest/dataset/labeled_point.h"
#include "boosting_ingest/dataset/labeled_point_reader.h"

namespace boosting_ingest {
namespace dataset {

// Tests if "value" is the missing value "missing".
inline bool IsMissing(const float value, const float missing) {
  return std::isnan(missing) ? std::isnan(value) : value == missing;
}

// Fails with a "FailedPrecondition" error if "point" is sparse while a non-zero
// missing value is configured without "allow_non_zero_missing".
absl::Status CheckMissingValueSetting(const LabeledPoint& point,
                                      const proto::MissingValueConfig& config);

// Copy of "point" without the "missing" feature values. Does not check the
// missing value setting.
LabeledPoint RemoveMissingValues(const LabeledPoint& point, float missing);

// Checks the missing value setting and removes the missing values.
absl::StatusOr<LabeledPoint> SanitizeMissingValues(
    const LabeledPoint& point, const proto::MissingValueConfig& config);

// Sanitizes a list of points. Fails on the first invalid point.
absl::StatusOr<std::vector<LabeledPoint>> SanitizeMissingValues(
    const std::vector<LabeledPoint>& points,
    const proto::MissingValueConfig& config);

// Sanitizes each ranking group independently. The groups and the order of the
// points are preserved. If "disable_group_sanitization" is set, the groups are
// returned unchanged.
absl::StatusOr<std::vector<LabeledPointGroup>> SanitizeGroups(
    std::vector<LabeledPointGroup> groups,
    const proto::MissingValueConfig& config);

// Configuration of the group sanitization of the previous group pipeline,
// where a NaN missing value disabled the sanitization of the groups.
proto::MissingValueConfig LegacyGroupMissingValueConfig(
    float missing, bool allow_non_zero_missing);

// Stream of sanitized points. The first invalid point fails the stream.
class MissingValueFilterReader : public LabeledPointReader {
 public:
  MissingValueFilterReader(std::unique_ptr<LabeledPointReader> source,
                           const proto::MissingValueConfig& config)
      : source_(std::move(source)), config_(config) {}

  absl::StatusOr<bool> Next(LabeledPoint* point) override;

 private:
  std::unique_ptr<LabeledPointReader> source_;
  const proto::MissingValueConfig config_;
  LabeledPoint buffer_;
};

// Stream of sanitized ranking groups. See "SanitizeGroups".
class MissingValueGroupFilterReader : public LabeledPointGroupReader {
 public:
  MissingValueGroupFilterReader(std::unique_ptr<LabeledPointGroupReader> source,
                                const proto::MissingValueConfig& config)
      : source_(std::move(source)), config_(config) {}

  absl::StatusOr<bool> Next(LabeledPointGroup* group) override;

 private:
  std::unique_ptr<LabeledPointGroupReader> source_;
  const proto::MissingValueConfig config_;
};

}  // namespace dataset
}  // namespace boosting_ingest

#endif  // BOOSTING_INGEST_DATASET_MISSING_VALUES_H_
