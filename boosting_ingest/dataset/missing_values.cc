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

#include "boosting_ingest/dataset/missing_values.h"

#include <cmath>
#include <cstdint>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "boosting_ingest/dataset/ingest_config.pb.h"
#include "boosting_ingest/dataset/labeled_point.h"
#include "boosting_ingest/utils/status_macros.h"

namespace boosting_ingest {
namespace dataset {
namespace {

// Copies the values of "point" accepted by "keep".
template <typename KeepFn>
LabeledPoint FilterValues(const LabeledPoint& point, KeepFn keep) {
  LabeledPoint result;
  result.label = point.label;
  result.size = point.size;
  result.weight = point.weight;
  result.group = point.group;
  result.base_margin = point.base_margin;

  std::vector<int32_t> indices;
  indices.reserve(point.values.size());
  result.values.reserve(point.values.size());
  for (size_t value_idx = 0; value_idx < point.values.size(); value_idx++) {
    const float value = point.values[value_idx];
    if (keep(value)) {
      indices.push_back(point.index(value_idx));
      result.values.push_back(value);
    }
  }
  result.indices = std::move(indices);
  return result;
}

}  // namespace

absl::Status CheckMissingValueSetting(const LabeledPoint& point,
                                      const proto::MissingValueConfig& config) {
  if (config.missing() == 0.f || config.allow_non_zero_missing() ||
      !point.is_sparse()) {
    return absl::OkStatus();
  }
  return absl::FailedPreconditionError(absl::StrCat(
      "The missing value can only be 0 (currently set to ", config.missing(),
      ") when the feature vectors are sparse. If the sparse feature vectors "
      "preserve their zero values, this check can be disabled with "
      "\"allow_non_zero_missing=true\" (only use if you know what you are "
      "doing)."));
}

LabeledPoint RemoveMissingValues(const LabeledPoint& point,
                                 const float missing) {
  if (std::isnan(missing)) {
    return FilterValues(point, [](const float value) {
      return !std::isnan(value);
    });
  }
  return FilterValues(point, [missing](const float value) {
    return value != missing;
  });
}

absl::StatusOr<LabeledPoint> SanitizeMissingValues(
    const LabeledPoint& point, const proto::MissingValueConfig& config) {
  RETURN_IF_ERROR(CheckMissingValueSetting(point, config));
  return RemoveMissingValues(point, config.missing());
}

absl::StatusOr<std::vector<LabeledPoint>> SanitizeMissingValues(
    const std::vector<LabeledPoint>& points,
    const proto::MissingValueConfig& config) {
  std::vector<LabeledPoint> sanitized;
  sanitized.reserve(points.size());
  for (const auto& point : points) {
    ASSIGN_OR_RETURN(auto sanitized_point,
                     SanitizeMissingValues(point, config));
    sanitized.push_back(std::move(sanitized_point));
  }
  return sanitized;
}

absl::StatusOr<std::vector<LabeledPointGroup>> SanitizeGroups(
    std::vector<LabeledPointGroup> groups,
    const proto::MissingValueConfig& config) {
  if (config.disable_group_sanitization()) {
    return groups;
  }
  for (auto& group : groups) {
    ASSIGN_OR_RETURN(group, SanitizeMissingValues(group, config));
  }
  return groups;
}

proto::MissingValueConfig LegacyGroupMissingValueConfig(
    const float missing, const bool allow_non_zero_missing) {
  proto::MissingValueConfig config;
  config.set_missing(missing);
  config.set_allow_non_zero_missing(allow_non_zero_missing);
  config.set_disable_group_sanitization(std::isnan(missing));
  return config;
}

absl::StatusOr<bool> MissingValueFilterReader::Next(LabeledPoint* point) {
  ASSIGN_OR_RETURN(const bool has_point, source_->Next(&buffer_));
  if (!has_point) {
    return false;
  }
  ASSIGN_OR_RETURN(*point, SanitizeMissingValues(buffer_, config_));
  return true;
}

absl::StatusOr<bool> MissingValueGroupFilterReader::Next(
    LabeledPointGroup* group) {
  ASSIGN_OR_RETURN(const bool has_group, source_->Next(group));
  if (!has_group || config_.disable_group_sanitization()) {
    return has_group;
  }
  ASSIGN_OR_RETURN(*group, SanitizeMissingValues(*group, config_));
  return true;
}

}  // namespace dataset
}  // namespace boosting_ingest
