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

#include "boosting_ingest/dataset/labeled_point.h"

#include <cmath>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "boosting_ingest/utils/status_macros.h"

namespace boosting_ingest {
namespace dataset {
namespace {

template <typename T>
bool SameValue(const T a, const T b) {
  return a == b || (std::isnan(a) && std::isnan(b));
}

template <typename T>
bool SameValues(const std::vector<T>& a, const std::vector<T>& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); i++) {
    if (!SameValue(a[i], b[i])) {
      return false;
    }
  }
  return true;
}

// Checks that "indices" are strictly increasing in [0, size) and aligned with
// "num_values" values.
absl::Status CheckSparseIndices(const int32_t size,
                                const std::vector<int32_t>& indices,
                                const size_t num_values) {
  if (indices.size() != num_values) {
    return absl::InvalidArgumentError(
        absl::StrCat("Sparse vector with ", indices.size(), " indices and ",
                     num_values, " values"));
  }
  for (size_t i = 0; i < indices.size(); i++) {
    if (indices[i] < 0 || indices[i] >= size) {
      return absl::InvalidArgumentError(
          absl::StrCat("Sparse index ", indices[i], " out of range [0, ",
                       size, ")"));
    }
    if (i > 0 && indices[i] <= indices[i - 1]) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Sparse indices are not strictly increasing: ", indices[i - 1],
          " followed by ", indices[i]));
    }
  }
  return absl::OkStatus();
}

}  // namespace

bool operator==(const LabeledPoint& a, const LabeledPoint& b) {
  if (!SameValue(a.label, b.label) || a.size != b.size ||
      !SameValue(a.weight, b.weight) || a.group != b.group ||
      a.indices != b.indices || !SameValues(a.values, b.values)) {
    return false;
  }
  if (a.base_margin.has_value() != b.base_margin.has_value()) {
    return false;
  }
  return !a.base_margin.has_value() ||
         SameValue(*a.base_margin, *b.base_margin);
}

std::vector<LabeledPointGroup> GroupConsecutivePoints(
    std::vector<LabeledPoint> points) {
  std::vector<LabeledPointGroup> groups;
  for (auto& point : points) {
    if (groups.empty() || groups.back().back().group != point.group) {
      groups.emplace_back();
    }
    groups.back().push_back(std::move(point));
  }
  return groups;
}

std::string LabeledPointToString(const LabeledPoint& point) {
  std::string result =
      absl::StrCat("label:", point.label, " size:", point.size);
  if (point.indices.has_value()) {
    absl::StrAppend(&result, " indices:[", absl::StrJoin(*point.indices, " "),
                    "]");
  }
  absl::StrAppend(&result, " values:[", absl::StrJoin(point.values, " "),
                  "] weight:", point.weight);
  if (point.group.has_value()) {
    absl::StrAppend(&result, " group:", *point.group);
  }
  if (point.base_margin.has_value()) {
    absl::StrAppend(&result, " base_margin:", *point.base_margin);
  }
  return result;
}

std::ostream& operator<<(std::ostream& os, const LabeledPoint& point) {
  return os << LabeledPointToString(point);
}

absl::Status CheckLabeledPoint(const LabeledPoint& point) {
  if (point.size < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("Negative labeled point size: ", point.size));
  }
  if (point.indices.has_value()) {
    return CheckSparseIndices(point.size, *point.indices, point.values.size());
  }
  if (static_cast<int64_t>(point.values.size()) != point.size) {
    return absl::InvalidArgumentError(
        absl::StrCat("Dense labeled point of size ", point.size, " with ",
                     point.values.size(), " values"));
  }
  return absl::OkStatus();
}

FeatureVector FeatureVector::Dense(std::vector<double> values) {
  const auto size = static_cast<int32_t>(values.size());
  return FeatureVector(/*sparse=*/false, size, {}, std::move(values));
}

absl::StatusOr<FeatureVector> FeatureVector::Sparse(
    const int32_t size, std::vector<int32_t> indices,
    std::vector<double> values) {
  STATUS_CHECK_GE(size, 0);
  RETURN_IF_ERROR(CheckSparseIndices(size, indices, values.size()));
  return FeatureVector(/*sparse=*/true, size, std::move(indices),
                       std::move(values));
}

bool FeatureVector::operator==(const FeatureVector& other) const {
  return sparse_ == other.sparse_ && size_ == other.size_ &&
         indices_ == other.indices_ && SameValues(values_, other.values_);
}

std::ostream& operator<<(std::ostream& os, const FeatureVector& vector) {
  if (vector.is_sparse()) {
    return os << "sparse(" << vector.size() << ", ["
              << absl::StrJoin(vector.indices(), " ") << "], ["
              << absl::StrJoin(vector.values(), " ") << "])";
  }
  return os << "dense([" << absl::StrJoin(vector.values(), " ") << "])";
}

absl::StatusOr<FeatureVector> FeaturesOf(const LabeledPoint& point) {
  RETURN_IF_ERROR(CheckLabeledPoint(point));
  std::vector<double> values(point.values.begin(), point.values.end());
  if (!point.indices.has_value()) {
    return FeatureVector::Dense(std::move(values));
  }
  return FeatureVector::Sparse(point.size, *point.indices, std::move(values));
}

LabeledPoint ToLabeledPoint(const FeatureVector& features, const float label) {
  LabeledPoint point;
  point.label = label;
  point.size = features.size();
  if (features.is_sparse()) {
    point.indices = features.indices();
  }
  point.values.assign(features.values().begin(), features.values().end());
  return point;
}

}  // namespace dataset
}  // namespace boosting_ingest
