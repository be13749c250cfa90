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

// Labeled points are the unit records consumed by the gradient boosted trees
// training workers: a label, a feature vector (dense or sparse), and optional
// weight, ranking group and base margin.
//
// A labeled point is sparse iff "indices" is set. In this case, "values[i]" is
// the value of the feature "indices[i]", and the indices are strictly
// increasing and smaller than "size". Otherwise, "values" contains exactly
// "size" values.

#ifndef BOOSTING_INGEST_DATASET_LABELED_POINT_H_
#define BOOSTING_INGEST_DATASET_LABELED_POINT_H_

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace boosting_ingest {
namespace dataset {

struct LabeledPoint {
  float label = 0.f;

  // Dimension of the feature vector. Never changes once the point is created.
  int32_t size = 0;

  // Set iff the point is sparse.
  std::optional<std::vector<int32_t>> indices;
  std::vector<float> values;

  float weight = 1.f;
  std::optional<int32_t> group;
  std::optional<float> base_margin;

  bool is_sparse() const { return indices.has_value(); }

  // Index of the "value_idx"-th stored value.
  int32_t index(const size_t value_idx) const {
    return indices.has_value() ? (*indices)[value_idx]
                               : static_cast<int32_t>(value_idx);
  }
};

// Ranking group i.e. labeled points of the same query.
using LabeledPointGroup = std::vector<LabeledPoint>;

// Splits a list of points into groups of consecutive points with the same
// "group" value. Points without group are grouped together.
std::vector<LabeledPointGroup> GroupConsecutivePoints(
    std::vector<LabeledPoint> points);

// Two points are equal if all the fields are equal. NaN values are equal to
// each other.
bool operator==(const LabeledPoint& a, const LabeledPoint& b);
inline bool operator!=(const LabeledPoint& a, const LabeledPoint& b) {
  return !(a == b);
}

// Human readable representation e.g. "label:1 size:3 indices:[0 2]
// values:[0.5 2] weight:1".
std::string LabeledPointToString(const LabeledPoint& point);
std::ostream& operator<<(std::ostream& os, const LabeledPoint& point);

// Checks the dense / sparse invariants of a labeled point.
absl::Status CheckLabeledPoint(const LabeledPoint& point);

// Feature vector as provided by the tabular source. The values are double
// precision, and are narrowed to float when converted into a labeled point.
class FeatureVector {
 public:
  static FeatureVector Dense(std::vector<double> values);

  // Fails if the indices are not strictly increasing in [0, size) or if
  // "indices" and "values" have different sizes.
  static absl::StatusOr<FeatureVector> Sparse(int32_t size,
                                              std::vector<int32_t> indices,
                                              std::vector<double> values);

  bool is_sparse() const { return sparse_; }
  int32_t size() const { return size_; }

  // Empty for dense vectors.
  const std::vector<int32_t>& indices() const { return indices_; }
  const std::vector<double>& values() const { return values_; }

  bool operator==(const FeatureVector& other) const;
  bool operator!=(const FeatureVector& other) const {
    return !(*this == other);
  }

 private:
  FeatureVector(bool sparse, int32_t size, std::vector<int32_t> indices,
                std::vector<double> values)
      : sparse_(sparse),
        size_(size),
        indices_(std::move(indices)),
        values_(std::move(values)) {}

  bool sparse_;
  int32_t size_;
  std::vector<int32_t> indices_;
  std::vector<double> values_;
};

std::ostream& operator<<(std::ostream& os, const FeatureVector& vector);

// Feature vector of a labeled point. Dense iff the point is dense. Fails if
// the point does not satisfy the sparse invariants.
absl::StatusOr<FeatureVector> FeaturesOf(const LabeledPoint& point);

// Converts a feature vector into a labeled point with unit weight. The default
// label is a placeholder used to build prediction inputs.
LabeledPoint ToLabeledPoint(const FeatureVector& features, float label = 0.f);

}  // namespace dataset
}  // namespace boosting_ingest

#endif  // BOOSTING_INGEST_DATASET_LABELED_POINT_H_
