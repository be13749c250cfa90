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
#include <limits>
#include <optional>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "boosting_ingest/utils/test.h"
#include "boosting_ingest/utils/testing_macros.h"

namespace boosting_ingest {
namespace dataset {
namespace {

using test::StatusIs;
using testing::ElementsAre;

TEST(LabeledPoint, CheckDense) {
  LabeledPoint point;
  point.size = 3;
  point.values = {1.f, 2.f, 3.f};
  EXPECT_OK(CheckLabeledPoint(point));
  EXPECT_FALSE(point.is_sparse());
  EXPECT_EQ(point.index(2), 2);

  point.values.pop_back();
  EXPECT_THAT(CheckLabeledPoint(point),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Dense labeled point of size 3 with 2 values"));
}

TEST(LabeledPoint, CheckSparse) {
  LabeledPoint point;
  point.size = 10;
  point.indices = std::vector<int32_t>{1, 4, 9};
  point.values = {1.f, 2.f, 3.f};
  EXPECT_OK(CheckLabeledPoint(point));
  EXPECT_TRUE(point.is_sparse());
  EXPECT_EQ(point.index(1), 4);

  point.indices = std::vector<int32_t>{1, 1, 9};
  EXPECT_THAT(CheckLabeledPoint(point),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "not strictly increasing"));

  point.indices = std::vector<int32_t>{1, 4, 10};
  EXPECT_THAT(CheckLabeledPoint(point),
              StatusIs(absl::StatusCode::kInvalidArgument, "out of range"));

  point.indices = std::vector<int32_t>{1, 4};
  EXPECT_THAT(CheckLabeledPoint(point),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "2 indices and 3 values"));
}

TEST(LabeledPoint, EqualityWithNaN) {
  LabeledPoint a;
  a.size = 2;
  a.values = {std::numeric_limits<float>::quiet_NaN(), 1.f};
  a.base_margin = std::numeric_limits<float>::quiet_NaN();
  LabeledPoint b = a;
  EXPECT_EQ(a, b);

  b.group = 4;
  EXPECT_NE(a, b);

  b = a;
  b.indices = std::vector<int32_t>{0, 1};
  EXPECT_NE(a, b);
}

TEST(LabeledPoint, ToString) {
  LabeledPoint point;
  point.label = 1.f;
  point.size = 3;
  point.indices = std::vector<int32_t>{0, 2};
  point.values = {0.5f, 2.f};
  point.group = 7;
  EXPECT_EQ(LabeledPointToString(point),
            "label:1 size:3 indices:[0 2] values:[0.5 2] weight:1 group:7");
}

TEST(LabeledPoint, GroupConsecutivePoints) {
  std::vector<LabeledPoint> points(6);
  const std::vector<std::optional<int32_t>> group_ids = {
      1, 1, 2, std::nullopt, std::nullopt, 1};
  for (size_t i = 0; i < points.size(); i++) {
    points[i].label = static_cast<float>(i);
    points[i].group = group_ids[i];
  }
  const auto groups = GroupConsecutivePoints(points);
  ASSERT_EQ(groups.size(), 4);
  EXPECT_EQ(groups[0].size(), 2);
  EXPECT_EQ(groups[1].size(), 1);
  EXPECT_EQ(groups[2].size(), 2);
  EXPECT_EQ(groups[3].size(), 1);
  EXPECT_EQ(groups[3][0].label, 5.f);

  EXPECT_TRUE(GroupConsecutivePoints({}).empty());
}

TEST(FeatureVector, Sparse) {
  ASSERT_OK_AND_ASSIGN(const auto vector,
                       FeatureVector::Sparse(5, {0, 3}, {1.0, 2.0}));
  EXPECT_TRUE(vector.is_sparse());
  EXPECT_EQ(vector.size(), 5);
  EXPECT_THAT(vector.indices(), ElementsAre(0, 3));

  EXPECT_THAT(FeatureVector::Sparse(5, {3, 0}, {1.0, 2.0}).status(),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(FeatureVector::Sparse(2, {0, 3}, {1.0, 2.0}).status(),
              StatusIs(absl::StatusCode::kInvalidArgument, "out of range"));
}

TEST(FeatureVector, ToLabeledPointWithPlaceholderLabel) {
  const auto point = ToLabeledPoint(FeatureVector::Dense({1.5, 2.5}));
  EXPECT_EQ(point.label, 0.f);
  EXPECT_EQ(point.weight, 1.f);
  EXPECT_EQ(point.size, 2);
  EXPECT_FALSE(point.is_sparse());
  EXPECT_THAT(point.values, ElementsAre(1.5f, 2.5f));
}

TEST(FeatureVector, ToLabeledPointSparse) {
  ASSERT_OK_AND_ASSIGN(const auto vector,
                       FeatureVector::Sparse(8, {2, 5}, {1.0, -1.0}));
  const auto point = ToLabeledPoint(vector, /*label=*/3.f);
  EXPECT_EQ(point.label, 3.f);
  EXPECT_EQ(point.size, 8);
  ASSERT_TRUE(point.is_sparse());
  EXPECT_THAT(*point.indices, ElementsAre(2, 5));
  EXPECT_THAT(point.values, ElementsAre(1.f, -1.f));
}

TEST(FeatureVector, FeaturesOf) {
  LabeledPoint dense;
  dense.size = 2;
  dense.values = {1.f, 2.f};
  ASSERT_OK_AND_ASSIGN(const auto dense_features, FeaturesOf(dense));
  EXPECT_EQ(dense_features, FeatureVector::Dense({1.0, 2.0}));

  LabeledPoint sparse;
  sparse.size = 6;
  sparse.indices = std::vector<int32_t>{4};
  sparse.values = {0.25f};
  ASSERT_OK_AND_ASSIGN(const auto sparse_features, FeaturesOf(sparse));
  ASSERT_OK_AND_ASSIGN(const auto expected_sparse,
                       FeatureVector::Sparse(6, {4}, {0.25}));
  EXPECT_EQ(sparse_features, expected_sparse);

  sparse.indices = std::vector<int32_t>{7};
  EXPECT_THAT(FeaturesOf(sparse).status(),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

}  // namespace
}  // namespace dataset
}  // namespace boosting_ingest
