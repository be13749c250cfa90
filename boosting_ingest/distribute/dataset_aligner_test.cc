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

#include <algorithm>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "boosting_ingest/dataset/ingest_config.pb.h"
#include "boosting_ingest/dataset/labeled_point.h"
#include "boosting_ingest/utils/test.h"
#include "boosting_ingest/utils/testing_macros.h"

namespace boosting_ingest {
namespace distribute {
namespace {

using test::StatusIs;
using testing::ElementsAre;
using testing::SizeIs;
using testing::UnorderedElementsAre;

// Point identified by its label.
dataset::LabeledPoint MakePoint(const float label) {
  dataset::LabeledPoint point;
  point.label = label;
  point.size = 1;
  point.values = {label};
  return point;
}

// Dataset with "num_partitions" partitions of "partition_size" points. The
// points are labeled 0, 1, 2... and keyed with their label.
KeyedDataset MakeDataset(const int num_partitions, const int partition_size) {
  KeyedDataset dataset(num_partitions);
  int next_label = 0;
  for (auto& partition : dataset) {
    for (int i = 0; i < partition_size; i++) {
      partition.push_back({next_label, MakePoint(next_label)});
      next_label++;
    }
  }
  return dataset;
}

std::vector<float> Labels(const std::vector<dataset::LabeledPoint>& points) {
  std::vector<float> labels;
  for (const auto& point : points) {
    labels.push_back(point.label);
  }
  return labels;
}

size_t NumPoints(const WorkerPartitions& partitions) {
  size_t num_points = 0;
  for (const auto& partition : partitions) {
    num_points += partition.size();
  }
  return num_points;
}

TEST(DatasetAligner, WorkerOfKey) {
  EXPECT_EQ(WorkerOfKey(0, 3), 0);
  EXPECT_EQ(WorkerOfKey(7, 3), 1);
  EXPECT_EQ(WorkerOfKey(-1, 3), 2);
  EXPECT_EQ(WorkerOfKey(-3, 3), 0);
}

TEST(DatasetAligner, PartitionByKeyIsStable) {
  ASSERT_OK_AND_ASSIGN(const auto partitions,
                       PartitionByKey(MakeDataset(2, 4), 3));
  ASSERT_THAT(partitions, SizeIs(3));
  EXPECT_THAT(Labels(partitions[0]), ElementsAre(0, 3, 6));
  EXPECT_THAT(Labels(partitions[1]), ElementsAre(1, 4, 7));
  EXPECT_THAT(Labels(partitions[2]), ElementsAre(2, 5));
}

TEST(DatasetAligner, RedistributeCheapPath) {
  // Uneven partitions are kept as is when their count matches.
  KeyedDataset dataset = MakeDataset(3, 2);
  dataset[0].push_back({kPlaceholderPartitionKey, MakePoint(100)});
  ASSERT_OK_AND_ASSIGN(const auto partitions,
                       Redistribute(std::move(dataset), 3));
  ASSERT_THAT(partitions, SizeIs(3));
  EXPECT_THAT(Labels(partitions[0]), ElementsAre(0, 1, 100));
  EXPECT_THAT(Labels(partitions[1]), ElementsAre(2, 3));
  EXPECT_THAT(Labels(partitions[2]), ElementsAre(4, 5));
}

TEST(DatasetAligner, RedistributeIsEven) {
  for (const int num_input_partitions : {1, 2, 5}) {
    for (const int num_workers : {3, 4, 7}) {
      if (num_input_partitions == num_workers) {
        continue;
      }
      ASSERT_OK_AND_ASSIGN(
          const auto partitions,
          Redistribute(MakeDataset(num_input_partitions, 50), num_workers));
      ASSERT_THAT(partitions, SizeIs(num_workers));
      EXPECT_EQ(NumPoints(partitions),
                static_cast<size_t>(num_input_partitions * 50));

      size_t min_size = partitions.front().size();
      size_t max_size = partitions.front().size();
      for (const auto& partition : partitions) {
        min_size = std::min(min_size, partition.size());
        max_size = std::max(max_size, partition.size());
      }
      EXPECT_LE(max_size - min_size,
                static_cast<size_t>(num_input_partitions));
    }
  }
}

TEST(DatasetAligner, RedistributeKeepsGroupRuns) {
  // Group ids of the points of each input partition. Group 1 continues in the
  // second partition.
  const std::vector<std::vector<int>> point_groups = {{0, 0, 1, 1, 1},
                                                      {1, 2, 2}};
  KeyedDataset dataset(point_groups.size());
  int next_label = 0;
  for (size_t partition_idx = 0; partition_idx < point_groups.size();
       partition_idx++) {
    for (const int group : point_groups[partition_idx]) {
      auto point = MakePoint(next_label++);
      point.group = group;
      dataset[partition_idx].push_back(
          {kPlaceholderPartitionKey, std::move(point)});
    }
  }
  ASSERT_OK_AND_ASSIGN(const auto partitions,
                       Redistribute(std::move(dataset), 3));
  ASSERT_THAT(partitions, SizeIs(3));
  EXPECT_EQ(NumPoints(partitions), 8u);

  std::vector<std::vector<float>> group_labels;
  for (const auto& partition : partitions) {
    for (const auto& group : dataset::GroupConsecutivePoints(partition)) {
      group_labels.push_back(Labels(group));
    }
  }
  EXPECT_THAT(group_labels,
              UnorderedElementsAre(ElementsAre(0, 1), ElementsAre(2, 3, 4, 5),
                                   ElementsAre(6, 7)));
}

TEST(DatasetAligner, RedistributeIsReproducible) {
  ASSERT_OK_AND_ASSIGN(const auto partitions_1,
                       Redistribute(MakeDataset(3, 10), 4));
  ASSERT_OK_AND_ASSIGN(const auto partitions_2,
                       Redistribute(MakeDataset(3, 10), 4));
  EXPECT_EQ(partitions_1, partitions_2);
}

TEST(DatasetAligner, InvalidNumWorkers) {
  EXPECT_THAT(PartitionByKey(MakeDataset(1, 1), 0).status(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Invalid partition configuration"));
  EXPECT_THAT(Redistribute(MakeDataset(1, 1), -1).status(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Invalid partition configuration"));

  const dataset::proto::PartitionConfig config = PARSE_TEST_PROTO(R"pb(
    num_workers: 0
  )pb");
  EXPECT_THAT(AlignDatasets({MakeDataset(1, 1)}, config).status(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Invalid partition configuration"));
}

TEST(DatasetAligner, DeterministicDatasetsAreAligned) {
  const dataset::proto::PartitionConfig config = PARSE_TEST_PROTO(R"pb(
    num_workers: 4 deterministic_partition: true
  )pb");
  // The same keys, with different input partitioning.
  ASSERT_OK_AND_ASSIGN(
      const auto aligned,
      AlignDatasets({MakeDataset(1, 12), MakeDataset(3, 4)}, config));
  ASSERT_THAT(aligned, SizeIs(2));
  for (int worker = 0; worker < 4; worker++) {
    EXPECT_EQ(Labels(aligned[0][worker]), Labels(aligned[1][worker]));
    for (const auto label : Labels(aligned[0][worker])) {
      EXPECT_EQ(static_cast<int>(label) % 4, worker);
    }
  }
}

TEST(DatasetAligner, NonDeterministicDatasetsAreIndependent) {
  const dataset::proto::PartitionConfig config = PARSE_TEST_PROTO(R"pb(
    num_workers: 2
  )pb");
  ASSERT_OK_AND_ASSIGN(
      const auto aligned,
      AlignDatasets({MakeDataset(2, 3), MakeDataset(5, 3)}, config));
  ASSERT_THAT(aligned, SizeIs(2));

  // The first dataset already has two partitions.
  EXPECT_THAT(Labels(aligned[0][0]), ElementsAre(0, 1, 2));
  EXPECT_THAT(Labels(aligned[0][1]), ElementsAre(3, 4, 5));

  ASSERT_THAT(aligned[1], SizeIs(2));
  EXPECT_EQ(NumPoints(aligned[1]), 15u);
}

TEST(DatasetAligner, NoDatasets) {
  const dataset::proto::PartitionConfig config = PARSE_TEST_PROTO(R"pb(
    num_workers: 2
  )pb");
  ASSERT_OK_AND_ASSIGN(const auto aligned, AlignDatasets({}, config));
  EXPECT_TRUE(aligned.empty());
}

}  // namespace
}  // namespace distribute
}  // namespace boosting_ingest
