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

// Single pass streams of labeled points and of ranking groups.

#ifndef BOOSTING_INGEST_DATASET_LABELED_POINT_READER_H_
#define BOOSTING_INGEST_DATASET_LABELED_POINT_READER_H_

#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "boosting_ingest/dataset/labeled_point.h"
#include "boosting_ingest/utils/status_macros.h"

namespace boosting_ingest {
namespace dataset {

// Interface to read a stream of records.
template <typename T>
class RecordReader {
 public:
  virtual ~RecordReader() = default;

  // Tries to retrieve the next available record. If no more records are
  // available, returns false.
  virtual absl::StatusOr<bool> Next(T* record) = 0;
};

using LabeledPointReader = RecordReader<LabeledPoint>;
using LabeledPointGroupReader = RecordReader<LabeledPointGroup>;

// Reads records from memory.
template <typename T>
class InMemoryReader : public RecordReader<T> {
 public:
  explicit InMemoryReader(std::vector<T> records)
      : records_(std::move(records)) {}

  absl::StatusOr<bool> Next(T* record) override {
    if (next_record_idx_ >= records_.size()) {
      return false;
    }
    *record = std::move(records_[next_record_idx_++]);
    return true;
  }

 private:
  std::vector<T> records_;
  size_t next_record_idx_ = 0;
};

// Reads all the remaining records of a reader.
template <typename T>
absl::StatusOr<std::vector<T>> ReadAll(RecordReader<T>* reader) {
  std::vector<T> records;
  T record;
  while (true) {
    ASSIGN_OR_RETURN(const bool has_record, reader->Next(&record));
    if (!has_record) {
      break;
    }
    records.push_back(std::move(record));
  }
  return records;
}

}  // namespace dataset
}  // namespace boosting_ingest

#endif  // BOOSTING_INGEST_DATASET_LABELED_POINT_READER_H_
