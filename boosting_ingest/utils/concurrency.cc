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

#include "boosting_ingest/utils/concurrency.h"

#include <algorithm>

#include "absl/strings/str_cat.h"

namespace boosting_ingest {
namespace utils {
namespace concurrency {

ThreadPool::ThreadPool(std::string name, int num_threads)
    : name_(std::move(name)), num_threads_(num_threads) {}

ThreadPool::~ThreadPool() { JoinAllAndStopThreads(); }

void ThreadPool::JoinAllAndStopThreads() {
  if (num_threads_ == 0) {
    return;
  }
  jobs_.Close();
  for (auto& thread : threads_) {
    thread.join();
  }
  threads_.clear();
}

void ThreadPool::StartWorkers() {
  while (static_cast<int>(threads_.size()) < num_threads_) {
    threads_.emplace_back(&ThreadPool::ThreadLoop, this);
  }
}

void ThreadPool::Schedule(std::function<void()> callback) {
  if (num_threads_ == 0) {
    callback();
  } else {
    jobs_.Push(std::move(callback));
  }
}

void ThreadPool::ThreadLoop() {
  while (true) {
    auto optional_input = jobs_.Pop();
    if (!optional_input.has_value()) {
      break;
    }
    std::move(optional_input).value()();
  }
}

absl::Status ConcurrentForEach(
    const int num_threads, const size_t num_items,
    const std::function<absl::Status(size_t item_idx)>& function) {
  if (num_threads < 0) {
    return absl::InvalidArgumentError(absl::StrCat(
        "The number of threads should be positive or zero. Got num_threads=",
        num_threads));
  }
  std::vector<absl::Status> statuses(num_items);
  {
    ThreadPool pool("ConcurrentForEach",
                    std::min<int>(num_threads, static_cast<int>(num_items)));
    pool.StartWorkers();
    for (size_t item_idx = 0; item_idx < num_items; item_idx++) {
      pool.Schedule([&function, &statuses, item_idx]() {
        statuses[item_idx] = function(item_idx);
      });
    }
  }
  for (const auto& status : statuses) {
    if (!status.ok()) {
      return status;
    }
  }
  return absl::OkStatus();
}

}  // namespace concurrency
}  // namespace utils
}  // namespace boosting_ingest
