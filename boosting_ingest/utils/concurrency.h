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

// Concurrency tools.
//
//   Channel: Synchronized queue with a blocking "Pop".
//   ThreadPool: Parallel execution of jobs (std::function<void(void)>) on a
//     pre-determined number of threads.
//   ConcurrentForEach: Runs a status-returning function over a range of
//     items on a thread pool and returns the first failure.
//
// Usage example:
//
//   {
//   ThreadPool pool("name", /*num_threads=*/10);
//   pool.StartWorkers();
//   pool.Schedule([](){...});
//   }  // Waits for all the jobs to be done.
//

#ifndef BOOSTING_INGEST_UTILS_CONCURRENCY_H_
#define BOOSTING_INGEST_UTILS_CONCURRENCY_H_

#include <stddef.h>

#include <cstdint>
#include <functional>
#include <queue>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/types/optional.h"
#include "boosting_ingest/utils/logging.h"
#include "boosting_ingest/utils/synchronization_primitives.h"

namespace boosting_ingest {
namespace utils {
namespace concurrency {

// Thread safe channel. The channel does not have a maximum capacity i.e. the
// input is not blocking.
template <typename Input>
class Channel {
 public:
  // Close the channel. No new items can be push in the channel.
  void Close() {
    MutexLock results_lock(&mutex_);
    close_channel_ = true;
    cond_var_.SignalAll();
  }

  // Push an item in the channel.
  void Push(Input item) {
    MutexLock results_lock(&mutex_);
    if (close_channel_) {
      LOG(ERROR) << "Ignoring value added to closed channel.";
      return;
    }
    content_.push(std::move(item));
    cond_var_.Signal();
  }

  // Pops a value from the channel. If the channel is closed and empty, returns
  // {}. If the channel is empty but not closed, blocks.
  absl::optional<Input> Pop() {
    MutexLock results_lock(&mutex_);
    while (content_.empty() && !close_channel_) {
      cond_var_.Wait(&mutex_);
    }
    if (content_.empty()) {
      return {};
    }
    Input input{std::move(content_.front())};
    content_.pop();
    return std::move(input);
  }

 private:
  std::queue<Input> content_ GUARDED_BY(mutex_);
  bool close_channel_ GUARDED_BY(mutex_) = false;
  CondVar cond_var_;
  Mutex mutex_;
};

class ThreadPool {
 public:
  // Creates the thread pool. Don't start any thread yet.
  // If "num_threads==0", callback are executed synchronously without threading
  // during "Schedule" calls.
  ThreadPool(std::string name, int num_threads);

  // Ensure all the jobs are done and all the threads have been joined.
  ~ThreadPool();

  // Starts the threads.
  void StartWorkers();

  // Schedules a new job. Returns immediately i.e. does not wait for the job to
  // be executed.
  // If "num_threads==0", execute "callback" synchronously.
  void Schedule(std::function<void()> callback);

 private:
  // Ensure all the jobs are done and all the threads have been joined.
  void JoinAllAndStopThreads();

  // Running loop for the threads.
  void ThreadLoop();

  std::string name_;
  int num_threads_;
  std::vector<std::thread> threads_;
  Channel<std::function<void()>> jobs_;
};

// Calls "function(item_idx)" for each item in [0, num_items) on "num_threads"
// threads. Blocks until all the calls are done. Returns the first non-ok
// status (in item order). Items scheduled after a failure are still executed.
// "num_threads" should be positive or zero (i.e. synchronous execution).
absl::Status ConcurrentForEach(
    int num_threads, size_t num_items,
    const std::function<absl::Status(size_t item_idx)>& function);

}  // namespace concurrency
}  // namespace utils
}  // namespace boosting_ingest

#endif  // BOOSTING_INGEST_UTILS_CONCURRENCY_H_
