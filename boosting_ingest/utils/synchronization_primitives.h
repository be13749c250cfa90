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

// Synchronization primitives used by the thread pool.

#ifndef BOOSTING_INGEST_UTILS_SYNCHRONIZATION_PRIMITIVES_H_
#define BOOSTING_INGEST_UTILS_SYNCHRONIZATION_PRIMITIVES_H_

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace boosting_ingest {
namespace utils {
namespace concurrency {

using Mutex = absl::Mutex;
using MutexLock = absl::MutexLock;

class CondVar {
 public:
  void Signal() { cv_.Signal(); }
  void SignalAll() { cv_.SignalAll(); }
  void Wait(Mutex* mutex) { cv_.Wait(mutex); }

 private:
  absl::CondVar cv_;
};

#ifndef GUARDED_BY
#define GUARDED_BY(x) ABSL_GUARDED_BY(x)
#endif

}  // namespace concurrency
}  // namespace utils
}  // namespace boosting_ingest

#endif  // BOOSTING_INGEST_UTILS_SYNCHRONIZATION_PRIMITIVES_H_
