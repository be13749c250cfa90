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

// Logging utilities. All the logging of the library goes through abseil
// logging ("LOG(INFO) << ..." and "CHECK(...)").

#ifndef BOOSTING_INGEST_UTILS_LOGGING_H_
#define BOOSTING_INGEST_UTILS_LOGGING_H_

#include <atomic>
#include <cstdint>
#include <string>

#include "absl/base/log_severity.h"
#include "absl/log/globals.h"
#include "absl/time/clock.h"
// IWYU pragma: begin_exports
#include "absl/log/check.h"
#include "absl/log/log.h"
// IWYU pragma: end_exports

// Prints something every INTERVAL seconds.
//
// Usage example:
//   LOG_INFO_EVERY_N_SEC(5, _ << "Processed " << num_rows << " rows");
//
#define LOG_INFO_EVERY_N_SEC(INTERVAL, MESSAGE)               \
  {                                                           \
    static std::atomic<int64_t> next_log_time_atomic{0};      \
    const auto now_time = absl::GetCurrentTimeNanos();        \
    const auto next_log_time =                                \
        next_log_time_atomic.load(std::memory_order_relaxed); \
    if (now_time > next_log_time) {                           \
      next_log_time_atomic.store(now_time + INTERVAL * 1e9,   \
                                 std::memory_order_relaxed);  \
      std::string _;                                          \
      LOG(INFO) << MESSAGE;                                   \
    }                                                         \
  }

namespace boosting_ingest {
namespace logging {

// Initialize logging for a library. Should be called once by the binary
// embedding the library.
void InitLoggingLib();

// Sets the amount of logging:
// 0: Only fatal i.e. before a crash of the program.
// 1: Only warning and fatal.
// 2: Info, warning and fatal i.e. all logging. Default.
inline void SetLoggingLevel(int level) {
  absl::LogSeverityAtLeast absl_level;
  switch (level) {
    case 0:
      absl_level = absl::LogSeverityAtLeast::kFatal;
      break;
    case 1:
      absl_level = absl::LogSeverityAtLeast::kWarning;
      break;
    default:
      absl_level = absl::LogSeverityAtLeast::kInfo;
      break;
  }
  absl::SetStderrThreshold(absl_level);
}

}  // namespace logging
}  // namespace boosting_ingest

#endif  // BOOSTING_INGEST_UTILS_LOGGING_H_
