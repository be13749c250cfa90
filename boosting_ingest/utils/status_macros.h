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

// Utility macros for the manipulation of absl's status.

#ifndef BOOSTING_INGEST_UTILS_STATUS_MACROS_H_
#define BOOSTING_INGEST_UTILS_STATUS_MACROS_H_

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

// Evaluates an expression returning a absl::Status. Returns with the status
// if the status is not "OK".
//
// Usage example:
//   absl::Status f() {
//     auto g = []() -> absl::Status { ... };
//     RETURN_IF_ERROR(g());
//     return absl::OkStatus();
//   }
#ifndef RETURN_IF_ERROR
#define RETURN_IF_ERROR(expr)                \
  {                                          \
    auto _status = (expr);                   \
    if (ABSL_PREDICT_FALSE(!_status.ok())) { \
      return _status;                        \
    }                                        \
  }
#endif

#define TOKEN_PASTE(x, y) x##y
#define CONCATENATE(x, y) TOKEN_PASTE(x, y)

// Evaluates an expression returning a absl::StatusOr. Returns with the status
// if the status is not "OK". Move the value to "lhs" and continue the execution
// otherwise.
//
// Usage example:
//   absl::Status f() {
//     auto g = []() -> absl::StatusOr<int> { ... };
//     ASSIGN_OR_RETURN(const auto x, g());
//     return absl::OkStatus();
//   }
#define ASSIGN_OR_RETURN(lhs, rexpr) \
  ASSIGN_OR_RETURN_IMP(lhs, rexpr, CONCATENATE(_status_or_value, __LINE__))

#define ASSIGN_OR_RETURN_IMP(lhs, rexpr, tmpvar) \
  auto tmpvar = (rexpr);                         \
  if (ABSL_PREDICT_FALSE(!tmpvar.ok())) {        \
    return tmpvar.status();                      \
  }                                              \
  lhs = std::move(tmpvar).value()

// Returns an InvalidArgument error if the condition does not hold.
// NOLINTBEGIN
#define STATUS_CHECK(expr) \
  if (!(expr)) return absl::InvalidArgumentError("Check failed " #expr)
#define STATUS_CHECK_GE(a, b) STATUS_CHECK(a >= b)
// NOLINTEND

#endif  // BOOSTING_INGEST_UTILS_STATUS_MACROS_H_
