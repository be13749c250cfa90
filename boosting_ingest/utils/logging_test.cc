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

#include "boosting_ingest/utils/logging.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace boosting_ingest {
namespace utils {
namespace {

TEST(Logging, InitLoggingLib) {
  logging::InitLoggingLib();
  LOG(INFO) << "Logging initialized";
}

TEST(Logging, LogInfo) { LOG(INFO) << "Hello world"; }

TEST(Logging, LogInfoEveryNSec) {
  logging::SetLoggingLevel(2);
  for (int i = 0; i < 3; i++) {
    LOG_INFO_EVERY_N_SEC(10, _ << "Iteration " << i);
  }
  logging::SetLoggingLevel(1);
}

}  // namespace
}  // namespace utils
}  // namespace boosting_ingest
