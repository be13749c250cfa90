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

#include "absl/log/initialize.h"

namespace boosting_ingest::logging {

void InitLoggingLib() {
  absl::InitializeLog();
  // By default, absl is configured to:
  //    minloglevel = info
  //    stderrthreshold = error
  // So, no LOG(INFO) is visible until "SetLoggingLevel(2)" is called.
}

}  // namespace boosting_ingest::logging
