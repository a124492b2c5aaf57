/*
 * Copyright (C) 2024 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#ifndef SANDBOX_RUNTIME_HOST_COMMANDS_SANDBOX_RUNTIME_LOGS_H
#define SANDBOX_RUNTIME_HOST_COMMANDS_SANDBOX_RUNTIME_LOGS_H

#include <string>
#include <vector>

#include <absl/status/status.h>

namespace sandbox_runtime {

/** Mirrors every log message into each of `paths`, appending. The sinks stay
 * registered until the process exits. */
absl::Status LogToFiles(const std::vector<std::string>& paths);

}  // namespace sandbox_runtime

#endif
