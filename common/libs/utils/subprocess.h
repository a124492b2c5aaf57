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
#ifndef SANDBOX_RUNTIME_COMMON_LIBS_UTILS_SUBPROCESS_H
#define SANDBOX_RUNTIME_COMMON_LIBS_UTILS_SUBPROCESS_H

#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <absl/time/time.h>

namespace sandbox_runtime {

struct CapturedOutput {
  int exit_code;
  std::string stdout_str;
  std::string stderr_str;
};

/** Resolves `name` against `$PATH`. Names containing a `/` are only checked
 * for being executable. */
absl::StatusOr<std::string> FindExecutable(std::string_view name);

/** `environ` of this process as `KEY=VALUE` strings. */
std::vector<std::string> CurrentEnvironment();

/** Runs `argv` with stdin on /dev/null and collects stdout and stderr.
 *
 * `argv[0]` is looked up with `FindExecutable`. When `timeout` passes first
 * the whole process tree is killed and `DeadlineExceeded` is returned. */
absl::StatusOr<CapturedOutput> RunWithCapturedOutput(
    const std::vector<std::string>& argv,
    absl::Duration timeout = absl::InfiniteDuration());

}  // namespace sandbox_runtime

#endif
