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
#ifndef SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_MANDATORY_DENY_H
#define SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_MANDATORY_DENY_H

#include <string>
#include <vector>

#include <absl/status/statusor.h>
#include <absl/time/time.h>

#include "host/libs/sandbox/policy.h"
#include "host/libs/sandbox/sandbox_paths.h"

namespace sandbox_runtime {

/** Runs `<command> [config args] <args> <target>` and returns its output
 * lines. Exit code 1 is "no matches". Any other failure is an error,
 * including running past `timeout`. */
absl::StatusOr<std::vector<std::string>> RipGrep(
    const RipgrepConfig& config, const std::vector<std::string>& args,
    const std::string& target,
    absl::Duration timeout = absl::Seconds(10));

/** Paths that stay read-only inside any writable area: shell rc files, git
 * hooks and config, editor settings and this tool's own settings, both at
 * fixed locations and wherever a scan of `context.cwd` finds them.
 *
 * A failed scan fails the whole lookup. The result is sorted and
 * de-duplicated. */
absl::StatusOr<std::vector<std::string>> MandatoryDenyWithinAllow(
    const RipgrepConfig& ripgrep, const PathContext& context);

}  // namespace sandbox_runtime

#endif
