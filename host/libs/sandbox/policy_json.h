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
#ifndef SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_POLICY_JSON_H
#define SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_POLICY_JSON_H

#include <optional>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <json/json.h>

#include "host/libs/sandbox/policy.h"

namespace sandbox_runtime {

absl::StatusOr<Json::Value> ParseJson(std::string_view input);

/** Reads the settings document layout: `network`, `filesystem`,
 * `ignoreViolations`, `enableWeakerNestedSandbox` and `ripgrep`. The result
 * is validated. */
absl::StatusOr<RestrictionPolicy> PolicyFromJson(const Json::Value& root);
absl::StatusOr<RestrictionPolicy> ParsePolicyJson(std::string_view input);

/** `nullopt` when the file is missing or blank. */
absl::StatusOr<std::optional<RestrictionPolicy>> LoadPolicyFromFile(
    const std::string& path);

}  // namespace sandbox_runtime

#endif
