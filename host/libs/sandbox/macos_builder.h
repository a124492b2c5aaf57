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
#ifndef SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_MACOS_BUILDER_H
#define SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_MACOS_BUILDER_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "host/libs/sandbox/command_builder.h"
#include "host/libs/sandbox/policy.h"
#include "host/libs/sandbox/sandbox_paths.h"

namespace sandbox_runtime {

/** `_<18 hex digits>_SBX`, fixed for the lifetime of the process. Every
 * Seatbelt denial this process causes is logged with a message ending in
 * it. */
const std::string& SessionSuffix();

/** `CMD64_<base64 of the command>_END<suffix>` */
std::string SeatbeltLogTag(std::string_view command,
                           std::string_view session_suffix);

/** Parents of a macOS per-user `$TMPDIR` (`/var/folders/xx/yyy/T`) in both
 * their `/var` and `/private/var` spellings. Empty for any other value. */
std::vector<std::string> TmpdirParents(const std::optional<std::string>& tmpdir);

/** `file-write-unlink` denials that keep `patterns` and their ancestors from
 * being renamed or moved away. */
std::vector<std::string> MoveBlockingRules(
    const std::vector<std::string>& patterns, const PathContext& context,
    std::string_view log_tag);

/** The Seatbelt profile text for `request`. */
absl::StatusOr<std::string> SeatbeltProfile(const WrapRequest& request,
                                            std::string_view log_tag);

/** Wraps commands in `sandbox-exec` with a generated Seatbelt profile. */
class MacOsCommandBuilder : public CommandBuilder {
 public:
  explicit MacOsCommandBuilder(std::string session_suffix);

  absl::StatusOr<std::string> Wrap(const WrapRequest& request) override;
  absl::Status CheckDependencies(const RestrictionPolicy& policy) override;

 private:
  const std::string session_suffix_;
};

}  // namespace sandbox_runtime

#endif
