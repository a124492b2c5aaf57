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
#include "host/libs/sandbox/command_builder.h"

#include <memory>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

#include "common/libs/utils/architecture.h"
#include "common/libs/utils/subprocess.h"
#include "host/libs/sandbox/linux_builder.h"
#include "host/libs/sandbox/macos_builder.h"
#include "host/libs/sandbox/mandatory_deny.h"
#include "host/libs/sandbox/seccomp_filter.h"

namespace sandbox_runtime {

bool NeedsSandboxing(const WrapRequest& request) {
  bool has_read_restrictions = request.read && !request.read->deny_only.empty();
  return request.needs_network_restriction || has_read_restrictions ||
         request.write.has_value();
}

absl::StatusOr<std::unique_ptr<CommandBuilder>> CommandBuilderForPlatform(
    Platform platform) {
  switch (platform) {
    case Platform::kMacOS:
      return std::make_unique<MacOsCommandBuilder>(SessionSuffix());
    case Platform::kLinux:
      return std::make_unique<LinuxCommandBuilder>(
          FilterPathForHostArch(), ApplySeccompPathForHostArch());
    default:
      return absl::UnimplementedError(
          "Sandboxing is only supported on Linux and macOS");
  }
}

absl::StatusOr<std::string> ResolveShell(const std::string& shell) {
  absl::StatusOr<std::string> path = FindExecutable(shell);
  if (!path.ok()) {
    return absl::NotFoundError(
        absl::StrCat("Shell '", shell, "' not found in PATH"));
  }
  return path;
}

absl::StatusOr<std::vector<std::string>> WriteDenyPaths(
    const WrapRequest& request) {
  std::vector<std::string> deny;
  if (request.write) {
    deny = request.write->deny_within_allow;
  }
  if (request.ripgrep) {
    auto mandatory = MandatoryDenyWithinAllow(*request.ripgrep, request.paths);
    if (!mandatory.ok()) {
      return mandatory.status();
    }
    deny.insert(deny.end(), mandatory->begin(), mandatory->end());
  }
  return deny;
}

}  // namespace sandbox_runtime
