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
#ifndef SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_COMMAND_BUILDER_H
#define SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_COMMAND_BUILDER_H

#include <stdint.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/libs/utils/architecture.h"
#include "host/libs/sandbox/policy.h"
#include "host/libs/sandbox/sandbox_paths.h"

namespace sandbox_runtime {

struct ReadRestriction {
  std::vector<std::string> deny_only;
};

struct WriteRestriction {
  std::vector<std::string> allow_only;
  std::vector<std::string> deny_within_allow;
};

/** Everything one wrapping needs. Builders hold no per-command state. */
struct WrapRequest {
  std::string command;
  bool needs_network_restriction = false;
  /** Host-side proxy ports. */
  std::optional<uint16_t> http_proxy_port;
  std::optional<uint16_t> socks_proxy_port;
  /** Linux bridge sockets, required when network is restricted there. */
  std::optional<std::string> http_socket_path;
  std::optional<std::string> socks_socket_path;
  std::optional<std::vector<std::string>> allow_unix_sockets;
  bool allow_all_unix_sockets = false;
  bool allow_local_binding = false;
  std::optional<ReadRestriction> read;
  /** `nullopt` leaves writes unrestricted. */
  std::optional<WriteRestriction> write;
  bool enable_weaker_nested_sandbox = false;
  std::string shell = "bash";
  /** When unset the mandatory deny scan is skipped. */
  std::optional<RipgrepConfig> ripgrep;
  PathContext paths;
  /** `$TMPDIR` of the caller, used on macOS. */
  std::optional<std::string> tmpdir;
};

/** False only when there is no network restriction, no denied reads and no
 * write policy. An empty allow list still counts as a write policy. */
bool NeedsSandboxing(const WrapRequest& request);

/** Translates a request into a single shell-invocable confined command. */
class CommandBuilder {
 public:
  virtual ~CommandBuilder() = default;

  /** Returns `request.command` unchanged when `NeedsSandboxing` is false. */
  virtual absl::StatusOr<std::string> Wrap(const WrapRequest& request) = 0;

  /** `FailedPrecondition` naming the first missing tool. */
  virtual absl::Status CheckDependencies(const RestrictionPolicy& policy) = 0;
};

absl::StatusOr<std::unique_ptr<CommandBuilder>> CommandBuilderForPlatform(
    Platform platform);

/** Absolute path of `shell`, `NotFound` when it is not on `PATH`. */
absl::StatusOr<std::string> ResolveShell(const std::string& shell);

/** User denies plus the mandatory ones when `request.ripgrep` is set. */
absl::StatusOr<std::vector<std::string>> WriteDenyPaths(
    const WrapRequest& request);

}  // namespace sandbox_runtime

#endif
