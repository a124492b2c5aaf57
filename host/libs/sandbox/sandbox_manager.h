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
#ifndef SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_SANDBOX_MANAGER_H
#define SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_SANDBOX_MANAGER_H

#include <stdint.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/base/thread_annotations.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/synchronization/mutex.h>

#include "common/libs/utils/architecture.h"
#include "host/libs/network/domain_filter.h"
#include "host/libs/network/http_proxy.h"
#include "host/libs/network/linux_bridge.h"
#include "host/libs/network/socks_proxy.h"
#include "host/libs/sandbox/command_builder.h"
#include "host/libs/sandbox/macos_log_monitor.h"
#include "host/libs/sandbox/policy.h"
#include "host/libs/sandbox/violation_store.h"

namespace sandbox_runtime {

inline constexpr char kPermissionDeniedMarker[] =
    "[sandbox] blocked by sandbox filesystem/network policy";

struct SandboxManagerOptions {
  Platform platform = HostPlatform();
  /** Shell the wrapped command runs in, resolved in `PATH`. */
  std::string shell = "bash";
  /** Decides connections to hosts neither domain list mentions. */
  AskCallback ask;
  /** macOS only. Streams Seatbelt denials into the violation store. */
  bool enable_log_monitor = false;
  std::string proxy_host = "127.0.0.1";
  LinuxBridge::Options bridge;
};

struct NetworkRestrictionConfig {
  std::optional<std::vector<std::string>> allowed_hosts;
  std::optional<std::vector<std::string>> denied_hosts;

  bool operator==(const NetworkRestrictionConfig&) const = default;
};

/** Owns one sandbox session: the active policy, the proxies enforcing its
 * network rules and, on Linux, the bridge into the sandbox network namespace.
 *
 * Thread safe. `Initialize`, `UpdatePolicy` and `Reset` are serialized. */
class SandboxManager {
 public:
  /** Picks the command builder for `options.platform`. */
  static absl::StatusOr<std::unique_ptr<SandboxManager>> Create(
      ViolationStore& store, SandboxManagerOptions options);

  SandboxManager(ViolationStore& store, SandboxManagerOptions options,
                 std::unique_ptr<CommandBuilder> builder);
  SandboxManager(const SandboxManager&) = delete;
  SandboxManager& operator=(const SandboxManager&) = delete;
  ~SandboxManager();

  /** Starts the session. Calling it again with an equal policy keeps the
   * running session and its ports, a different policy replaces it. Anything
   * started by a failed call is torn down again. */
  absl::Status Initialize(const RestrictionPolicy& policy);

  /** `command` confined by the session policy with `overrides` applied. The
   * command is returned unchanged before `Initialize`. */
  absl::StatusOr<std::string> WrapWithSandbox(
      const std::string& command,
      const std::optional<PolicyOverrides>& overrides = std::nullopt);

  /** Replaces the policy without restarting anything. The proxies filter
   * with the new domain lists from the next connection on. */
  absl::Status UpdatePolicy(const RestrictionPolicy& policy);

  /** Stops everything `Initialize` started. A no-op when inactive. */
  void Reset();

  bool IsSandboxingEnabled();
  std::optional<RestrictionPolicy> GetPolicy();
  std::optional<uint16_t> GetProxyPort();
  std::optional<uint16_t> GetSocksProxyPort();
  std::optional<std::string> GetLinuxHttpSocketPath();
  std::optional<std::string> GetLinuxSocksSocketPath();
  NetworkRestrictionConfig GetNetworkRestrictionConfig();

  /** Configured paths that Linux drops since bind mounts need concrete
   * paths. Empty on other platforms. */
  std::vector<std::string> GlobPatternWarnings();

  /** Appends the recorded denials of `command` to `stderr`, and prepends
   * `kPermissionDeniedMarker` when `stderr` shows a generic permission
   * error. */
  std::string AnnotateStderrWithSandboxFailures(std::string_view command,
                                                std::string_view stderr_text);

  ViolationStore& Violations() { return store_; }

  /** The decision both proxies apply, using the current policy. */
  bool AllowConnection(uint16_t port, const std::string& host);

 private:
  void ResetLocked() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
  absl::Status StartLocked(const RestrictionPolicy& policy)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
  WrapRequest RequestFor(const RestrictionPolicy& policy,
                         const std::string& command)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
  void SetNetworkPolicy(std::optional<NetworkPolicy> network);
  std::vector<std::string> SandboxablePaths(
      const std::vector<std::string>& patterns) const;

  ViolationStore& store_;
  const SandboxManagerOptions options_;
  const std::unique_ptr<CommandBuilder> builder_;

  absl::Mutex mu_;
  std::optional<RestrictionPolicy> policy_ ABSL_GUARDED_BY(mu_);
  std::unique_ptr<HttpProxy> http_proxy_ ABSL_GUARDED_BY(mu_);
  std::unique_ptr<SocksProxy> socks_proxy_ ABSL_GUARDED_BY(mu_);
  std::optional<uint16_t> http_port_ ABSL_GUARDED_BY(mu_);
  std::optional<uint16_t> socks_port_ ABSL_GUARDED_BY(mu_);
  std::unique_ptr<LinuxBridge> bridge_ ABSL_GUARDED_BY(mu_);
  std::unique_ptr<MacOsLogMonitor> monitor_ ABSL_GUARDED_BY(mu_);

  // Separate from `mu_` so proxy workers never wait on a `Reset` that is
  // joining them.
  absl::Mutex network_mu_;
  std::optional<NetworkPolicy> network_ ABSL_GUARDED_BY(network_mu_);
};

}  // namespace sandbox_runtime

#endif
