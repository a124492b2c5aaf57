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
#include "host/libs/sandbox/sandbox_manager.h"

#include <errno.h>
#include <stdint.h>
#include <stdlib.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/synchronization/mutex.h>

#include "common/libs/utils/architecture.h"
#include "common/libs/utils/files.h"
#include "host/libs/network/domain_filter.h"
#include "host/libs/network/http_proxy.h"
#include "host/libs/network/linux_bridge.h"
#include "host/libs/network/socks_proxy.h"
#include "host/libs/sandbox/command_builder.h"
#include "host/libs/sandbox/macos_builder.h"
#include "host/libs/sandbox/macos_log_monitor.h"
#include "host/libs/sandbox/policy.h"
#include "host/libs/sandbox/sandbox_paths.h"
#include "host/libs/sandbox/violation_store.h"

namespace sandbox_runtime {

absl::StatusOr<std::unique_ptr<SandboxManager>> SandboxManager::Create(
    ViolationStore& store, SandboxManagerOptions options) {
  absl::StatusOr<std::unique_ptr<CommandBuilder>> builder =
      CommandBuilderForPlatform(options.platform);
  if (!builder.ok()) {
    return builder.status();
  }
  return std::make_unique<SandboxManager>(store, std::move(options),
                                          std::move(*builder));
}

SandboxManager::SandboxManager(ViolationStore& store,
                               SandboxManagerOptions options,
                               std::unique_ptr<CommandBuilder> builder)
    : store_(store), options_(std::move(options)), builder_(std::move(builder)) {}

SandboxManager::~SandboxManager() { Reset(); }

absl::Status SandboxManager::Initialize(const RestrictionPolicy& policy) {
  if (absl::Status valid = ValidatePolicy(policy); !valid.ok()) {
    return valid;
  }
  absl::MutexLock lock(&mu_);
  if (policy_.has_value()) {
    if (*policy_ == policy) {
      VLOG(1) << "Sandbox already initialized with this policy";
      return absl::OkStatus();
    }
    LOG(INFO) << "Policy changed, restarting sandbox network infrastructure";
    ResetLocked();
  }
  absl::Status started = StartLocked(policy);
  if (!started.ok()) {
    LOG(ERROR) << "Sandbox initialization failed: " << started;
    ResetLocked();
  }
  return started;
}

absl::Status SandboxManager::StartLocked(const RestrictionPolicy& policy) {
  if (absl::Status deps = builder_->CheckDependencies(policy); !deps.ok()) {
    return deps;
  }
  if (!CreateDirectoryRecursively(kSandboxTmpDir, 0755)) {
    return absl::ErrnoToStatus(
        errno, absl::StrCat("Failed to create '", kSandboxTmpDir, "'"));
  }

  policy_ = policy;
  SetNetworkPolicy(policy.network);

  if (options_.enable_log_monitor && options_.platform == Platform::kMacOS) {
    absl::StatusOr<std::unique_ptr<MacOsLogMonitor>> monitor =
        MacOsLogMonitor::Start(store_, policy.ignore_violations,
                               LogStreamCommand(SessionSuffix()));
    if (!monitor.ok()) {
      return monitor.status();
    }
    monitor_ = std::move(*monitor);
  }

  ConnectionFilter filter = [this](uint16_t port, const std::string& host) {
    return AllowConnection(port, host);
  };

  if (policy.network.external_http_proxy_port.has_value()) {
    http_port_ = policy.network.external_http_proxy_port;
  } else {
    absl::StatusOr<std::unique_ptr<HttpProxy>> proxy =
        HttpProxy::Start(options_.proxy_host, 0, filter);
    if (!proxy.ok()) {
      return proxy.status();
    }
    http_proxy_ = std::move(*proxy);
    http_port_ = http_proxy_->Port();
  }

  if (policy.network.external_socks_proxy_port.has_value()) {
    socks_port_ = policy.network.external_socks_proxy_port;
  } else {
    absl::StatusOr<std::unique_ptr<SocksProxy>> proxy =
        SocksProxy::Start(options_.proxy_host, 0, filter);
    if (!proxy.ok()) {
      return proxy.status();
    }
    socks_proxy_ = std::move(*proxy);
    socks_port_ = socks_proxy_->Port();
  }

  if (options_.platform == Platform::kLinux &&
      NeedsNetworkRestriction(policy)) {
    absl::StatusOr<std::unique_ptr<LinuxBridge>> bridge =
        LinuxBridge::Start(*http_port_, *socks_port_, options_.bridge);
    if (!bridge.ok()) {
      return bridge.status();
    }
    bridge_ = std::move(*bridge);
  }

  LOG(INFO) << "Network infrastructure initialized: HTTP proxy on "
            << *http_port_ << ", SOCKS proxy on " << *socks_port_;
  return absl::OkStatus();
}

void SandboxManager::Reset() {
  absl::MutexLock lock(&mu_);
  ResetLocked();
}

void SandboxManager::ResetLocked() {
  if (!policy_.has_value() && !http_proxy_ && !socks_proxy_ && !bridge_ &&
      !monitor_) {
    return;
  }
  if (monitor_) {
    if (absl::Status stopped = monitor_->Stop(); !stopped.ok()) {
      LOG(WARNING) << "Failed to stop the log monitor: " << stopped;
    }
    monitor_.reset();
  }
  if (bridge_) {
    if (absl::Status stopped = bridge_->Stop(); !stopped.ok()) {
      LOG(WARNING) << "Failed to stop the Linux bridge: " << stopped;
    }
    bridge_.reset();
  }
  if (http_proxy_) {
    http_proxy_->Close();
    http_proxy_.reset();
  }
  if (socks_proxy_) {
    socks_proxy_->Close();
    socks_proxy_.reset();
  }
  http_port_.reset();
  socks_port_.reset();
  policy_.reset();
  SetNetworkPolicy(std::nullopt);
  VLOG(1) << "Sandbox reset";
}

void SandboxManager::SetNetworkPolicy(std::optional<NetworkPolicy> network) {
  absl::MutexLock lock(&network_mu_);
  network_ = std::move(network);
}

bool SandboxManager::AllowConnection(uint16_t port, const std::string& host) {
  std::vector<std::string> allowed;
  std::vector<std::string> denied;
  {
    absl::MutexLock lock(&network_mu_);
    if (!network_.has_value()) {
      LOG(ERROR) << "No network policy, denying " << host << ":" << port;
      return false;
    }
    allowed = network_->allowed_domains;
    denied = network_->denied_domains;
  }
  return FilterNetworkRequest(port, host, allowed, denied, options_.ask);
}

std::vector<std::string> SandboxManager::SandboxablePaths(
    const std::vector<std::string>& patterns) const {
  std::vector<std::string> paths;
  for (const std::string& pattern : patterns) {
    std::string path = RemoveTrailingGlobSuffix(pattern);
    if (options_.platform == Platform::kLinux && ContainsGlobChars(path)) {
      LOG(WARNING) << "Skipping glob pattern on Linux: " << pattern;
      continue;
    }
    paths.emplace_back(std::move(path));
  }
  return paths;
}

WrapRequest SandboxManager::RequestFor(const RestrictionPolicy& policy,
                                       const std::string& command) {
  const FilesystemPolicy& fs = policy.filesystem;
  WrapRequest request{
      .command = command,
      .needs_network_restriction = NeedsNetworkRestriction(policy),
      .http_proxy_port = http_port_,
      .socks_proxy_port = socks_port_,
      .allow_unix_sockets = policy.network.allow_unix_sockets,
      .allow_all_unix_sockets = policy.network.allow_all_unix_sockets,
      .allow_local_binding = policy.network.allow_local_binding,
      .enable_weaker_nested_sandbox = policy.enable_weaker_nested_sandbox,
      .shell = options_.shell,
      .ripgrep = policy.ripgrep,
      .paths = PathContext::Current(),
  };
  if (bridge_) {
    request.http_socket_path = bridge_->HttpSocketPath();
    request.socks_socket_path = bridge_->SocksSocketPath();
  }
  request.read = ReadRestriction{.deny_only = SandboxablePaths(fs.deny_read)};
  if (fs.allow_write.has_value()) {
    std::vector<std::string> allow = DefaultWritePaths(request.paths.home);
    for (std::string& path : SandboxablePaths(*fs.allow_write)) {
      allow.emplace_back(std::move(path));
    }
    request.write = WriteRestriction{
        .allow_only = std::move(allow),
        .deny_within_allow = SandboxablePaths(fs.deny_write),
    };
  } else if (!fs.deny_write.empty()) {
    request.write = WriteRestriction{
        .allow_only = {"/"},
        .deny_within_allow = SandboxablePaths(fs.deny_write),
    };
  }
  if (const char* tmpdir = getenv("TMPDIR"); tmpdir != nullptr && *tmpdir) {
    request.tmpdir = tmpdir;
  }
  return request;
}

absl::StatusOr<std::string> SandboxManager::WrapWithSandbox(
    const std::string& command,
    const std::optional<PolicyOverrides>& overrides) {
  absl::MutexLock lock(&mu_);
  if (!policy_.has_value()) {
    VLOG(1) << "Sandbox not initialized, running command unwrapped";
    return command;
  }
  RestrictionPolicy policy = *policy_;
  if (overrides.has_value()) {
    absl::StatusOr<RestrictionPolicy> merged =
        ApplyOverrides(policy, *overrides);
    if (!merged.ok()) {
      return merged.status();
    }
    policy = std::move(*merged);
  }
  return builder_->Wrap(RequestFor(policy, command));
}

absl::Status SandboxManager::UpdatePolicy(const RestrictionPolicy& policy) {
  if (absl::Status valid = ValidatePolicy(policy); !valid.ok()) {
    return valid;
  }
  absl::MutexLock lock(&mu_);
  if (!policy_.has_value()) {
    return absl::FailedPreconditionError(
        "Sandbox is not initialized, call Initialize first");
  }
  policy_ = policy;
  SetNetworkPolicy(policy.network);
  return absl::OkStatus();
}

bool SandboxManager::IsSandboxingEnabled() {
  absl::MutexLock lock(&mu_);
  return policy_.has_value();
}

std::optional<RestrictionPolicy> SandboxManager::GetPolicy() {
  absl::MutexLock lock(&mu_);
  return policy_;
}

std::optional<uint16_t> SandboxManager::GetProxyPort() {
  absl::MutexLock lock(&mu_);
  return http_port_;
}

std::optional<uint16_t> SandboxManager::GetSocksProxyPort() {
  absl::MutexLock lock(&mu_);
  return socks_port_;
}

std::optional<std::string> SandboxManager::GetLinuxHttpSocketPath() {
  absl::MutexLock lock(&mu_);
  if (!bridge_) {
    return std::nullopt;
  }
  return bridge_->HttpSocketPath();
}

std::optional<std::string> SandboxManager::GetLinuxSocksSocketPath() {
  absl::MutexLock lock(&mu_);
  if (!bridge_) {
    return std::nullopt;
  }
  return bridge_->SocksSocketPath();
}

NetworkRestrictionConfig SandboxManager::GetNetworkRestrictionConfig() {
  absl::MutexLock lock(&mu_);
  NetworkRestrictionConfig config;
  if (!policy_.has_value()) {
    return config;
  }
  if (!policy_->network.allowed_domains.empty()) {
    config.allowed_hosts = policy_->network.allowed_domains;
  }
  if (!policy_->network.denied_domains.empty()) {
    config.denied_hosts = policy_->network.denied_domains;
  }
  return config;
}

std::vector<std::string> SandboxManager::GlobPatternWarnings() {
  absl::MutexLock lock(&mu_);
  std::vector<std::string> globs;
  if (options_.platform != Platform::kLinux || !policy_.has_value()) {
    return globs;
  }
  const FilesystemPolicy& fs = policy_->filesystem;
  std::vector<std::string> all = fs.deny_read;
  if (fs.allow_write.has_value()) {
    all.insert(all.end(), fs.allow_write->begin(), fs.allow_write->end());
  }
  all.insert(all.end(), fs.deny_write.begin(), fs.deny_write.end());
  for (const std::string& path : all) {
    if (ContainsGlobChars(RemoveTrailingGlobSuffix(path))) {
      globs.push_back(path);
    }
  }
  return globs;
}

std::string SandboxManager::AnnotateStderrWithSandboxFailures(
    std::string_view command, std::string_view stderr_text) {
  if (!IsSandboxingEnabled()) {
    return std::string(stderr_text);
  }
  std::vector<ViolationEvent> violations = store_.ViolationsForCommand(command);
  if (violations.empty()) {
    return std::string(stderr_text);
  }
  std::string annotated;
  if (absl::StrContains(stderr_text, "Operation not permitted") ||
      absl::StrContains(stderr_text, "Permission denied")) {
    absl::StrAppend(&annotated, kPermissionDeniedMarker, "\n");
  }
  absl::StrAppend(&annotated, stderr_text, "\n<sandbox_violations>\n");
  for (const ViolationEvent& violation : violations) {
    absl::StrAppend(&annotated, violation.line, "\n");
  }
  absl::StrAppend(&annotated, "</sandbox_violations>");
  return annotated;
}

}  // namespace sandbox_runtime
