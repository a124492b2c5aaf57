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
#include "host/libs/sandbox/linux_builder.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/libs/utils/architecture.h"
#include "common/libs/utils/files.h"
#include "common/libs/utils/shell_quote.h"
#include "common/libs/utils/subprocess.h"
#include "host/libs/sandbox/proxy_env.h"
#include "host/libs/sandbox/sandbox_paths.h"

namespace sandbox_runtime {
namespace {

constexpr char kSshConfigDir[] = "/etc/ssh/ssh_config.d";

bool IsWithin(const std::string& path, const std::string& parent) {
  return path == parent || absl::StartsWith(path, parent + "/");
}

/** Script run inside the new network namespace: bridges the internal proxy
 * ports to the host sockets, then runs the command. */
std::string NetworkScript(const std::string& http_socket,
                          const std::string& socks_socket,
                          const std::string& command,
                          const std::optional<std::string>& filter,
                          const std::optional<std::string>& apply_seccomp,
                          const std::string& shell) {
  std::vector<std::string> lines = {
      absl::StrCat("socat TCP-LISTEN:", kSandboxHttpProxyPort,
                   ",fork,reuseaddr ",
                   ShellQuote(absl::StrCat("UNIX-CONNECT:", http_socket)),
                   " >/dev/null 2>&1 &"),
      absl::StrCat("socat TCP-LISTEN:", kSandboxSocksProxyPort,
                   ",fork,reuseaddr ",
                   ShellQuote(absl::StrCat("UNIX-CONNECT:", socks_socket)),
                   " >/dev/null 2>&1 &"),
      "trap \"kill %1 %2 2>/dev/null; exit\" EXIT",
  };
  if (filter && apply_seccomp) {
    lines.emplace_back(
        ShellJoin({*apply_seccomp, *filter, shell, "-c", command}));
  } else {
    lines.emplace_back(absl::StrCat("eval ", ShellQuote(command)));
  }
  return absl::StrJoin(lines, "\n");
}

}  // namespace

LinuxCommandBuilder::LinuxCommandBuilder(
    std::optional<std::string> seccomp_filter,
    std::optional<std::string> apply_seccomp)
    : seccomp_filter_(std::move(seccomp_filter)),
      apply_seccomp_(std::move(apply_seccomp)) {}

absl::StatusOr<std::vector<std::string>> BwrapFilesystemArgs(
    const WrapRequest& request) {
  std::vector<std::string> args;
  if (request.write) {
    args.insert(args.end(), {"--ro-bind", "/", "/"});

    std::vector<std::string> allowed;
    for (const auto& pattern : request.write->allow_only) {
      std::string path = NormalizePathForSandbox(pattern, request.paths);
      VLOG(1) << "Processing write path: " << pattern << " -> " << path;
      // --dev /dev provides these.
      if (absl::StartsWith(path, "/dev/")) {
        continue;
      }
      if (!FileExists(path)) {
        VLOG(1) << "Skipping non-existent write path: " << path;
        continue;
      }
      args.insert(args.end(), {"--bind", path, path});
      allowed.emplace_back(std::move(path));
    }

    absl::StatusOr<std::vector<std::string>> deny = WriteDenyPaths(request);
    if (!deny.ok()) {
      return deny.status();
    }
    for (const auto& pattern : *deny) {
      std::string path = NormalizePathForSandbox(pattern, request.paths);
      if (absl::StartsWith(path, "/dev/")) {
        continue;
      }
      if (!FileExists(path)) {
        VLOG(1) << "Skipping non-existent deny path: " << path;
        continue;
      }
      bool within_allowed = false;
      for (const auto& parent : allowed) {
        within_allowed |= IsWithin(path, parent);
      }
      if (!within_allowed) {
        VLOG(1) << "Skipping deny path not within allowed paths: " << path;
        continue;
      }
      args.insert(args.end(), {"--ro-bind", path, path});
    }
  } else {
    args.insert(args.end(), {"--bind", "/", "/"});
  }

  std::vector<std::string> read_deny;
  if (request.read) {
    read_deny = request.read->deny_only;
  }
  if (FileExists(kSshConfigDir)) {
    read_deny.emplace_back(kSshConfigDir);
  }
  for (const auto& pattern : read_deny) {
    std::string path = NormalizePathForSandbox(pattern, request.paths);
    if (!FileExists(path)) {
      VLOG(1) << "Skipping non-existent read deny path: " << path;
      continue;
    }
    if (DirectoryExists(path)) {
      args.insert(args.end(), {"--tmpfs", path});
    } else {
      args.insert(args.end(), {"--ro-bind", "/dev/null", path});
    }
  }
  return args;
}

absl::StatusOr<std::string> LinuxCommandBuilder::Wrap(
    const WrapRequest& request) {
  if (!NeedsSandboxing(request)) {
    return request.command;
  }

  std::optional<std::string> filter;
  if (!request.allow_all_unix_sockets) {
    if (!seccomp_filter_ || !apply_seccomp_) {
      return absl::FailedPreconditionError(
          "Unix socket blocking requires the seccomp filter and apply-seccomp "
          "for this architecture. Set allowAllUnixSockets to run without it.");
    }
    filter = seccomp_filter_;
  } else {
    VLOG(1) << "Skipping seccomp filter, all Unix sockets are allowed";
  }

  std::vector<std::string> args;
  if (request.needs_network_restriction) {
    if (!request.http_socket_path || !request.socks_socket_path) {
      return absl::FailedPreconditionError(
          "Network restriction was requested but the bridge socket paths are "
          "not available");
    }
    for (const auto& socket :
         {*request.http_socket_path, *request.socks_socket_path}) {
      if (!FileExists(socket)) {
        return absl::FailedPreconditionError(absl::StrCat(
            "Bridge socket '", socket,
            "' does not exist. The bridge process may have died."));
      }
    }
    args.emplace_back("--unshare-net");
    args.insert(args.end(), {"--bind", *request.http_socket_path,
                             *request.http_socket_path});
    args.insert(args.end(), {"--bind", *request.socks_socket_path,
                             *request.socks_socket_path});
    for (auto& [key, value] :
         ProxyEnvironment(kSandboxHttpProxyPort, kSandboxSocksProxyPort,
                          Platform::kLinux)) {
      args.insert(args.end(), {"--setenv", key, value});
    }
    if (request.http_proxy_port) {
      args.insert(args.end(), {"--setenv",
                               "SANDBOX_RUNTIME_HOST_HTTP_PROXY_PORT",
                               absl::StrCat(*request.http_proxy_port)});
    }
    if (request.socks_proxy_port) {
      args.insert(args.end(), {"--setenv",
                               "SANDBOX_RUNTIME_HOST_SOCKS_PROXY_PORT",
                               absl::StrCat(*request.socks_proxy_port)});
    }
  }

  absl::StatusOr<std::vector<std::string>> fs_args =
      BwrapFilesystemArgs(request);
  if (!fs_args.ok()) {
    return fs_args.status();
  }
  args.insert(args.end(), fs_args->begin(), fs_args->end());

  args.insert(args.end(), {"--dev", "/dev"});
  args.emplace_back("--unshare-pid");
  if (!request.enable_weaker_nested_sandbox) {
    args.insert(args.end(), {"--proc", "/proc"});
  }

  absl::StatusOr<std::string> shell = ResolveShell(request.shell);
  if (!shell.ok()) {
    return shell.status();
  }
  args.insert(args.end(), {"--", *shell, "-c"});

  if (request.needs_network_restriction) {
    args.emplace_back(NetworkScript(*request.http_socket_path,
                                    *request.socks_socket_path,
                                    request.command, filter, apply_seccomp_,
                                    *shell));
  } else if (filter) {
    args.emplace_back(
        ShellJoin({*apply_seccomp_, *filter, *shell, "-c", request.command}));
  } else {
    args.emplace_back(request.command);
  }

  std::vector<std::string> restrictions;
  if (request.needs_network_restriction) {
    restrictions.emplace_back("network");
  }
  if ((request.read && !request.read->deny_only.empty()) || request.write) {
    restrictions.emplace_back("filesystem");
  }
  if (filter) {
    restrictions.emplace_back("seccomp(unix-block)");
  }
  VLOG(1) << "Wrapped command with bwrap (" << absl::StrJoin(restrictions, ", ")
          << " restrictions)";

  args.insert(args.begin(), "bwrap");
  return ShellJoin(args);
}

absl::Status LinuxCommandBuilder::CheckDependencies(
    const RestrictionPolicy& policy) {
  std::vector<std::string> tools = {"bwrap", "socat", policy.ripgrep.command};
  for (const auto& tool : tools) {
    if (!FindExecutable(tool).ok()) {
      return absl::FailedPreconditionError(
          absl::StrCat("Sandbox dependency '", tool, "' is not installed"));
    }
  }
  if (!policy.network.allow_all_unix_sockets &&
      (!seccomp_filter_ || !apply_seccomp_)) {
    return absl::FailedPreconditionError(absl::StrCat(
        "No seccomp filter for architecture '", HostArchStr(),
        "'. Build the seccomp artifacts or set allowAllUnixSockets."));
  }
  return absl::OkStatus();
}

}  // namespace sandbox_runtime
