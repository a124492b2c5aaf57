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
#include "host/libs/sandbox/macos_builder.h"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/log/log.h>
#include <absl/random/random.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/escaping.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_replace.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>
#include <json/json.h>

#include "common/libs/utils/architecture.h"
#include "common/libs/utils/shell_quote.h"
#include "common/libs/utils/subprocess.h"
#include "host/libs/sandbox/proxy_env.h"
#include "host/libs/sandbox/violation_store.h"

namespace sandbox_runtime {
namespace {

// Permissions every sandboxed process needs, modeled on the Chrome policy.
constexpr std::string_view kBaseRules = R"(; Essential permissions - based on Chrome sandbox policy
; Process permissions
(allow process-exec)
(allow process-fork)
(allow process-info* (target same-sandbox))
(allow signal (target same-sandbox))
(allow mach-priv-task-port (target same-sandbox))

; User preferences
(allow user-preference-read)

; Mach IPC - specific services only (no wildcard)
(allow mach-lookup
  (global-name "com.apple.audio.systemsoundserver")
  (global-name "com.apple.distributed_notifications@Uv3")
  (global-name "com.apple.FontObjectsServer")
  (global-name "com.apple.fonts")
  (global-name "com.apple.logd")
  (global-name "com.apple.lsd.mapdb")
  (global-name "com.apple.PowerManagement.control")
  (global-name "com.apple.system.logger")
  (global-name "com.apple.system.notification_center")
  (global-name "com.apple.trustd.agent")
  (global-name "com.apple.system.opendirectoryd.libinfo")
  (global-name "com.apple.system.opendirectoryd.membership")
  (global-name "com.apple.bsd.dirhelper")
  (global-name "com.apple.securityd.xpc")
  (global-name "com.apple.coreservices.launchservicesd")
)

; POSIX IPC - shared memory
(allow ipc-posix-shm)

; POSIX IPC - semaphores
(allow ipc-posix-sem)

; IOKit - specific operations only
(allow iokit-open
  (iokit-registry-entry-class "IOSurfaceRootUserClient")
  (iokit-registry-entry-class "RootDomainUserClient")
  (iokit-user-client-class "IOSurfaceSendRight")
)

; IOKit properties
(allow iokit-get-properties)

; Specific safe system-sockets, doesn't allow network access
(allow system-socket (require-all (socket-domain AF_SYSTEM) (socket-protocol 2)))

; sysctl - specific sysctls only
(allow sysctl-read
  (sysctl-name "hw.activecpu")
  (sysctl-name "hw.busfrequency_compat")
  (sysctl-name "hw.byteorder")
  (sysctl-name "hw.cacheconfig")
  (sysctl-name "hw.cachelinesize_compat")
  (sysctl-name "hw.cpufamily")
  (sysctl-name "hw.cpufrequency")
  (sysctl-name "hw.cpufrequency_compat")
  (sysctl-name "hw.cputype")
  (sysctl-name "hw.l1dcachesize_compat")
  (sysctl-name "hw.l1icachesize_compat")
  (sysctl-name "hw.l2cachesize_compat")
  (sysctl-name "hw.l3cachesize_compat")
  (sysctl-name "hw.logicalcpu")
  (sysctl-name "hw.logicalcpu_max")
  (sysctl-name "hw.machine")
  (sysctl-name "hw.memsize")
  (sysctl-name "hw.ncpu")
  (sysctl-name "hw.nperflevels")
  (sysctl-name "hw.packages")
  (sysctl-name "hw.pagesize_compat")
  (sysctl-name "hw.pagesize")
  (sysctl-name "hw.physicalcpu")
  (sysctl-name "hw.physicalcpu_max")
  (sysctl-name "hw.tbfrequency_compat")
  (sysctl-name "hw.vectorunit")
  (sysctl-name "kern.argmax")
  (sysctl-name "kern.bootargs")
  (sysctl-name "kern.hostname")
  (sysctl-name "kern.maxfiles")
  (sysctl-name "kern.maxfilesperproc")
  (sysctl-name "kern.maxproc")
  (sysctl-name "kern.ngroups")
  (sysctl-name "kern.osproductversion")
  (sysctl-name "kern.osrelease")
  (sysctl-name "kern.ostype")
  (sysctl-name "kern.osvariant_status")
  (sysctl-name "kern.osversion")
  (sysctl-name "kern.secure_kernel")
  (sysctl-name "kern.tcsm_available")
  (sysctl-name "kern.tcsm_enable")
  (sysctl-name "kern.usrstack64")
  (sysctl-name "kern.version")
  (sysctl-name "kern.willshutdown")
  (sysctl-name "machdep.cpu.brand_string")
  (sysctl-name "machdep.ptrauth_enabled")
  (sysctl-name "security.mac.lockdown_mode_state")
  (sysctl-name "sysctl.proc_cputype")
  (sysctl-name "vm.loadavg")
  (sysctl-name-prefix "hw.optional.arm")
  (sysctl-name-prefix "hw.optional.arm.")
  (sysctl-name-prefix "hw.optional.armv8_")
  (sysctl-name-prefix "hw.perflevel")
  (sysctl-name-prefix "kern.proc.pgrp.")
  (sysctl-name-prefix "kern.proc.pid.")
  (sysctl-name-prefix "machdep.cpu.")
  (sysctl-name-prefix "net.routetable.")
)

; V8 thread calculations
(allow sysctl-write
  (sysctl-name "kern.tcsm_enable")
)

; Distributed notifications
(allow distributed-notification-post)

; Specific mach-lookup permissions for security operations
(allow mach-lookup (global-name "com.apple.SecurityServer"))

; File I/O on device files
(allow file-ioctl (literal "/dev/null"))
(allow file-ioctl (literal "/dev/zero"))
(allow file-ioctl (literal "/dev/random"))
(allow file-ioctl (literal "/dev/urandom"))
(allow file-ioctl (literal "/dev/dtracehelper"))
(allow file-ioctl (literal "/dev/tty"))

(allow file-ioctl file-read-data file-write-data
  (require-all
    (literal "/dev/null")
    (vnode-type CHARACTER-DEVICE)
  )
)
)";

std::string QuotePath(std::string_view path) {
  return Json::valueToQuotedString(std::string(path).c_str());
}

/** `(<action>\n  (<filter> "<value>")\n  (with message "<tag>"))` */
std::string TaggedRule(std::string_view action, std::string_view filter,
                       std::string_view value, std::string_view log_tag) {
  return absl::StrCat("(", action, "\n  (", filter, " ", QuotePath(value),
                      ")\n  (with message \"", log_tag, "\"))");
}

/** `subpath` for a concrete path, `regex` for a glob. */
std::string PathRule(std::string_view action, const std::string& path,
                     std::string_view log_tag) {
  if (ContainsGlobChars(path)) {
    return TaggedRule(action, "regex", GlobToRegex(path), log_tag);
  }
  return TaggedRule(action, "subpath", path, log_tag);
}

void AppendNetworkRules(const WrapRequest& request,
                        std::vector<std::string>& profile) {
  profile.emplace_back("; Network");
  if (!request.needs_network_restriction) {
    profile.emplace_back("(allow network*)");
    return;
  }
  if (request.allow_local_binding) {
    profile.emplace_back("(allow network-bind (local ip \"localhost:*\"))");
    profile.emplace_back("(allow network-inbound (local ip \"localhost:*\"))");
    profile.emplace_back("(allow network-outbound (local ip \"localhost:*\"))");
  }
  profile.emplace_back("; DNS Resolution");
  profile.emplace_back(
      "(allow network-outbound (literal \"/private/var/run/mDNSResponder\"))");
  profile.emplace_back("(allow network-outbound (remote ip \"localhost:53\"))");
  profile.emplace_back(
      "(allow network-outbound (remote ip \"localhost:5353\"))");
  profile.emplace_back("(allow system-socket)");

  if (request.allow_all_unix_sockets) {
    profile.emplace_back("(allow network* (subpath \"/\"))");
  } else if (request.allow_unix_sockets) {
    for (const auto& socket : *request.allow_unix_sockets) {
      profile.emplace_back(absl::StrCat(
          "(allow network* (subpath ",
          QuotePath(NormalizePathForSandbox(socket, request.paths)), "))"));
    }
  }

  for (const auto& port : {request.http_proxy_port, request.socks_proxy_port}) {
    if (!port) {
      continue;
    }
    profile.emplace_back(
        absl::StrCat("(allow network-bind (local ip \"localhost:", *port,
                     "\"))"));
    profile.emplace_back(
        absl::StrCat("(allow network-inbound (local ip \"localhost:", *port,
                     "\"))"));
    profile.emplace_back(
        absl::StrCat("(allow network-outbound (remote ip \"localhost:", *port,
                     "\"))"));
  }
}

void AppendReadRules(const WrapRequest& request, std::string_view log_tag,
                     std::vector<std::string>& profile) {
  profile.emplace_back("; File read");
  profile.emplace_back("(allow file-read*)");
  if (!request.read) {
    return;
  }
  for (const auto& pattern : request.read->deny_only) {
    profile.emplace_back(PathRule(
        "deny file-read*", NormalizePathForSandbox(pattern, request.paths),
        log_tag));
  }
  for (auto& rule :
       MoveBlockingRules(request.read->deny_only, request.paths, log_tag)) {
    profile.emplace_back(std::move(rule));
  }
}

absl::Status AppendWriteRules(const WrapRequest& request,
                              std::string_view log_tag,
                              std::vector<std::string>& profile) {
  profile.emplace_back("; File write");
  if (!request.write) {
    profile.emplace_back("(allow file-write*)");
    return absl::OkStatus();
  }
  for (const auto& parent : TmpdirParents(request.tmpdir)) {
    profile.emplace_back(TaggedRule(
        "allow file-write*", "subpath",
        NormalizePathForSandbox(parent, request.paths), log_tag));
  }
  for (const auto& pattern : request.write->allow_only) {
    profile.emplace_back(PathRule(
        "allow file-write*", NormalizePathForSandbox(pattern, request.paths),
        log_tag));
  }
  absl::StatusOr<std::vector<std::string>> deny = WriteDenyPaths(request);
  if (!deny.ok()) {
    return deny.status();
  }
  for (const auto& pattern : *deny) {
    profile.emplace_back(PathRule(
        "deny file-write*", NormalizePathForSandbox(pattern, request.paths),
        log_tag));
  }
  for (auto& rule : MoveBlockingRules(*deny, request.paths, log_tag)) {
    profile.emplace_back(std::move(rule));
  }
  return absl::OkStatus();
}

}  // namespace

const std::string& SessionSuffix() {
  static const std::string* const suffix = [] {
    absl::BitGen gen;
    std::string bytes(9, '\0');
    for (char& byte : bytes) {
      byte = static_cast<char>(absl::Uniform<int>(gen, 0, 256));
    }
    return new std::string(
        absl::StrCat("_", absl::BytesToHexString(bytes), "_SBX"));
  }();
  return *suffix;
}

std::string SeatbeltLogTag(std::string_view command,
                           std::string_view session_suffix) {
  return absl::StrCat("CMD64_", EncodeSandboxedCommand(command), "_END",
                      session_suffix);
}

std::vector<std::string> TmpdirParents(
    const std::optional<std::string>& tmpdir) {
  if (!tmpdir) {
    return {};
  }
  // /var/folders/<2 chars>/<id>/T with an optional trailing separator.
  std::string_view rest = *tmpdir;
  if (!absl::ConsumePrefix(&rest, "/private/var/folders/") &&
      !absl::ConsumePrefix(&rest, "/var/folders/")) {
    return {};
  }
  std::vector<std::string_view> parts = absl::StrSplit(rest, '/');
  if (!parts.empty() && parts.back().empty()) {
    parts.pop_back();
  }
  if (parts.size() != 3 || parts[0].size() != 2 || parts[1].empty() ||
      parts[2] != "T") {
    return {};
  }
  std::string parent = absl::StrReplaceAll(*tmpdir, {{"/T/", ""}});
  if (absl::EndsWith(parent, "/T")) {
    parent.resize(parent.size() - 2);
  }
  if (absl::StartsWith(parent, "/private/var/")) {
    return {parent, parent.substr(std::string_view("/private").size())};
  }
  return {parent, absl::StrCat("/private", parent)};
}

std::vector<std::string> MoveBlockingRules(
    const std::vector<std::string>& patterns, const PathContext& context,
    std::string_view log_tag) {
  std::vector<std::string> rules;
  for (const auto& pattern : patterns) {
    std::string path = NormalizePathForSandbox(pattern, context);
    std::string protected_dir;
    if (ContainsGlobChars(path)) {
      rules.emplace_back(TaggedRule("deny file-write-unlink", "regex",
                                    GlobToRegex(path), log_tag));
      protected_dir = GlobBaseDirectory(path);
      if (protected_dir.empty()) {
        continue;
      }
      rules.emplace_back(TaggedRule("deny file-write-unlink", "literal",
                                    protected_dir, log_tag));
    } else {
      rules.emplace_back(
          TaggedRule("deny file-write-unlink", "subpath", path, log_tag));
      protected_dir = path;
    }
    for (const auto& ancestor : AncestorDirectories(protected_dir)) {
      rules.emplace_back(
          TaggedRule("deny file-write-unlink", "literal", ancestor, log_tag));
    }
  }
  return rules;
}

absl::StatusOr<std::string> SeatbeltProfile(const WrapRequest& request,
                                            std::string_view log_tag) {
  std::vector<std::string> profile = {
      "(version 1)",
      absl::StrCat("(deny default (with message \"", log_tag, "\"))"),
      "",
      absl::StrCat("; LogTag: ", log_tag),
      "",
      std::string(kBaseRules),
  };
  AppendNetworkRules(request, profile);
  profile.emplace_back("");
  AppendReadRules(request, log_tag, profile);
  profile.emplace_back("");
  absl::Status write = AppendWriteRules(request, log_tag, profile);
  if (!write.ok()) {
    return write;
  }
  return absl::StrJoin(profile, "\n");
}

MacOsCommandBuilder::MacOsCommandBuilder(std::string session_suffix)
    : session_suffix_(std::move(session_suffix)) {}

absl::StatusOr<std::string> MacOsCommandBuilder::Wrap(
    const WrapRequest& request) {
  if (!NeedsSandboxing(request)) {
    return request.command;
  }
  std::string log_tag = SeatbeltLogTag(request.command, session_suffix_);

  absl::StatusOr<std::string> profile = SeatbeltProfile(request, log_tag);
  if (!profile.ok()) {
    return profile.status();
  }
  absl::StatusOr<std::string> shell = ResolveShell(request.shell);
  if (!shell.ok()) {
    return shell.status();
  }

  std::vector<std::string> exports;
  for (const auto& [key, value] :
       ProxyEnvironment(request.http_proxy_port, request.socks_proxy_port,
                        Platform::kMacOS)) {
    exports.emplace_back(ShellQuote(absl::StrCat(key, "=", value)));
  }
  std::string script = absl::StrCat("export ", absl::StrJoin(exports, " "),
                                    " && ", request.command);

  VLOG(1) << "Applied restrictions - network: "
          << (request.http_proxy_port || request.socks_proxy_port)
          << ", read: "
          << (request.read && !request.read->deny_only.empty())
          << ", write: " << request.write.has_value();

  return ShellJoin({"sandbox-exec", "-p", *profile, *shell, "-c", script});
}

absl::Status MacOsCommandBuilder::CheckDependencies(
    const RestrictionPolicy& policy) {
  for (const auto& tool : {std::string("sandbox-exec"), policy.ripgrep.command}) {
    if (!FindExecutable(tool).ok()) {
      return absl::FailedPreconditionError(
          absl::StrCat("Sandbox dependency '", tool, "' is not installed"));
    }
  }
  return absl::OkStatus();
}

}  // namespace sandbox_runtime
