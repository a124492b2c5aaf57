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
#include "host/libs/sandbox/policy.h"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

namespace sandbox_runtime {
namespace {

absl::Status InvalidDomain(std::string_view domain, std::string_view why) {
  return absl::InvalidArgumentError(
      absl::StrCat("Invalid domain '", domain, "': ", why));
}

absl::Status ValidatePathList(std::string_view field,
                              const std::vector<std::string>& paths) {
  for (const std::string& path : paths) {
    if (absl::StripAsciiWhitespace(path).empty()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Empty path in '", field, "'"));
    }
  }
  return absl::OkStatus();
}

absl::Status ValidateDomainList(const std::vector<std::string>& domains) {
  for (const std::string& domain : domains) {
    if (absl::Status status = ValidateDomainPattern(domain); !status.ok()) {
      return status;
    }
  }
  return absl::OkStatus();
}

template <typename T>
void Override(T& target, const std::optional<T>& value) {
  if (value.has_value()) {
    target = *value;
  }
}

void PrintList(std::ostream& out, std::string_view name,
               const std::vector<std::string>& list) {
  out << "\t" << name << ": [" << absl::StrJoin(list, ", ") << "]\n";
}

}  // namespace

RestrictionPolicy DefaultPolicy() {
  RestrictionPolicy policy;
  policy.filesystem.allow_write = std::vector<std::string>();
  return policy;
}

absl::Status ValidateDomainPattern(std::string_view domain) {
  if (absl::StrContains(domain, "://") || absl::StrContains(domain, '/') ||
      absl::StrContains(domain, ':')) {
    return InvalidDomain(domain, "must not contain a protocol, path or port");
  }
  if (domain == "localhost") {
    return absl::OkStatus();
  }
  if (std::string_view rest = domain; absl::ConsumePrefix(&rest, "*.")) {
    if (!absl::StrContains(rest, '.')) {
      return InvalidDomain(domain, "wildcard is too broad");
    }
    std::vector<std::string_view> labels = absl::StrSplit(rest, '.');
    if (labels.size() < 2) {
      return InvalidDomain(domain, "wildcard is too broad");
    }
    for (std::string_view label : labels) {
      if (label.empty() || absl::StrContains(label, '*')) {
        return InvalidDomain(domain, "malformed wildcard");
      }
    }
    return absl::OkStatus();
  }
  if (absl::StrContains(domain, '*')) {
    return InvalidDomain(domain, "only a leading '*.' wildcard is allowed");
  }
  if (!absl::StrContains(domain, '.') || absl::StartsWith(domain, ".") ||
      absl::EndsWith(domain, ".")) {
    return InvalidDomain(domain, "not a fully qualified domain");
  }
  return absl::OkStatus();
}

absl::Status ValidatePolicy(const RestrictionPolicy& policy) {
  const NetworkPolicy& net = policy.network;
  if (absl::Status s = ValidateDomainList(net.allowed_domains); !s.ok()) {
    return s;
  }
  if (absl::Status s = ValidateDomainList(net.denied_domains); !s.ok()) {
    return s;
  }
  if (net.allow_unix_sockets.has_value()) {
    auto s = ValidatePathList("allowUnixSockets", *net.allow_unix_sockets);
    if (!s.ok()) {
      return s;
    }
  }
  for (const auto& port : {net.external_http_proxy_port,
                           net.external_socks_proxy_port}) {
    if (port.has_value() && *port == 0) {
      return absl::InvalidArgumentError("Proxy ports must be in 1..65535");
    }
  }

  const FilesystemPolicy& fs = policy.filesystem;
  if (auto s = ValidatePathList("denyRead", fs.deny_read); !s.ok()) {
    return s;
  }
  if (auto s = ValidatePathList("allowRead", fs.allow_read); !s.ok()) {
    return s;
  }
  if (fs.allow_write.has_value()) {
    if (auto s = ValidatePathList("allowWrite", *fs.allow_write); !s.ok()) {
      return s;
    }
  }
  if (auto s = ValidatePathList("denyWrite", fs.deny_write); !s.ok()) {
    return s;
  }

  for (const auto& [command, paths] : policy.ignore_violations) {
    if (absl::StripAsciiWhitespace(command).empty()) {
      return absl::InvalidArgumentError("Empty command in 'ignoreViolations'");
    }
    auto s = ValidatePathList(absl::StrCat("ignoreViolations.", command), paths);
    if (!s.ok()) {
      return s;
    }
  }
  if (absl::StripAsciiWhitespace(policy.ripgrep.command).empty()) {
    return absl::InvalidArgumentError("Empty 'ripgrep.command'");
  }
  return absl::OkStatus();
}

absl::StatusOr<RestrictionPolicy> ApplyOverrides(
    const RestrictionPolicy& base, const PolicyOverrides& overrides) {
  RestrictionPolicy merged = base;
  Override(merged.network.allowed_domains, overrides.allowed_domains);
  Override(merged.network.denied_domains, overrides.denied_domains);
  if (overrides.allow_unix_sockets.has_value()) {
    merged.network.allow_unix_sockets = overrides.allow_unix_sockets;
  }
  Override(merged.network.allow_all_unix_sockets,
           overrides.allow_all_unix_sockets);
  Override(merged.network.allow_local_binding, overrides.allow_local_binding);
  Override(merged.filesystem.deny_read, overrides.deny_read);
  Override(merged.filesystem.allow_read, overrides.allow_read);
  if (overrides.allow_write.has_value()) {
    merged.filesystem.allow_write = overrides.allow_write;
  }
  Override(merged.filesystem.deny_write, overrides.deny_write);
  Override(merged.enable_weaker_nested_sandbox,
           overrides.enable_weaker_nested_sandbox);
  if (absl::Status status = ValidatePolicy(merged); !status.ok()) {
    return status;
  }
  return merged;
}

bool NeedsNetworkRestriction(const RestrictionPolicy& policy) {
  return !policy.network.allowed_domains.empty();
}

std::ostream& operator<<(std::ostream& out, const RestrictionPolicy& policy) {
  const NetworkPolicy& net = policy.network;
  const FilesystemPolicy& fs = policy.filesystem;
  out << "RestrictionPolicy {\n";
  PrintList(out, "allowed_domains", net.allowed_domains);
  PrintList(out, "denied_domains", net.denied_domains);
  if (net.allow_unix_sockets) {
    PrintList(out, "allow_unix_sockets", *net.allow_unix_sockets);
  }
  out << "\tallow_all_unix_sockets: " << net.allow_all_unix_sockets << "\n";
  out << "\tallow_local_binding: " << net.allow_local_binding << "\n";
  if (net.external_http_proxy_port) {
    out << "\thttp_proxy_port: " << *net.external_http_proxy_port << "\n";
  }
  if (net.external_socks_proxy_port) {
    out << "\tsocks_proxy_port: " << *net.external_socks_proxy_port << "\n";
  }
  PrintList(out, "deny_read", fs.deny_read);
  PrintList(out, "allow_read", fs.allow_read);
  if (fs.allow_write) {
    PrintList(out, "allow_write", *fs.allow_write);
  } else {
    out << "\tallow_write: (unrestricted)\n";
  }
  PrintList(out, "deny_write", fs.deny_write);
  out << "\tenable_weaker_nested_sandbox: "
      << policy.enable_weaker_nested_sandbox << "\n";
  return out << "}";
}

}  // namespace sandbox_runtime
