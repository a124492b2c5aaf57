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
#ifndef SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_POLICY_H
#define SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_POLICY_H

#include <stdint.h>

#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace sandbox_runtime {

struct NetworkPolicy {
  std::vector<std::string> allowed_domains;
  std::vector<std::string> denied_domains;
  std::optional<std::vector<std::string>> allow_unix_sockets;
  bool allow_all_unix_sockets = false;
  bool allow_local_binding = false;
  /** When set, no local proxy is started for that role. */
  std::optional<uint16_t> external_http_proxy_port;
  std::optional<uint16_t> external_socks_proxy_port;

  bool operator==(const NetworkPolicy&) const = default;
};

struct FilesystemPolicy {
  std::vector<std::string> deny_read;
  std::vector<std::string> allow_read;
  /** `nullopt` is "no write policy", an empty list is "no writes at all". */
  std::optional<std::vector<std::string>> allow_write;
  std::vector<std::string> deny_write;

  bool operator==(const FilesystemPolicy&) const = default;
};

struct RipgrepConfig {
  std::string command = "rg";
  std::vector<std::string> args;

  bool operator==(const RipgrepConfig&) const = default;
};

struct RestrictionPolicy {
  NetworkPolicy network;
  FilesystemPolicy filesystem;
  /** Command substring (or "*") to path substrings whose denials are noise. */
  std::map<std::string, std::vector<std::string>> ignore_violations;
  /** Skips the fresh /proc mount, for hosts that are already containers. */
  bool enable_weaker_nested_sandbox = false;
  RipgrepConfig ripgrep;

  bool operator==(const RestrictionPolicy&) const = default;
};

/** Per-call replacements for fields of a base policy. Unset members inherit
 * the base value. */
struct PolicyOverrides {
  std::optional<std::vector<std::string>> allowed_domains;
  std::optional<std::vector<std::string>> denied_domains;
  std::optional<std::vector<std::string>> allow_unix_sockets;
  std::optional<bool> allow_all_unix_sockets;
  std::optional<bool> allow_local_binding;
  std::optional<std::vector<std::string>> deny_read;
  std::optional<std::vector<std::string>> allow_read;
  std::optional<std::vector<std::string>> allow_write;
  std::optional<std::vector<std::string>> deny_write;
  std::optional<bool> enable_weaker_nested_sandbox;
};

/** Used when no policy document exists: no network, no writes beyond the
 * default write paths. */
RestrictionPolicy DefaultPolicy();

/** Accepts `localhost`, a dotted domain or `*.` followed by at least two
 * labels. */
absl::Status ValidateDomainPattern(std::string_view domain);

absl::Status ValidatePolicy(const RestrictionPolicy& policy);

absl::StatusOr<RestrictionPolicy> ApplyOverrides(
    const RestrictionPolicy& base, const PolicyOverrides& overrides);

/** Network confinement is requested by listing at least one allowed domain. */
bool NeedsNetworkRestriction(const RestrictionPolicy& policy);

std::ostream& operator<<(std::ostream&, const RestrictionPolicy&);

}  // namespace sandbox_runtime

#endif
