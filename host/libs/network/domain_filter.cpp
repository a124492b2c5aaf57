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
#include "host/libs/network/domain_filter.h"

#include <string>
#include <string_view>
#include <vector>

#include <absl/log/log.h>
#include <absl/strings/match.h>
#include <absl/strings/strip.h>

namespace sandbox_runtime {

bool MatchesDomainPattern(std::string_view host, std::string_view pattern) {
  if (absl::ConsumePrefix(&pattern, "*.")) {
    // Keeps the dot so the bare domain does not match.
    return host.size() > pattern.size() + 1 &&
           absl::EndsWithIgnoreCase(host, pattern) &&
           host[host.size() - pattern.size() - 1] == '.';
  }
  return absl::EqualsIgnoreCase(host, pattern);
}

bool FilterNetworkRequest(uint16_t port, const std::string& host,
                          const std::vector<std::string>& allowed,
                          const std::vector<std::string>& denied,
                          const AskCallback& ask) {
  for (const auto& pattern : denied) {
    if (MatchesDomainPattern(host, pattern)) {
      LOG(INFO) << "Denied by config rule '" << pattern << "': " << host << ":"
                << port;
      return false;
    }
  }
  for (const auto& pattern : allowed) {
    if (MatchesDomainPattern(host, pattern)) {
      VLOG(1) << "Allowed by config rule '" << pattern << "': " << host << ":"
              << port;
      return true;
    }
  }
  if (ask) {
    bool decision = ask(port, host);
    LOG(INFO) << (decision ? "User allowed: " : "User denied: ") << host << ":"
              << port;
    return decision;
  }
  LOG(INFO) << "No matching config rule, denying: " << host << ":" << port;
  return false;
}

}  // namespace sandbox_runtime
