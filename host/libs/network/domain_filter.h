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
#ifndef SANDBOX_RUNTIME_HOST_LIBS_NETWORK_DOMAIN_FILTER_H
#define SANDBOX_RUNTIME_HOST_LIBS_NETWORK_DOMAIN_FILTER_H

#include <stdint.h>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox_runtime {

/** Decides whether a connection to `host:port` may proceed. Called from proxy
 * worker threads. */
using ConnectionFilter = std::function<bool(uint16_t port, const std::string& host)>;

/** Consulted for hosts no list mentions. */
using AskCallback = std::function<bool(uint16_t port, const std::string& host)>;

/** Case-insensitive. `*.example.com` matches any subdomain of `example.com`
 * but not `example.com` itself. */
bool MatchesDomainPattern(std::string_view host, std::string_view pattern);

/** Denied patterns win over allowed ones. Unlisted hosts go to `ask` when
 * set and are refused otherwise. */
bool FilterNetworkRequest(uint16_t port, const std::string& host,
                          const std::vector<std::string>& allowed,
                          const std::vector<std::string>& denied,
                          const AskCallback& ask);

}  // namespace sandbox_runtime

#endif
