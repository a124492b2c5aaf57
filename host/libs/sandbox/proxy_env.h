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
#ifndef SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_PROXY_ENV_H
#define SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_PROXY_ENV_H

#include <stdint.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/libs/utils/architecture.h"

namespace sandbox_runtime {

using EnvironmentVariable = std::pair<std::string, std::string>;

/** Variables pointing common tools at the proxies, in a stable order.
 * `SANDBOX_RUNTIME` and `TMPDIR` are always present. */
std::vector<EnvironmentVariable> ProxyEnvironment(
    std::optional<uint16_t> http_port, std::optional<uint16_t> socks_port,
    Platform platform);

}  // namespace sandbox_runtime

#endif
