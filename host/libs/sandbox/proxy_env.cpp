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
#include "host/libs/sandbox/proxy_env.h"

#include <stdint.h>

#include <optional>
#include <string>
#include <vector>

#include <absl/strings/str_cat.h>

#include "common/libs/utils/architecture.h"
#include "host/libs/sandbox/sandbox_paths.h"

namespace sandbox_runtime {

constexpr char kNoProxyAddresses[] =
    "localhost,127.0.0.1,::1,*.local,.local,169.254.0.0/16,10.0.0.0/8,"
    "172.16.0.0/12,192.168.0.0/16";

std::vector<EnvironmentVariable> ProxyEnvironment(
    std::optional<uint16_t> http_port, std::optional<uint16_t> socks_port,
    Platform platform) {
  std::vector<EnvironmentVariable> env = {
      {"SANDBOX_RUNTIME", "1"},
      {"TMPDIR", kSandboxTmpDir},
  };
  if (!http_port && !socks_port) {
    return env;
  }

  env.emplace_back("NO_PROXY", kNoProxyAddresses);
  env.emplace_back("no_proxy", kNoProxyAddresses);

  if (http_port) {
    std::string http = absl::StrCat("http://localhost:", *http_port);
    for (const char* key :
         {"HTTP_PROXY", "HTTPS_PROXY", "http_proxy", "https_proxy"}) {
      env.emplace_back(key, http);
    }
  }

  if (socks_port) {
    // socks5h resolves names on the proxy side
    std::string socks = absl::StrCat("socks5h://localhost:", *socks_port);
    env.emplace_back("ALL_PROXY", socks);
    env.emplace_back("all_proxy", socks);
    if (platform == Platform::kMacOS) {
      env.emplace_back(
          "GIT_SSH_COMMAND",
          absl::StrCat("ssh -o ProxyCommand='nc -X 5 -x localhost:",
                       *socks_port, " %h %p'"));
    }
    env.emplace_back("FTP_PROXY", socks);
    env.emplace_back("ftp_proxy", socks);
    env.emplace_back("RSYNC_PROXY", absl::StrCat("localhost:", *socks_port));

    std::string docker =
        absl::StrCat("http://localhost:", http_port.value_or(*socks_port));
    env.emplace_back("DOCKER_HTTP_PROXY", docker);
    env.emplace_back("DOCKER_HTTPS_PROXY", docker);

    if (http_port) {
      env.emplace_back("CLOUDSDK_PROXY_TYPE", "https");
      env.emplace_back("CLOUDSDK_PROXY_ADDRESS", "localhost");
      env.emplace_back("CLOUDSDK_PROXY_PORT", absl::StrCat(*http_port));
    }

    env.emplace_back("GRPC_PROXY", socks);
    env.emplace_back("grpc_proxy", socks);
  }
  return env;
}

}  // namespace sandbox_runtime
