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
#ifndef SANDBOX_RUNTIME_HOST_LIBS_NETWORK_LINUX_BRIDGE_H
#define SANDBOX_RUNTIME_HOST_LIBS_NETWORK_LINUX_BRIDGE_H

#include <stdint.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/time/time.h>

#include "common/libs/utils/pidfd.h"

namespace sandbox_runtime {

/** socat arguments forwarding a Unix socket to a host TCP port. */
std::vector<std::string> BridgeSocatArgs(const std::string& socket_path,
                                         uint16_t port);

/** Host side of network access for a sandbox with its own network namespace.
 *
 * Two socat processes listen on Unix sockets that get bound into the
 * sandbox, and forward each connection to the HTTP and SOCKS proxies on the
 * host loopback. */
class LinuxBridge {
 public:
  struct Options {
    /** Resolved in `PATH` unless it contains a separator. */
    std::string socat = "socat";
    std::string socket_dir = "/tmp";
    int attempts = 5;
  };

  /** Starts both forwarders and waits for their sockets. `Unavailable` when
   * a forwarder dies or the sockets never appear, in which case both are
   * killed. */
  static absl::StatusOr<std::unique_ptr<LinuxBridge>> Start(
      uint16_t http_proxy_port, uint16_t socks_proxy_port,
      const Options& options);

  LinuxBridge(const LinuxBridge&) = delete;
  LinuxBridge& operator=(const LinuxBridge&) = delete;
  ~LinuxBridge();

  const std::string& HttpSocketPath() const { return http_socket_path_; }
  const std::string& SocksSocketPath() const { return socks_socket_path_; }

  /** SIGTERM, SIGKILL after `grace`, then removes both sockets. Idempotent. */
  absl::Status Stop(absl::Duration grace = absl::Seconds(5));

 private:
  LinuxBridge(std::string http_socket_path, std::string socks_socket_path,
              PidFd http, PidFd socks);

  std::string http_socket_path_;
  std::string socks_socket_path_;
  std::optional<PidFd> http_;
  std::optional<PidFd> socks_;
};

}  // namespace sandbox_runtime

#endif
