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
#ifndef SANDBOX_RUNTIME_HOST_LIBS_NETWORK_SOCKS_PROXY_H
#define SANDBOX_RUNTIME_HOST_LIBS_NETWORK_SOCKS_PROXY_H

#include <stdint.h>

#include <memory>
#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "host/libs/network/domain_filter.h"
#include "host/libs/network/proxy_server.h"

namespace sandbox_runtime {

/** RFC 1928 reply codes. */
enum class SocksReply : uint8_t {
  kSucceeded = 0x00,
  kGeneralFailure = 0x01,
  kNotAllowed = 0x02,
  kNetworkUnreachable = 0x03,
  kHostUnreachable = 0x04,
  kConnectionRefused = 0x05,
  kTtlExpired = 0x06,
  kCommandNotSupported = 0x07,
  kAddressTypeNotSupported = 0x08,
};

/** Reply for a failed upstream connection. */
SocksReply SocksReplyFor(const absl::Status& connect_status);

/** Filtering SOCKS5 proxy supporting unauthenticated CONNECT. */
class SocksProxy {
 public:
  static absl::StatusOr<std::unique_ptr<SocksProxy>> Start(
      const std::string& host, uint16_t port, ConnectionFilter filter);

  uint16_t Port() const;
  void Close();

 private:
  explicit SocksProxy(ConnectionFilter filter);

  absl::Status HandleConnection(int client, const ServerStop& stop);

  ConnectionFilter filter_;
  std::unique_ptr<ProxyServer> server_;
};

}  // namespace sandbox_runtime

#endif
