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
#include "host/libs/network/socks_proxy.h"

#include <arpa/inet.h>
#include <stdint.h>

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

#include "host/libs/network/domain_filter.h"
#include "host/libs/network/forward.h"
#include "host/libs/network/proxy_server.h"
#include "host/libs/network/tcp_socket.h"

namespace sandbox_runtime {
namespace {

constexpr uint8_t kSocksVersion = 0x05;
constexpr uint8_t kNoAuthentication = 0x00;
constexpr uint8_t kNoAcceptableMethods = 0xFF;
constexpr uint8_t kConnectCommand = 0x01;
constexpr uint8_t kIpv4Address = 0x01;
constexpr uint8_t kDomainAddress = 0x03;
constexpr uint8_t kIpv6Address = 0x04;

/** `OutOfRange` when the client closes early. */
absl::Status RecvExact(int fd, uint8_t* buf, size_t len) {
  while (len > 0) {
    absl::StatusOr<size_t> got =
        RecvSome(fd, reinterpret_cast<char*>(buf), len);
    if (!got.ok()) {
      return got.status();
    }
    if (*got == 0) {
      return absl::OutOfRangeError("Client closed mid-message");
    }
    buf += *got;
    len -= *got;
  }
  return absl::OkStatus();
}

/** Replies always carry the unspecified IPv4 address as bound address. */
absl::Status SendReply(int client, SocksReply reply) {
  const char message[] = {
      static_cast<char>(kSocksVersion), static_cast<char>(reply), 0,
      static_cast<char>(kIpv4Address),  0, 0, 0, 0, 0, 0,
  };
  return SendAll(client, std::string_view(message, sizeof(message)));
}

struct SocksTarget {
  std::string host;
  uint16_t port;
};

}  // namespace

SocksReply SocksReplyFor(const absl::Status& connect_status) {
  switch (connect_status.code()) {
    case absl::StatusCode::kUnavailable:
      return SocksReply::kConnectionRefused;
    case absl::StatusCode::kFailedPrecondition:
      return SocksReply::kNetworkUnreachable;
    case absl::StatusCode::kDeadlineExceeded:
      return SocksReply::kTtlExpired;
    case absl::StatusCode::kCancelled:
      return SocksReply::kGeneralFailure;
    default:
      return SocksReply::kHostUnreachable;
  }
}

absl::StatusOr<std::unique_ptr<SocksProxy>> SocksProxy::Start(
    const std::string& host, uint16_t port, ConnectionFilter filter) {
  std::unique_ptr<SocksProxy> proxy(new SocksProxy(std::move(filter)));
  absl::StatusOr<std::unique_ptr<ProxyServer>> server = ProxyServer::Listen(
      "SOCKS", host, port,
      [raw = proxy.get()](int client, const ServerStop& stop) {
        absl::Status status = raw->HandleConnection(client, stop);
        if (!status.ok()) {
          VLOG(1) << "SOCKS connection ended: " << status;
        }
      });
  if (!server.ok()) {
    return server.status();
  }
  proxy->server_ = std::move(*server);
  return proxy;
}

SocksProxy::SocksProxy(ConnectionFilter filter) : filter_(std::move(filter)) {}

uint16_t SocksProxy::Port() const { return server_->Port(); }

void SocksProxy::Close() { server_->Close(); }

absl::Status SocksProxy::HandleConnection(int client, const ServerStop& stop) {
  uint8_t greeting[2];
  if (absl::Status status = RecvExact(client, greeting, sizeof(greeting));
      !status.ok()) {
    return status;
  }
  if (greeting[0] != kSocksVersion) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Unsupported SOCKS version ", static_cast<int>(greeting[0])));
  }
  uint8_t methods[255];
  if (absl::Status status = RecvExact(client, methods, greeting[1]);
      !status.ok()) {
    return status;
  }
  bool no_auth = std::find(methods, methods + greeting[1],
                           kNoAuthentication) != methods + greeting[1];
  const char selection[] = {
      static_cast<char>(kSocksVersion),
      static_cast<char>(no_auth ? kNoAuthentication : kNoAcceptableMethods)};
  if (absl::Status status =
          SendAll(client, std::string_view(selection, sizeof(selection)));
      !status.ok()) {
    return status;
  }
  if (!no_auth) {
    return absl::PermissionDeniedError("Client offered no usable method");
  }

  uint8_t request[4];
  if (absl::Status status = RecvExact(client, request, sizeof(request));
      !status.ok()) {
    return status;
  }
  if (request[0] != kSocksVersion) {
    return absl::InvalidArgumentError("Bad request version");
  }
  if (request[1] != kConnectCommand) {
    return SendReply(client, SocksReply::kCommandNotSupported);
  }

  SocksTarget target;
  switch (request[3]) {
    case kIpv4Address: {
      uint8_t address[4];
      if (absl::Status status = RecvExact(client, address, sizeof(address));
          !status.ok()) {
        return status;
      }
      char text[INET_ADDRSTRLEN];
      inet_ntop(AF_INET, address, text, sizeof(text));
      target.host = text;
      break;
    }
    case kDomainAddress: {
      uint8_t length;
      if (absl::Status status = RecvExact(client, &length, 1); !status.ok()) {
        return status;
      }
      uint8_t name[255];
      if (absl::Status status = RecvExact(client, name, length);
          !status.ok()) {
        return status;
      }
      target.host.assign(reinterpret_cast<char*>(name), length);
      break;
    }
    case kIpv6Address: {
      uint8_t address[16];
      if (absl::Status status = RecvExact(client, address, sizeof(address));
          !status.ok()) {
        return status;
      }
      char text[INET6_ADDRSTRLEN];
      inet_ntop(AF_INET6, address, text, sizeof(text));
      target.host = text;
      break;
    }
    default:
      return SendReply(client, SocksReply::kAddressTypeNotSupported);
  }
  uint8_t port[2];
  if (absl::Status status = RecvExact(client, port, sizeof(port));
      !status.ok()) {
    return status;
  }
  target.port = static_cast<uint16_t>(port[0] << 8 | port[1]);

  if (absl::Status valid = ValidateHostName(target.host); !valid.ok()) {
    LOG(ERROR) << "Rejecting SOCKS target: " << valid;
    return SendReply(client, SocksReply::kNotAllowed);
  }
  if (!filter_(target.port, target.host)) {
    LOG(ERROR) << "Connection blocked to " << target.host << ":"
               << target.port;
    return SendReply(client, SocksReply::kNotAllowed);
  }
  absl::StatusOr<UniqueFd> upstream =
      ConnectTcp(target.host, target.port, stop.Fd());
  if (!upstream.ok()) {
    LOG(ERROR) << "Failed to connect to " << target.host << ":" << target.port
               << ": " << upstream.status();
    return SendReply(client, SocksReplyFor(upstream.status()));
  }
  if (absl::Status status = SendReply(client, SocksReply::kSucceeded);
      !status.ok()) {
    return status;
  }
  return ForwardDuplex(client, upstream->Get(), stop.Fd());
}

}  // namespace sandbox_runtime
