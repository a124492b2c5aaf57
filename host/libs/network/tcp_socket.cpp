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
#include "host/libs/network/tcp_socket.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>

#include <memory>
#include <string>
#include <string_view>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include "common/libs/utils/unique_fd.h"

namespace sandbox_runtime {
namespace {

using AddrInfoPtr = std::unique_ptr<addrinfo, decltype(&freeaddrinfo)>;

absl::StatusOr<AddrInfoPtr> Resolve(const std::string& host, uint16_t port,
                                    int flags) {
  addrinfo hints = {
      .ai_flags = flags,
      .ai_family = AF_UNSPEC,
      .ai_socktype = SOCK_STREAM,
  };
  addrinfo* result = nullptr;
  std::string service = absl::StrCat(port);
  int error = getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
  if (error != 0) {
    return absl::NotFoundError(absl::StrCat("Failed to resolve '", host,
                                            "': ", gai_strerror(error)));
  }
  return AddrInfoPtr(result, freeaddrinfo);
}

absl::Status ConnectErrorToStatus(int error, const std::string& target) {
  std::string message = absl::StrCat("`connect(", target, ")` failed");
  switch (error) {
    case ECONNREFUSED:
      return absl::UnavailableError(message);
    case ENETUNREACH:
      return absl::FailedPreconditionError(message);
    case EHOSTUNREACH:
      return absl::NotFoundError(message);
    default:
      return absl::ErrnoToStatus(error, message);
  }
}

constexpr size_t kMaxHostNameLength = 253;

/** Waits for a non-blocking `connect` on `fd` to finish. Returns the
 * connection's error, 0 on success. */
absl::StatusOr<int> AwaitConnect(int fd, int cancel_fd, absl::Duration timeout,
                                 const std::string& target) {
  absl::Time deadline = absl::Now() + timeout;
  while (true) {
    pollfd fds[2] = {
        {.fd = fd, .events = POLLOUT},
        {.fd = cancel_fd, .events = POLLIN},
    };
    absl::Duration left = deadline - absl::Now();
    if (left <= absl::ZeroDuration()) {
      return absl::DeadlineExceededError(
          absl::StrCat("Timed out connecting to ", target));
    }
    int timeout_ms = static_cast<int>(
        absl::ToInt64Milliseconds(absl::Ceil(left, absl::Milliseconds(1))));
    int ready = poll(fds, cancel_fd < 0 ? 1 : 2, timeout_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      return absl::ErrnoToStatus(errno, "`poll` failed");
    }
    if (cancel_fd >= 0 && fds[1].revents != 0) {
      return absl::CancelledError(
          absl::StrCat("Connecting to ", target, " was cancelled"));
    }
    if (fds[0].revents == 0) {
      continue;
    }
    int error = 0;
    socklen_t length = sizeof(error);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &length) < 0) {
      return absl::ErrnoToStatus(errno, "`getsockopt(SO_ERROR)` failed");
    }
    return error;
  }
}

}  // namespace

absl::Status ValidateHostName(std::string_view host) {
  if (host.empty() || host.size() > kMaxHostNameLength) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid host name length ", host.size()));
  }
  for (char c : host) {
    if (!absl::ascii_isalnum(static_cast<unsigned char>(c)) && c != '-' &&
        c != '.' && c != '_' && c != ':') {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Invalid character 0x%02x in host name", static_cast<unsigned char>(c)));
    }
  }
  return absl::OkStatus();
}

absl::StatusOr<UniqueFd> ListenTcp(const std::string& host, uint16_t port) {
  absl::StatusOr<AddrInfoPtr> addresses = Resolve(host, port, AI_PASSIVE);
  if (!addresses.ok()) {
    return addresses.status();
  }
  const addrinfo* address = addresses->get();
  UniqueFd fd(socket(address->ai_family, address->ai_socktype | SOCK_CLOEXEC,
                     address->ai_protocol));
  if (fd.Get() < 0) {
    return absl::ErrnoToStatus(errno, "`socket` failed");
  }
  int on = 1;
  if (setsockopt(fd.Get(), SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) < 0) {
    return absl::ErrnoToStatus(errno, "`setsockopt(SO_REUSEADDR)` failed");
  }
  if (bind(fd.Get(), address->ai_addr, address->ai_addrlen) < 0) {
    return absl::ErrnoToStatus(errno,
                               absl::StrCat("`bind(", host, ":", port, ")`"));
  }
  if (listen(fd.Get(), SOMAXCONN) < 0) {
    return absl::ErrnoToStatus(errno, "`listen` failed");
  }
  return fd;
}

absl::StatusOr<uint16_t> BoundPort(int fd) {
  sockaddr_storage address;
  socklen_t length = sizeof(address);
  if (getsockname(fd, reinterpret_cast<sockaddr*>(&address), &length) < 0) {
    return absl::ErrnoToStatus(errno, "`getsockname` failed");
  }
  switch (address.ss_family) {
    case AF_INET:
      return ntohs(reinterpret_cast<sockaddr_in*>(&address)->sin_port);
    case AF_INET6:
      return ntohs(reinterpret_cast<sockaddr_in6*>(&address)->sin6_port);
    default:
      return absl::InternalError(
          absl::StrCat("Unexpected address family ", address.ss_family));
  }
}

absl::StatusOr<UniqueFd> ConnectTcp(const std::string& host, uint16_t port,
                                    int cancel_fd, absl::Duration timeout) {
  if (absl::Status valid = ValidateHostName(host); !valid.ok()) {
    return valid;
  }
  absl::StatusOr<AddrInfoPtr> addresses = Resolve(host, port, 0);
  if (!addresses.ok()) {
    return addresses.status();
  }
  std::string target = absl::StrCat(host, ":", port);
  int last_error = EHOSTUNREACH;
  for (const addrinfo* address = addresses->get(); address != nullptr;
       address = address->ai_next) {
    UniqueFd fd(socket(address->ai_family,
                       address->ai_socktype | SOCK_CLOEXEC | SOCK_NONBLOCK,
                       address->ai_protocol));
    if (fd.Get() < 0) {
      last_error = errno;
      continue;
    }
    int error = 0;
    if (connect(fd.Get(), address->ai_addr, address->ai_addrlen) < 0) {
      if (errno != EINPROGRESS) {
        error = errno;
      } else {
        absl::StatusOr<int> result =
            AwaitConnect(fd.Get(), cancel_fd, timeout, target);
        if (!result.ok()) {
          return result.status();
        }
        error = *result;
      }
    }
    if (error == 0) {
      int flags = fcntl(fd.Get(), F_GETFL);
      if (flags < 0 || fcntl(fd.Get(), F_SETFL, flags & ~O_NONBLOCK) < 0) {
        return absl::ErrnoToStatus(errno, "`fcntl(O_NONBLOCK)` failed");
      }
      return fd;
    }
    last_error = error;
    VLOG(1) << "Connecting to " << target << " failed: " << strerror(error);
  }
  return ConnectErrorToStatus(last_error, target);
}

absl::Status SendAll(int fd, std::string_view data) {
  while (!data.empty()) {
    ssize_t sent = send(fd, data.data(), data.size(), MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      return absl::ErrnoToStatus(errno, absl::StrCat("`send(", fd, ")`"));
    }
    data.remove_prefix(sent);
  }
  return absl::OkStatus();
}

absl::StatusOr<size_t> RecvSome(int fd, char* buf, size_t len) {
  while (true) {
    ssize_t got = recv(fd, buf, len, 0);
    if (got >= 0) {
      return got;
    }
    if (errno != EINTR) {
      return absl::ErrnoToStatus(errno, absl::StrCat("`recv(", fd, ")`"));
    }
  }
}

}  // namespace sandbox_runtime
