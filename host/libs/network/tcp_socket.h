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
#ifndef SANDBOX_RUNTIME_HOST_LIBS_NETWORK_TCP_SOCKET_H
#define SANDBOX_RUNTIME_HOST_LIBS_NETWORK_TCP_SOCKET_H

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/time/time.h>

#include "common/libs/utils/unique_fd.h"

namespace sandbox_runtime {

/** Listening socket on `host:port`. Port 0 picks an ephemeral port. */
absl::StatusOr<UniqueFd> ListenTcp(const std::string& host, uint16_t port);

/** Port a socket is bound to. */
absl::StatusOr<uint16_t> BoundPort(int fd);

inline constexpr absl::Duration kConnectTimeout = absl::Seconds(30);

/** Hostnames and IP literals only: ASCII letters, digits, `-`, `.`, `_` and
 * `:`. Anything else, NUL included, is `InvalidArgument`. */
absl::Status ValidateHostName(std::string_view host);

/** Connects to the first reachable address `host` resolves to.
 *
 * An invalid host name is `InvalidArgument`. A resolution failure or
 * unreachable host is `NotFound`, a refused connection is `Unavailable` and
 * an unreachable network is `FailedPrecondition`. An address that does not
 * answer within `timeout` is `DeadlineExceeded`. When `cancel_fd` becomes
 * readable the attempt ends with `Cancelled`. */
absl::StatusOr<UniqueFd> ConnectTcp(const std::string& host, uint16_t port,
                                    int cancel_fd = -1,
                                    absl::Duration timeout = kConnectTimeout);

/** Sends all of `data` without raising SIGPIPE. */
absl::Status SendAll(int fd, std::string_view data);

/** Returns 0 on EOF. Retries on EINTR. */
absl::StatusOr<size_t> RecvSome(int fd, char* buf, size_t len);

}  // namespace sandbox_runtime

#endif
