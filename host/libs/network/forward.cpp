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
#include "host/libs/network/forward.h"

#include <errno.h>
#include <sys/socket.h>
#include <unistd.h>

#include <string_view>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

#include "common/libs/utils/poll_callback.h"
#include "host/libs/network/tcp_socket.h"

namespace sandbox_runtime {
namespace {

struct Direction {
  int from;
  int to;
  bool open = true;
};

absl::Status CopyOnce(Direction& direction) {
  char buf[8192];
  ssize_t got = read(direction.from, buf, sizeof(buf));
  if (got < 0) {
    if (errno == EINTR || errno == EAGAIN) {
      return absl::OkStatus();
    }
    return absl::ErrnoToStatus(errno,
                               absl::StrCat("`read(", direction.from, ")`"));
  }
  if (got == 0) {
    direction.open = false;
    shutdown(direction.to, SHUT_WR);
    return absl::OkStatus();
  }
  return SendAll(direction.to, std::string_view(buf, got));
}

}  // namespace

absl::Status ForwardDuplex(int a, int b, int stop_fd) {
  Direction directions[] = {{.from = a, .to = b}, {.from = b, .to = a}};
  bool stopped = false;
  absl::Status status;
  while ((directions[0].open || directions[1].open) && !stopped &&
         status.ok()) {
    PollCallback poller;
    for (Direction& direction : directions) {
      if (direction.open) {
        poller.Add(direction.from,
                   [&direction](short) { return CopyOnce(direction); });
      }
    }
    if (stop_fd >= 0) {
      poller.Add(stop_fd, [&stopped](short) {
        stopped = true;
        return absl::OkStatus();
      });
    }
    absl::StatusOr<int> polled = poller.Poll();
    if (!polled.ok()) {
      status = polled.status();
    }
  }
  if (stopped || !status.ok()) {
    if (!status.ok()) {
      VLOG(1) << "Forwarding between " << a << " and " << b
              << " failed: " << status;
    }
    shutdown(a, SHUT_RDWR);
    shutdown(b, SHUT_RDWR);
  }
  return status;
}

}  // namespace sandbox_runtime
