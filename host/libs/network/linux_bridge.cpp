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
#include "host/libs/network/linux_bridge.h"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <absl/log/log.h>
#include <absl/random/random.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/escaping.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/pidfd.h"
#include "common/libs/utils/subprocess.h"
#include "common/libs/utils/unique_fd.h"

namespace sandbox_runtime {
namespace {

std::string RandomHex(size_t bytes) {
  absl::BitGen gen;
  std::string raw(bytes, '\0');
  for (char& byte : raw) {
    byte = static_cast<char>(absl::Uniform<int>(gen, 0, 256));
  }
  return absl::BytesToHexString(raw);
}

absl::StatusOr<PidFd> LaunchForwarder(const std::string& socat,
                                      const std::vector<std::string>& args) {
  std::vector<std::string> argv = {socat};
  argv.insert(argv.end(), args.begin(), args.end());
  VLOG(1) << "Starting bridge: " << absl::StrJoin(argv, " ");

  std::vector<std::pair<UniqueFd, int>> fds;
  for (int target : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
    UniqueFd dev_null(open("/dev/null", O_RDWR | O_CLOEXEC));
    if (dev_null.Get() < 0) {
      return absl::ErrnoToStatus(errno, "`open(/dev/null)` failed");
    }
    fds.emplace_back(std::move(dev_null), target);
  }
  return PidFd::LaunchSubprocess(argv, std::move(fds), CurrentEnvironment());
}

void KillForwarder(PidFd& forwarder) {
  absl::Status status = forwarder.Terminate(absl::Seconds(1));
  if (!status.ok()) {
    LOG(ERROR) << "Failed to stop bridge process " << forwarder.Pid() << ": "
               << status;
  }
}

absl::StatusOr<bool> Exited(PidFd& process) {
  return process.WaitForExit(absl::ZeroDuration());
}

}  // namespace

std::vector<std::string> BridgeSocatArgs(const std::string& socket_path,
                                         uint16_t port) {
  return {
      absl::StrCat("UNIX-LISTEN:", socket_path, ",fork,reuseaddr"),
      absl::StrCat("TCP:localhost:", port,
                   ",keepalive,keepidle=10,keepintvl=5,keepcnt=3"),
  };
}

absl::StatusOr<std::unique_ptr<LinuxBridge>> LinuxBridge::Start(
    uint16_t http_proxy_port, uint16_t socks_proxy_port,
    const Options& options) {
  absl::StatusOr<std::string> socat = FindExecutable(options.socat);
  if (!socat.ok()) {
    return absl::FailedPreconditionError(
        absl::StrCat("socat is required for the network bridge: ",
                     socat.status().message()));
  }
  std::string id = RandomHex(8);
  std::string http_socket =
      JoinPath(options.socket_dir, absl::StrCat("srt-http-", id, ".sock"));
  std::string socks_socket =
      JoinPath(options.socket_dir, absl::StrCat("srt-socks-", id, ".sock"));

  absl::StatusOr<PidFd> http =
      LaunchForwarder(*socat, BridgeSocatArgs(http_socket, http_proxy_port));
  if (!http.ok()) {
    return absl::UnavailableError(absl::StrCat(
        "Failed to start HTTP bridge process: ", http.status().message()));
  }
  absl::StatusOr<PidFd> socks =
      LaunchForwarder(*socat, BridgeSocatArgs(socks_socket, socks_proxy_port));
  if (!socks.ok()) {
    KillForwarder(*http);
    return absl::UnavailableError(absl::StrCat(
        "Failed to start SOCKS bridge process: ", socks.status().message()));
  }

  std::unique_ptr<LinuxBridge> bridge(new LinuxBridge(
      http_socket, socks_socket, std::move(*http), std::move(*socks)));
  for (int i = 0; i < options.attempts; i++) {
    absl::StatusOr<bool> http_exited = Exited(*bridge->http_);
    absl::StatusOr<bool> socks_exited = Exited(*bridge->socks_);
    if (!http_exited.ok() || !socks_exited.ok() || *http_exited ||
        *socks_exited) {
      absl::Status stopped = bridge->Stop(absl::Seconds(1));
      if (!stopped.ok()) {
        LOG(ERROR) << "Bridge cleanup failed: " << stopped;
      }
      return absl::UnavailableError("Linux bridge process died unexpectedly");
    }
    if (FileExists(http_socket) && FileExists(socks_socket)) {
      VLOG(1) << "Linux bridges ready after " << i + 1 << " attempts";
      return bridge;
    }
    absl::SleepFor(absl::Milliseconds(100) * i);
  }
  absl::Status stopped = bridge->Stop(absl::Seconds(1));
  if (!stopped.ok()) {
    LOG(ERROR) << "Bridge cleanup failed: " << stopped;
  }
  return absl::UnavailableError(absl::StrCat(
      "Failed to create bridge sockets after ", options.attempts,
      " attempts"));
}

LinuxBridge::LinuxBridge(std::string http_socket_path,
                         std::string socks_socket_path, PidFd http,
                         PidFd socks)
    : http_socket_path_(std::move(http_socket_path)),
      socks_socket_path_(std::move(socks_socket_path)),
      http_(std::move(http)),
      socks_(std::move(socks)) {}

LinuxBridge::~LinuxBridge() {
  absl::Status stopped = Stop();
  if (!stopped.ok()) {
    LOG(ERROR) << "Failed to stop Linux bridge: " << stopped;
  }
}

absl::Status LinuxBridge::Stop(absl::Duration grace) {
  absl::Status status;
  for (std::optional<PidFd>* process : {&http_, &socks_}) {
    if (!process->has_value()) {
      continue;
    }
    status.Update((*process)->Terminate(grace));
    process->reset();
  }
  for (const auto& path : {http_socket_path_, socks_socket_path_}) {
    if (unlink(path.c_str()) < 0 && errno != ENOENT) {
      status.Update(absl::ErrnoToStatus(errno, absl::StrCat("`unlink(", path,
                                                            ")` failed")));
    }
  }
  return status;
}

}  // namespace sandbox_runtime
