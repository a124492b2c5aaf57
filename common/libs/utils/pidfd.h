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
#ifndef SANDBOX_RUNTIME_COMMON_LIBS_UTILS_PIDFD_H
#define SANDBOX_RUNTIME_COMMON_LIBS_UTILS_PIDFD_H

#include <sys/types.h>

#include <string>
#include <utility>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/time/time.h>
#include <absl/types/span.h>

#include "common/libs/utils/unique_fd.h"

namespace sandbox_runtime {

class PidFd {
 public:
  /** Returns a managed pidfd tracking a previously started process with `pid`.
   *
   * Only reliably refers to the process `pid` if the caller can guarantee it
   * was not reaped while this is executing, otherwise it may refer to an
   * unknown process. */
  static absl::StatusOr<PidFd> FromRunningProcess(pid_t pid);

  /** Launches a subprocess and returns a pidfd tracking the newly launched
   * process.
   *
   * `argv[0]` must be an absolute path. Each `{fd, target}` pair in `fds` is
   * installed as `target` in the child, everything else not marked
   * close-on-exec is inherited. The child is sent SIGHUP if this process
   * dies. */
  static absl::StatusOr<PidFd> LaunchSubprocess(
      absl::Span<const std::string> argv,
      std::vector<std::pair<UniqueFd, int>> fds,
      absl::Span<const std::string> env);

  int Get() const;
  pid_t Pid() const;

  absl::Status SendSignal(int signal);

  /** Halt the process and all its descendants. */
  absl::Status HaltHierarchy();
  /** Halt all descendants of the process. Only safe to use if the caller
   * guarantees the process doesn't spawn or reap any children while running. */
  absl::Status HaltChildHierarchy();

  /** Waits for the process to exit without reaping it. Returns true if it
   * exited within `timeout`. */
  absl::StatusOr<bool> WaitForExit(absl::Duration timeout);

  /** Reaps the process, blocking until it exits. A process killed by a signal
   * reports `128 + signal`, the way shells do. */
  absl::StatusOr<int> ExitCode();

  /** SIGTERM, then SIGKILL if still running after `grace`. Reaps. */
  absl::Status Terminate(absl::Duration grace);

 private:
  PidFd(UniqueFd, pid_t);

  UniqueFd fd_;
  pid_t pid_;
};

}  // namespace sandbox_runtime

#endif
