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
#include "common/libs/utils/subprocess.h"

#include <fcntl.h>
#include <poll.h>
#include <stdlib.h>
#include <unistd.h>

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/pidfd.h"
#include "common/libs/utils/poll_callback.h"
#include "common/libs/utils/unique_fd.h"

extern char** environ;

namespace sandbox_runtime {
namespace {

bool IsExecutableFile(const std::string& path) {
  return access(path.c_str(), X_OK) == 0 && !DirectoryExists(path);
}

struct OutputPipe {
  UniqueFd fd;
  std::string* sink;
  bool open = true;
};

absl::Status KillOnTimeout(PidFd& proc, const std::vector<std::string>& argv,
                           absl::Duration timeout) {
  LOG(WARNING) << "'" << absl::StrJoin(argv, " ") << "' timed out after "
               << timeout;
  if (absl::Status halt = proc.HaltHierarchy(); !halt.ok()) {
    LOG(ERROR) << "Failed to halt timed out process: " << halt;
  }
  if (absl::StatusOr<int> reaped = proc.ExitCode(); !reaped.ok()) {
    LOG(ERROR) << "Failed to reap timed out process: " << reaped.status();
  }
  return absl::DeadlineExceededError(
      absl::StrCat("'", argv[0], "' did not finish within ", timeout));
}

}  // namespace

absl::StatusOr<std::string> FindExecutable(std::string_view name) {
  if (name.empty()) {
    return absl::InvalidArgumentError("Empty executable name");
  }
  if (absl::StrContains(name, '/')) {
    std::string path(name);
    if (!IsExecutableFile(path)) {
      return absl::NotFoundError(absl::StrCat("'", path, "' is not executable"));
    }
    return path;
  }
  const char* path_env = getenv("PATH");
  std::string_view search = path_env == nullptr ? "/usr/bin:/bin" : path_env;
  for (std::string_view dir : absl::StrSplit(search, ':', absl::SkipEmpty())) {
    std::string candidate = JoinPath(dir, name);
    if (IsExecutableFile(candidate)) {
      return candidate;
    }
  }
  return absl::NotFoundError(absl::StrCat("'", name, "' not found in PATH"));
}

std::vector<std::string> CurrentEnvironment() {
  std::vector<std::string> env;
  for (size_t i = 0; environ[i] != nullptr; i++) {
    env.emplace_back(environ[i]);
  }
  return env;
}

absl::StatusOr<CapturedOutput> RunWithCapturedOutput(
    const std::vector<std::string>& argv, absl::Duration timeout) {
  if (argv.empty()) {
    return absl::InvalidArgumentError("Empty argv");
  }
  absl::StatusOr<std::string> exe = FindExecutable(argv[0]);
  if (!exe.ok()) {
    return exe.status();
  }
  std::vector<std::string> exe_argv = argv;
  exe_argv[0] = *exe;

  UniqueFd dev_null(open("/dev/null", O_RDONLY | O_CLOEXEC));
  if (dev_null.Get() < 0) {
    return absl::ErrnoToStatus(errno, "`open(/dev/null)` failed");
  }
  auto stdout_pipe = UniqueFd::Pipe();
  if (!stdout_pipe.ok()) {
    return stdout_pipe.status();
  }
  auto stderr_pipe = UniqueFd::Pipe();
  if (!stderr_pipe.ok()) {
    return stderr_pipe.status();
  }

  std::vector<std::pair<UniqueFd, int>> fds;
  fds.emplace_back(std::move(dev_null), 0);
  fds.emplace_back(std::move(stdout_pipe->second), 1);
  fds.emplace_back(std::move(stderr_pipe->second), 2);

  absl::StatusOr<PidFd> proc =
      PidFd::LaunchSubprocess(exe_argv, std::move(fds), CurrentEnvironment());
  if (!proc.ok()) {
    return proc.status();
  }

  CapturedOutput output{.exit_code = -1};
  OutputPipe pipes[] = {
      {.fd = std::move(stdout_pipe->first), .sink = &output.stdout_str},
      {.fd = std::move(stderr_pipe->first), .sink = &output.stderr_str},
  };

  absl::Time deadline = absl::Now() + timeout;
  while (pipes[0].open || pipes[1].open) {
    absl::Duration remaining = deadline - absl::Now();
    if (remaining <= absl::ZeroDuration()) {
      return KillOnTimeout(*proc, argv, timeout);
    }
    PollCallback poller;
    for (OutputPipe& pipe : pipes) {
      if (!pipe.open) {
        continue;
      }
      poller.Add(pipe.fd.Get(), [&pipe](short) -> absl::Status {
        char buf[4096];
        absl::StatusOr<size_t> got = pipe.fd.Read(buf, sizeof(buf));
        if (!got.ok()) {
          return got.status();
        } else if (*got == 0) {
          pipe.open = false;
        } else {
          pipe.sink->append(buf, *got);
        }
        return absl::OkStatus();
      });
    }
    if (absl::StatusOr<int> polled = poller.Poll(remaining); !polled.ok()) {
      return polled.status();
    }
  }

  absl::StatusOr<bool> exited = proc->WaitForExit(
      std::max(deadline - absl::Now(), absl::ZeroDuration()));
  if (!exited.ok()) {
    return exited.status();
  } else if (!*exited) {
    return KillOnTimeout(*proc, argv, timeout);
  }
  absl::StatusOr<int> exit_code = proc->ExitCode();
  if (!exit_code.ok()) {
    return exit_code.status();
  }
  output.exit_code = *exit_code;
  return output;
}

}  // namespace sandbox_runtime
