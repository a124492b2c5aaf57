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
#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <stdlib.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/log/globals.h>
#include <absl/log/initialize.h>
#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/pidfd.h"
#include "common/libs/utils/poll_callback.h"
#include "common/libs/utils/signal_fd.h"
#include "common/libs/utils/subprocess.h"
#include "common/libs/utils/unique_fd.h"
#include "host/commands/sandbox_runtime/logs.h"
#include "host/libs/sandbox/policy.h"
#include "host/libs/sandbox/policy_json.h"
#include "host/libs/sandbox/sandbox_manager.h"
#include "host/libs/sandbox/violation_store.h"

ABSL_FLAG(std::string, settings, "",
          "Policy file, defaults to ~/.srt-settings.json");
ABSL_FLAG(bool, debug, false, "Write debug messages to stderr");
ABSL_FLAG(std::vector<std::string>, log_files, std::vector<std::string>(),
          "File paths to write logs to");

namespace sandbox_runtime {
namespace {

inline constexpr char kDefaultSettingsName[] = ".srt-settings.json";

absl::StatusOr<RestrictionPolicy> LoadSettings() {
  std::string path = absl::GetFlag(FLAGS_settings);
  if (path.empty()) {
    path = JoinPath(HomeDirectory(), kDefaultSettingsName);
  }
  absl::StatusOr<std::optional<RestrictionPolicy>> loaded =
      LoadPolicyFromFile(path);
  if (!loaded.ok()) {
    return loaded.status();
  }
  if (!loaded->has_value()) {
    VLOG(1) << "No settings at '" << path << "', using the default policy";
    return DefaultPolicy();
  }
  return std::move(**loaded);
}

/** Runs `command` with `/bin/sh -c` on the stdio of this process, relaying
 * SIGINT and SIGTERM, and returns its exit code. */
absl::StatusOr<int> RunShellCommand(const std::string& command,
                                    SignalFd& signals) {
  std::vector<std::pair<UniqueFd, int>> fds;
  for (int i = 0; i <= 2; i++) {
    auto duped = fcntl(i, F_DUPFD_CLOEXEC, 0);
    if (duped < 0) {
      static constexpr char kErr[] = "Failed to `dup` stdio file descriptor";
      return absl::ErrnoToStatus(errno, kErr);
    }
    fds.emplace_back(UniqueFd(duped), i);
  }

  std::vector<std::string> argv = {"/bin/sh", "-c", command};
  absl::StatusOr<PidFd> child =
      PidFd::LaunchSubprocess(argv, std::move(fds), CurrentEnvironment());
  if (!child.ok()) {
    return child.status();
  }

  bool exited = false;
  PollCallback poll;
  poll.Add(child->Get(), [&exited](short) {
    exited = true;
    return absl::OkStatus();
  });
  poll.Add(signals.Fd(), [&signals, &child](short) -> absl::Status {
    absl::StatusOr<signalfd_siginfo> info = signals.ReadSignal();
    if (!info.ok()) {
      return info.status();
    }
    VLOG(1) << "Forwarding signal " << info->ssi_signo;
    return child->SendSignal(info->ssi_signo);
  });
  while (!exited) {
    absl::StatusOr<int> polled = poll.Poll();
    if (!polled.ok()) {
      return polled.status();
    }
  }
  return child->ExitCode();
}

absl::StatusOr<int> SandboxRuntimeMain(int argc, char** argv) {
  absl::SetProgramUsageMessage(
      "Runs a command confined by network and filesystem restrictions.\n"
      "Usage: srt [--settings=<path>] [--debug] -- <command...>");
  std::vector<char*> args = absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();
  if (absl::GetFlag(FLAGS_debug)) {
    absl::SetStderrThreshold(absl::LogSeverity::kInfo);
    absl::SetGlobalVLogLevel(1);
  } else {
    absl::SetStderrThreshold(absl::LogSeverity::kError);
  }
  absl::EnableLogPrefix(true);

  absl::Status logs_status = LogToFiles(absl::GetFlag(FLAGS_log_files));
  if (!logs_status.ok()) {
    return logs_status;
  }

  if (args.size() < 2) {
    return absl::InvalidArgumentError("No command given");
  }
  std::string command = absl::StrJoin(args.begin() + 1, args.end(), " ");

  // Before any thread starts, so only the signalfd sees these.
  absl::StatusOr<SignalFd> signals = SignalFd::For({SIGINT, SIGTERM});
  if (!signals.ok()) {
    return signals.status();
  }

  absl::StatusOr<RestrictionPolicy> policy = LoadSettings();
  if (!policy.ok()) {
    return policy.status();
  }
  VLOG(1) << *policy;

  ViolationStore store;
  absl::StatusOr<std::unique_ptr<SandboxManager>> manager =
      SandboxManager::Create(store, SandboxManagerOptions{});
  if (!manager.ok()) {
    return manager.status();
  }
  if (absl::Status init = (*manager)->Initialize(*policy); !init.ok()) {
    return init;
  }
  for (const std::string& glob : (*manager)->GlobPatternWarnings()) {
    LOG(WARNING) << "Glob pattern '" << glob << "' is ignored on Linux";
  }

  VLOG(1) << "Original command: " << command;
  absl::StatusOr<std::string> wrapped = (*manager)->WrapWithSandbox(command);
  if (!wrapped.ok()) {
    return wrapped.status();
  }
  VLOG(1) << "Wrapped command: " << *wrapped;

  absl::StatusOr<int> code = RunShellCommand(*wrapped, *signals);
  (*manager)->Reset();
  return code;
}

}  // namespace
}  // namespace sandbox_runtime

int main(int argc, char** argv) {
  absl::StatusOr<int> code = sandbox_runtime::SandboxRuntimeMain(argc, argv);
  if (!code.ok()) {
    std::cerr << "Error: " << code.status() << '\n';
    return 1;
  }
  VLOG(1) << "srt exiting with " << *code;
  return *code;
}
