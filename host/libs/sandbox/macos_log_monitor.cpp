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
#include "host/libs/sandbox/macos_log_monitor.h"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/time/time.h>

#include "common/libs/utils/pidfd.h"
#include "common/libs/utils/subprocess.h"
#include "common/libs/utils/unique_fd.h"
#include "host/libs/sandbox/violation_store.h"

namespace sandbox_runtime {
namespace {

constexpr std::string_view kNoise[] = {
    "mDNSResponder",
    "mach-lookup com.apple.diagnosticd",
    "mach-lookup com.apple.analyticsd",
};

bool ContainsAny(std::string_view text,
                 const std::vector<std::string>& needles) {
  for (const auto& needle : needles) {
    if (absl::StrContains(text, needle)) {
      return true;
    }
  }
  return false;
}

/** The text of `CMD64_(.+?)_END`. */
std::optional<std::string> EncodedCommand(std::string_view line) {
  size_t start = line.find("CMD64_");
  if (start == std::string_view::npos) {
    return std::nullopt;
  }
  start += std::string_view("CMD64_").size();
  // Non-greedy, at least one character.
  size_t end = line.find("_END", start + 1);
  if (end == std::string_view::npos) {
    return std::nullopt;
  }
  return std::string(line.substr(start, end - start));
}

}  // namespace

SandboxLogParser::SandboxLogParser(
    std::map<std::string, std::vector<std::string>> ignore_violations)
    : ignore_violations_(std::move(ignore_violations)) {}

std::optional<ViolationEvent> SandboxLogParser::ParseLine(
    std::string_view line) {
  line = absl::StripTrailingAsciiWhitespace(line);
  if (absl::StartsWith(line, "CMD64_")) {
    command_line_ = std::string(line);
  }
  if (!absl::StrContains(line, "Sandbox:") || !absl::StrContains(line, "deny")) {
    return std::nullopt;
  }
  std::string_view details = line.substr(line.find("Sandbox:") + 8);
  details = absl::StripLeadingAsciiWhitespace(details);
  if (details.empty()) {
    return std::nullopt;
  }

  ViolationEvent event{.line = std::string(details)};
  if (command_line_) {
    event.encoded_command = EncodedCommand(*command_line_);
    if (event.encoded_command) {
      absl::StatusOr<std::string> command =
          DecodeSandboxedCommand(*event.encoded_command);
      if (command.ok()) {
        event.command = *command;
      } else {
        VLOG(1) << "Undecodable command tag: " << command.status();
      }
    }
  }
  command_line_.reset();

  for (std::string_view noise : kNoise) {
    if (absl::StrContains(details, noise)) {
      return std::nullopt;
    }
  }
  if (IsIgnored(details, event.command)) {
    return std::nullopt;
  }
  return event;
}

bool SandboxLogParser::IsIgnored(
    std::string_view details, const std::optional<std::string>& command) const {
  if (!command) {
    return false;
  }
  for (const auto& [pattern, paths] : ignore_violations_) {
    if (pattern == "*" || absl::StrContains(*command, pattern)) {
      if (ContainsAny(details, paths)) {
        return true;
      }
    }
  }
  return false;
}

std::vector<std::string> LogStreamCommand(std::string_view session_suffix) {
  return {
      "log",
      "stream",
      "--predicate",
      absl::StrCat("(eventMessage ENDSWITH \"", session_suffix, "\")"),
      "--style",
      "compact",
  };
}

absl::StatusOr<std::unique_ptr<MacOsLogMonitor>> MacOsLogMonitor::Start(
    ViolationStore& store,
    std::map<std::string, std::vector<std::string>> ignore_violations,
    std::vector<std::string> argv) {
  if (argv.empty()) {
    return absl::InvalidArgumentError("Empty log command");
  }
  absl::StatusOr<std::string> executable = FindExecutable(argv[0]);
  if (!executable.ok()) {
    return executable.status();
  }
  argv[0] = *executable;

  absl::StatusOr<std::pair<UniqueFd, UniqueFd>> pipe = UniqueFd::Pipe();
  if (!pipe.ok()) {
    return pipe.status();
  }
  UniqueFd dev_null(open("/dev/null", O_RDWR | O_CLOEXEC));
  if (dev_null.Get() < 0) {
    return absl::ErrnoToStatus(errno, "`open(/dev/null)` failed");
  }
  std::vector<std::pair<UniqueFd, int>> fds;
  fds.emplace_back(std::move(pipe->second), STDOUT_FILENO);
  fds.emplace_back(std::move(dev_null), STDERR_FILENO);

  absl::StatusOr<PidFd> process =
      PidFd::LaunchSubprocess(argv, std::move(fds), CurrentEnvironment());
  if (!process.ok()) {
    return process.status();
  }
  VLOG(1) << "Started log monitor, pid " << process->Pid();

  std::unique_ptr<MacOsLogMonitor> monitor(new MacOsLogMonitor(
      std::move(*process), std::move(pipe->first), store,
      SandboxLogParser(std::move(ignore_violations))));
  monitor->reader_ = std::thread([raw = monitor.get()] { raw->ReadOutput(); });
  return monitor;
}

MacOsLogMonitor::MacOsLogMonitor(PidFd process, UniqueFd output,
                                 ViolationStore& store,
                                 SandboxLogParser parser)
    : process_(std::move(process)),
      output_(std::move(output)),
      store_(store),
      parser_(std::move(parser)) {}

MacOsLogMonitor::~MacOsLogMonitor() {
  absl::Status stopped = Stop();
  if (!stopped.ok()) {
    LOG(ERROR) << "Failed to stop log monitor: " << stopped;
  }
}

absl::Status MacOsLogMonitor::Stop() {
  absl::Status status;
  if (process_) {
    VLOG(1) << "Stopping log monitor";
    status = process_->Terminate(absl::Seconds(5));
    process_.reset();
  }
  // The write end died with the process, so the reader sees EOF.
  if (reader_.joinable()) {
    reader_.join();
  }
  return status;
}

void MacOsLogMonitor::ReadOutput() {
  std::string pending;
  char buf[4096];
  while (true) {
    absl::StatusOr<size_t> read = output_.Read(buf, sizeof(buf));
    if (!read.ok()) {
      LOG(ERROR) << "Reading log stream failed: " << read.status();
      break;
    }
    if (*read == 0) {
      break;
    }
    pending.append(buf, *read);
    size_t newline;
    while ((newline = pending.find('\n')) != std::string::npos) {
      std::optional<ViolationEvent> event =
          parser_.ParseLine(std::string_view(pending).substr(0, newline));
      if (event) {
        store_.Add(std::move(*event));
      }
      pending.erase(0, newline + 1);
    }
  }
  if (!pending.empty()) {
    std::optional<ViolationEvent> event = parser_.ParseLine(pending);
    if (event) {
      store_.Add(std::move(*event));
    }
  }
}

}  // namespace sandbox_runtime
