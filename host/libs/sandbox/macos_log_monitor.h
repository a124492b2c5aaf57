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
#ifndef SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_MACOS_LOG_MONITOR_H
#define SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_MACOS_LOG_MONITOR_H

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/libs/utils/pidfd.h"
#include "common/libs/utils/unique_fd.h"
#include "host/libs/sandbox/violation_store.h"

namespace sandbox_runtime {

/** Turns `log stream --style compact` output into violation events.
 *
 * A `Sandbox: ... deny ...` line is reported together with the most recent
 * `CMD64_<base64>_END` line, whose command is decoded. System noise and
 * denials matching `ignore_violations` are dropped. */
class SandboxLogParser {
 public:
  explicit SandboxLogParser(
      std::map<std::string, std::vector<std::string>> ignore_violations);

  std::optional<ViolationEvent> ParseLine(std::string_view line);

 private:
  bool IsIgnored(std::string_view details,
                 const std::optional<std::string>& command) const;

  const std::map<std::string, std::vector<std::string>> ignore_violations_;
  std::optional<std::string> command_line_;
};

/** `log stream` restricted to messages tagged with `session_suffix`. */
std::vector<std::string> LogStreamCommand(std::string_view session_suffix);

/** Feeds Seatbelt denials of this session into a `ViolationStore`. */
class MacOsLogMonitor {
 public:
  /** Runs `argv`, normally `LogStreamCommand`, and parses its stdout on a
   * background thread. `argv[0]` is searched in `PATH`. */
  static absl::StatusOr<std::unique_ptr<MacOsLogMonitor>> Start(
      ViolationStore& store,
      std::map<std::string, std::vector<std::string>> ignore_violations,
      std::vector<std::string> argv);

  MacOsLogMonitor(const MacOsLogMonitor&) = delete;
  MacOsLogMonitor& operator=(const MacOsLogMonitor&) = delete;
  ~MacOsLogMonitor();

  /** Terminates the log process and joins the reader. Idempotent. */
  absl::Status Stop();

 private:
  MacOsLogMonitor(PidFd process, UniqueFd output, ViolationStore& store,
                  SandboxLogParser parser);

  void ReadOutput();

  std::optional<PidFd> process_;
  UniqueFd output_;
  ViolationStore& store_;
  SandboxLogParser parser_;
  std::thread reader_;
};

}  // namespace sandbox_runtime

#endif
