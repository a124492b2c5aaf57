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
#include "host/commands/sandbox_runtime/logs.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <absl/log/log_entry.h>
#include <absl/log/log_sink.h>
#include <absl/log/log_sink_registry.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

#include "common/libs/utils/unique_fd.h"

namespace sandbox_runtime {
namespace {

// Implementation based on absl::log_internal::StderrLogSink
class FileLogSink final : absl::LogSink {
 public:
  static absl::StatusOr<std::unique_ptr<FileLogSink>> FromPath(
      const std::string& path) {
    UniqueFd fd(open(path.c_str(), O_APPEND | O_CREAT | O_WRONLY | O_CLOEXEC,
                     0644));
    if (fd.Get() < 0) {
      return absl::ErrnoToStatus(errno,
                                 absl::StrCat("`open(", path, ")` failed"));
    }
    std::unique_ptr<FileLogSink> sink(new FileLogSink(std::move(fd)));
    absl::AddLogSink(sink.get());
    return sink;
  }
  FileLogSink(FileLogSink&) = delete;
  ~FileLogSink() { absl::RemoveLogSink(this); }

  void Send(const absl::LogEntry& entry) override {
    std::string message;
    if (!entry.stacktrace().empty()) {
      absl::StrAppend(&message, entry.stacktrace());
    }
    absl::StrAppend(&message, entry.text_message_with_prefix_and_newline());
    if (!fd_.WriteAll(message).ok()) {
      // LOG calls inside here would recurse infinitely because of AddLogSink
      std::cerr << "FileLogSink: write(" << fd_.Get()
                << ") failed: " << strerror(errno) << '\n';
    }
  }

 private:
  explicit FileLogSink(UniqueFd fd) : fd_(std::move(fd)) {}

  UniqueFd fd_;
};

}  // namespace

absl::Status LogToFiles(const std::vector<std::string>& paths) {
  for (const auto& path : paths) {
    auto sink_status = FileLogSink::FromPath(path);
    if (!sink_status.ok()) {
      return sink_status.status();
    }
    sink_status->release();  // Deliberate leak so LOG always writes here
  }
  return absl::OkStatus();
}

}  // namespace sandbox_runtime
