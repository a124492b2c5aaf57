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
#include "common/libs/utils/unique_fd.h"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <string_view>
#include <utility>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace sandbox_runtime {

UniqueFd::UniqueFd(int fd) : fd_(fd) {}

UniqueFd::UniqueFd(UniqueFd&& other) { std::swap(fd_, other.fd_); }

UniqueFd::~UniqueFd() { Close(); }

UniqueFd& UniqueFd::operator=(UniqueFd&& other) {
  Close();
  std::swap(fd_, other.fd_);
  return *this;
}

absl::StatusOr<std::pair<UniqueFd, UniqueFd>> UniqueFd::Pipe() {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) {
    return absl::ErrnoToStatus(errno, "`pipe2` failed");
  }
  return std::make_pair(UniqueFd(fds[0]), UniqueFd(fds[1]));
}

int UniqueFd::Get() const { return fd_; }

int UniqueFd::Release() {
  int ret = -1;
  std::swap(ret, fd_);
  return ret;
}

void UniqueFd::Reset(int fd) {
  Close();
  fd_ = fd;
}

absl::Status UniqueFd::WriteAll(std::string_view data) const {
  while (!data.empty()) {
    ssize_t written = write(fd_, data.data(), data.size());
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return absl::ErrnoToStatus(errno, absl::StrCat("`write(", fd_, ")`"));
    }
    data.remove_prefix(written);
  }
  return absl::OkStatus();
}

absl::StatusOr<size_t> UniqueFd::Read(char* buf, size_t len) const {
  while (true) {
    ssize_t got = read(fd_, buf, len);
    if (got >= 0) {
      return static_cast<size_t>(got);
    } else if (errno != EINTR) {
      return absl::ErrnoToStatus(errno, absl::StrCat("`read(", fd_, ")`"));
    }
  }
}

absl::Status UniqueFd::ReadExact(char* buf, size_t len) const {
  size_t total = 0;
  while (total < len) {
    absl::StatusOr<size_t> got = Read(buf + total, len - total);
    if (!got.ok()) {
      return got.status();
    } else if (*got == 0) {
      return absl::OutOfRangeError(
          absl::StrCat("EOF after ", total, " of ", len, " bytes"));
    }
    total += *got;
  }
  return absl::OkStatus();
}

void UniqueFd::Close() {
  if (fd_ >= 0 && close(fd_) < 0) {
    PLOG(ERROR) << "Failed to close fd " << fd_;
  }
  fd_ = -1;
}

}  // namespace sandbox_runtime
