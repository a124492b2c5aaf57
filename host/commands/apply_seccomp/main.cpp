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
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>
#include <string.h>
#include <unistd.h>

#include <iostream>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

#include "common/libs/utils/unique_fd.h"

namespace sandbox_runtime {
namespace {

inline constexpr size_t kMaxFilterSize = 4096;

absl::StatusOr<std::vector<sock_filter>> ReadFilter(const std::string& path) {
  UniqueFd fd(open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (fd.Get() < 0) {
    return absl::ErrnoToStatus(errno, absl::StrCat("`open(", path, ")` failed"));
  }
  std::vector<char> bytes(kMaxFilterSize);
  size_t size = 0;
  while (size < bytes.size()) {
    absl::StatusOr<size_t> got = fd.Read(bytes.data() + size, bytes.size() - size);
    if (!got.ok()) {
      return got.status();
    }
    if (*got == 0) {
      break;
    }
    size += *got;
  }
  if (size == 0) {
    return absl::InvalidArgumentError("BPF filter file is empty");
  }
  if (size % sizeof(sock_filter) != 0) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Invalid BPF filter size: ", size, " (must be multiple of 8)"));
  }
  std::vector<sock_filter> filter(size / sizeof(sock_filter));
  memcpy(filter.data(), bytes.data(), size);
  return filter;
}

absl::Status InstallFilter(std::vector<sock_filter>& filter) {
  sock_fprog prog = {
      .len = static_cast<unsigned short>(filter.size()),
      .filter = filter.data(),
  };
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
    return absl::ErrnoToStatus(errno, "`prctl(PR_SET_NO_NEW_PRIVS)` failed");
  }
  if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog) != 0) {
    return absl::ErrnoToStatus(errno, "`prctl(PR_SET_SECCOMP)` failed");
  }
  return absl::OkStatus();
}

/** Only returns on failure, otherwise this process becomes `argv[2]`. */
absl::Status ApplySeccompMain(int argc, char** argv) {
  if (argc < 3) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Usage: ", argv[0], " <filter.bpf> <command> [args...]"));
  }
  absl::StatusOr<std::vector<sock_filter>> filter = ReadFilter(argv[1]);
  if (!filter.ok()) {
    return filter.status();
  }
  if (absl::Status installed = InstallFilter(*filter); !installed.ok()) {
    return installed;
  }
  execvp(argv[2], &argv[2]);
  return absl::ErrnoToStatus(errno, absl::StrCat("`execvp(", argv[2], ")` failed"));
}

}  // namespace
}  // namespace sandbox_runtime

int main(int argc, char** argv) {
  absl::Status status = sandbox_runtime::ApplySeccompMain(argc, argv);
  std::cerr << "apply-seccomp: " << status << '\n';
  return 1;
}
