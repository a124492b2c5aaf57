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
#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <stdint.h>
#include <sys/socket.h>
#include <sys/syscall.h>

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/strings/str_cat.h>
#include <sandboxed_api/sandbox2/util/bpf_helper.h>

#include "common/libs/utils/unique_fd.h"

namespace sandbox_runtime {
namespace {

#if defined(__x86_64__)
inline constexpr uint32_t kAuditArch = AUDIT_ARCH_X86_64;
#elif defined(__aarch64__)
inline constexpr uint32_t kAuditArch = AUDIT_ARCH_AARCH64;
#else
#error "Unix socket blocking is only built for x86_64 and aarch64"
#endif

/** Kills foreign-architecture callers, fails `socket(AF_UNIX, ...)` with
 * EPERM and allows everything else. */
std::vector<sock_filter> UnixBlockFilter() {
  return {
      LOAD_ARCH,
      BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, kAuditArch, 1, 0),
      DENY,
      LOAD_SYSCALL_NR,
#if defined(__x86_64__)
      // x32 syscall numbers alias the x86_64 ones.
      BPF_JUMP(BPF_JMP | BPF_JGE | BPF_K, __X32_SYSCALL_BIT, 0, 1),
      DENY,
#endif
      BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, __NR_socket, 0, 3),
      ARG_32(0),
      JEQ32(AF_UNIX, ERRNO(EPERM)),
      ALLOW,
  };
}

absl::Status SeccompUnixBlockMain(int argc, char** argv) {
  if (argc != 2) {
    return absl::InvalidArgumentError(
        absl::StrCat("Usage: ", argv[0], " <output-file>"));
  }
  UniqueFd fd(open(argv[1], O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644));
  if (fd.Get() < 0) {
    return absl::ErrnoToStatus(errno,
                               absl::StrCat("`open(", argv[1], ")` failed"));
  }
  std::vector<sock_filter> filter = UnixBlockFilter();
  return fd.WriteAll(std::string_view(reinterpret_cast<const char*>(filter.data()),
                                      filter.size() * sizeof(sock_filter)));
}

}  // namespace
}  // namespace sandbox_runtime

int main(int argc, char** argv) {
  absl::Status status = sandbox_runtime::SeccompUnixBlockMain(argc, argv);
  if (!status.ok()) {
    std::cerr << "seccomp-unix-block: " << status << '\n';
    return 1;
  }
  return 0;
}
