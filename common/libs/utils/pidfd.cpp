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
#include "common/libs/utils/pidfd.h"

#include <dirent.h>
#include <fcntl.h>
#include <linux/sched.h>
#include <poll.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <absl/log/check.h>
#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <absl/types/span.h>

#include "common/libs/utils/unique_fd.h"

#ifndef P_PIDFD
#define P_PIDFD 3
#endif

namespace sandbox_runtime {

absl::StatusOr<PidFd> PidFd::FromRunningProcess(pid_t pid) {
  UniqueFd fd(syscall(SYS_pidfd_open, pid, 0));  // Always CLOEXEC
  if (fd.Get() < 0) {
    return absl::ErrnoToStatus(errno, "`pidfd_open` failed");
  }
  return PidFd(std::move(fd), pid);
}

absl::StatusOr<PidFd> PidFd::LaunchSubprocess(
    absl::Span<const std::string> argv,
    std::vector<std::pair<UniqueFd, int>> fds,
    absl::Span<const std::string> env) {
  if (argv.empty()) {
    return absl::InvalidArgumentError("Empty argv");
  }
  int pidfd;
  clone_args args_for_clone = clone_args{
      .flags = CLONE_PIDFD,
      .pidfd = reinterpret_cast<std::uintptr_t>(&pidfd),
      .exit_signal = SIGCHLD,
  };

  pid_t res = syscall(SYS_clone3, &args_for_clone, sizeof(args_for_clone));
  if (res < 0) {
    std::string argv_str = absl::StrJoin(argv, "','");
    std::string error = absl::StrCat("clone3 failed: argv=['", argv_str, "']");
    return absl::ErrnoToStatus(errno, error);
  } else if (res > 0) {
    std::string argv_str = absl::StrJoin(argv, "','");
    VLOG(1) << res << ": Running ['" << argv_str << "']";

    UniqueFd fd(pidfd);
    return PidFd(std::move(fd), res);
  }

  /* Duplicate every input in `fds` into a range higher than the highest output
   * in `fds`, in case there is any overlap between inputs and outputs. */
  int minimum_backup_fd = -1;
  for (const auto& [my_fd, target_fd] : fds) {
    minimum_backup_fd = std::max(minimum_backup_fd, target_fd + 1);
  }

  std::unordered_map<int, int> backup_mapping;
  for (const auto& [my_fd, target_fd] : fds) {
    int backup = fcntl(my_fd.Get(), F_DUPFD_CLOEXEC, minimum_backup_fd);
    PCHECK(backup >= 0) << "fcntl(..., F_DUPFD_CLOEXEC) failed";
    backup_mapping[backup] = target_fd;
  }

  for (const auto& [backup_fd, target_fd] : backup_mapping) {
    // dup2 always unsets FD_CLOEXEC
    PCHECK(dup2(backup_fd, target_fd) >= 0) << "dup2 failed";
  }

  // The blocked signal mask survives execve.
  sigset_t empty_mask;
  sigemptyset(&empty_mask);
  PCHECK(sigprocmask(SIG_SETMASK, &empty_mask, nullptr) >= 0)
      << "sigprocmask failed";

  std::vector<std::string> argv_clone(argv.begin(), argv.end());
  std::vector<char*> argv_cstr;
  for (auto& arg : argv_clone) {
    argv_cstr.emplace_back(arg.data());
  }
  argv_cstr.emplace_back(nullptr);

  std::vector<std::string> env_clone(env.begin(), env.end());
  std::vector<char*> env_cstr;
  for (std::string& env_member : env_clone) {
    env_cstr.emplace_back(env_member.data());
  }
  env_cstr.emplace_back(nullptr);

  if (prctl(PR_SET_PDEATHSIG, SIGHUP) < 0) {  // Die when parent dies
    PLOG(FATAL) << "prctl failed";
  }

  execve(argv_cstr[0], argv_cstr.data(), env_cstr.data());

  PLOG(FATAL) << "execve(" << argv_cstr[0] << ") failed";
}

PidFd::PidFd(UniqueFd fd, pid_t pid) : fd_(std::move(fd)), pid_(pid) {}

int PidFd::Get() const { return fd_.Get(); }

pid_t PidFd::Pid() const { return pid_; }

absl::Status PidFd::HaltHierarchy() {
  if (absl::Status stop = SendSignal(SIGSTOP); !stop.ok()) {
    return stop;
  }
  if (absl::Status halt_children = HaltChildHierarchy(); !halt_children.ok()) {
    return halt_children;
  }
  return SendSignal(SIGKILL);
}

/* Assumes the process referred to by `pid` does not spawn any more children or
 * reap any children while this function is running. */
static absl::StatusOr<std::vector<pid_t>> FindChildPids(pid_t pid) {
  std::vector<pid_t> child_pids;

  std::string task_dir = absl::StrFormat("/proc/%d/task", pid);
  std::unique_ptr<DIR, int (*)(DIR*)> dir(opendir(task_dir.c_str()), closedir);
  if (dir.get() == nullptr) {
    return absl::ErrnoToStatus(errno, "`opendir` failed");
  }

  while (dirent* ent = readdir(dir.get())) {
    // `d_name` is guaranteed to be null terminated
    std::string_view name = ent->d_name;
    if (name == "." || name == "..") {
      continue;
    }
    std::string children_file =
        absl::StrFormat("/proc/%d/task/%s/children", pid, name);
    std::ifstream children_stream(children_file);
    if (!children_stream) {
      std::string err = absl::StrCat("can't read child file: ", children_file);
      return absl::InternalError(err);
    }

    std::string children_str;
    std::getline(children_stream, children_str);
    for (std::string_view child_str : absl::StrSplit(children_str, " ")) {
      if (child_str.empty()) {
        continue;
      }
      pid_t child_pid;
      if (!absl::SimpleAtoi(child_str, &child_pid)) {
        std::string error = absl::StrFormat("'%s' is not a pid_t", child_str);
        return absl::InternalError(error);
      }
      child_pids.emplace_back(child_pid);
    }
  }

  return child_pids;
}

absl::Status PidFd::HaltChildHierarchy() {
  absl::StatusOr<std::vector<pid_t>> children = FindChildPids(pid_);
  if (!children.ok()) {
    return children.status();
  }
  for (pid_t child : *children) {
    absl::StatusOr<PidFd> child_pidfd = FromRunningProcess(child);
    if (!child_pidfd.ok()) {
      return child_pidfd.status();
    }
    // HaltHierarchy will SIGSTOP the child so it cannot spawn more children
    // or reap its own children while everything is being stopped.
    if (absl::Status halt = child_pidfd->HaltHierarchy(); !halt.ok()) {
      return halt;
    }
  }

  return absl::OkStatus();
}

absl::Status PidFd::SendSignal(int signal) {
  if (syscall(SYS_pidfd_send_signal, fd_.Get(), signal, nullptr, 0) < 0) {
    return absl::ErrnoToStatus(errno, "pidfd_send_signal failed");
  }
  return absl::OkStatus();
}

absl::StatusOr<bool> PidFd::WaitForExit(absl::Duration timeout) {
  absl::Time deadline = absl::Now() + timeout;
  while (true) {
    // A pidfd polls readable once the process has exited.
    pollfd pfd{.fd = fd_.Get(), .events = POLLIN};
    absl::Duration remaining =
        std::max(deadline - absl::Now(), absl::ZeroDuration());
    int timeout_ms = remaining == absl::InfiniteDuration()
                         ? -1
                         : static_cast<int>(absl::ToInt64Milliseconds(
                               std::min(remaining, absl::Hours(24))));
    int poll_ret = poll(&pfd, 1, timeout_ms);
    if (poll_ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      return absl::ErrnoToStatus(errno, "`poll(pidfd)` failed");
    }
    if (poll_ret > 0) {
      return true;
    }
    if (absl::Now() >= deadline) {
      return false;
    }
  }
}

absl::StatusOr<int> PidFd::ExitCode() {
  siginfo_t info{};
  while (waitid(static_cast<idtype_t>(P_PIDFD), fd_.Get(), &info, WEXITED) < 0) {
    if (errno != EINTR) {
      return absl::ErrnoToStatus(errno, "`waitid` failed");
    }
  }
  if (info.si_code == CLD_EXITED) {
    VLOG(1) << pid_ << ": exited with " << info.si_status;
    return info.si_status;
  }
  VLOG(1) << pid_ << ": killed by signal " << info.si_status;
  return 128 + info.si_status;
}

absl::Status PidFd::Terminate(absl::Duration grace) {
  if (absl::Status term = SendSignal(SIGTERM); !term.ok()) {
    // ESRCH: already gone, only needs reaping
    if (!absl::IsNotFound(term)) {
      return term;
    }
  }
  absl::StatusOr<bool> exited = WaitForExit(grace);
  if (!exited.ok()) {
    return exited.status();
  }
  if (!*exited) {
    LOG(WARNING) << pid_ << ": still running after SIGTERM, sending SIGKILL";
    if (absl::Status kill = SendSignal(SIGKILL); !kill.ok()) {
      return kill;
    }
  }
  absl::StatusOr<int> code = ExitCode();
  return code.ok() ? absl::OkStatus() : code.status();
}

}  // namespace sandbox_runtime
