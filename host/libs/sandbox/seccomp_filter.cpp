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
#include "host/libs/sandbox/seccomp_filter.h"

#include <stdlib.h>
#include <unistd.h>

#include <optional>
#include <string>
#include <vector>

#include <absl/log/log.h>
#include <absl/status/statusor.h>

#include "common/libs/utils/architecture.h"
#include "common/libs/utils/files.h"

namespace sandbox_runtime {

std::optional<std::string> SeccompArchName(Arch arch) {
  switch (arch) {
    case Arch::X86_64:
      return "x64";
    case Arch::Arm64:
      return "arm64";
    case Arch::X86:
      LOG(ERROR) << "32-bit x86 is not supported: `socketcall` is not blocked";
      return std::nullopt;
    default:
      VLOG(1) << "No seccomp filter for architecture " << arch;
      return std::nullopt;
  }
}

std::vector<std::string> SeccompSearchRoots() {
  std::vector<std::string> roots;
  if (const char* env = getenv(kSeccompDirEnvVar); env && *env) {
    roots.emplace_back(env);
  }
  absl::StatusOr<std::string> exe_dir = ExecutableDirectory();
  if (exe_dir.ok()) {
    roots.emplace_back(JoinPath(*exe_dir, "seccomp"));
    roots.emplace_back(
        CleanPath(JoinPath(*exe_dir, "..", "share", "sandbox_runtime", "seccomp")));
  } else {
    LOG(WARNING) << "Cannot locate executable directory: " << exe_dir.status();
  }
  return roots;
}

std::optional<std::string> FindSeccompArtifact(
    Arch arch, const std::string& name,
    const std::vector<std::string>& roots) {
  std::optional<std::string> arch_name = SeccompArchName(arch);
  if (!arch_name) {
    return std::nullopt;
  }
  for (const std::string& root : roots) {
    std::string candidate = JoinPath(root, *arch_name, name);
    if (FileExists(candidate)) {
      VLOG(1) << "Found seccomp artifact '" << candidate << "'";
      return candidate;
    }
  }
  VLOG(1) << "No '" << name << "' for " << *arch_name << " in any search root";
  return std::nullopt;
}

std::optional<std::string> FilterPathForHostArch() {
  return FindSeccompArtifact(HostArch(), kUnixBlockFilterName,
                             SeccompSearchRoots());
}

std::optional<std::string> ApplySeccompPathForHostArch() {
  std::optional<std::string> path = FindSeccompArtifact(
      HostArch(), kApplySeccompName, SeccompSearchRoots());
  if (path && access(path->c_str(), X_OK) != 0) {
    LOG(WARNING) << "'" << *path << "' is not executable";
    return std::nullopt;
  }
  return path;
}

}  // namespace sandbox_runtime
