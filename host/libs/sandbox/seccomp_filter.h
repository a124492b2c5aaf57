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
#ifndef SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_SECCOMP_FILTER_H
#define SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_SECCOMP_FILTER_H

#include <optional>
#include <string>
#include <vector>

#include "common/libs/utils/architecture.h"

namespace sandbox_runtime {

inline constexpr char kSeccompDirEnvVar[] = "SANDBOX_RUNTIME_SECCOMP_DIR";
inline constexpr char kUnixBlockFilterName[] = "unix-block.bpf";
inline constexpr char kApplySeccompName[] = "apply-seccomp";

/** `x64` or `arm64`, the only architectures with a filter. 32-bit x86 is
 * excluded since `socketcall(2)` would bypass the `socket(2)` check. */
std::optional<std::string> SeccompArchName(Arch arch);

/** `$SANDBOX_RUNTIME_SECCOMP_DIR`, then `seccomp/` beside the executable,
 * then `../share/sandbox_runtime/seccomp` relative to it. */
std::vector<std::string> SeccompSearchRoots();

/** Pre-built BPF program blocking `socket(AF_UNIX, ...)`, or `nullopt` when
 * the architecture is unsupported or no artifact is installed. Lookup only,
 * nothing is generated at runtime. */
std::optional<std::string> FilterPathForHostArch();
std::optional<std::string> ApplySeccompPathForHostArch();

std::optional<std::string> FindSeccompArtifact(
    Arch arch, const std::string& name,
    const std::vector<std::string>& roots);

}  // namespace sandbox_runtime

#endif
