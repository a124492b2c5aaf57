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
#ifndef SANDBOX_RUNTIME_COMMON_LIBS_UTILS_ARCHITECTURE_H
#define SANDBOX_RUNTIME_COMMON_LIBS_UTILS_ARCHITECTURE_H

#include <ostream>
#include <string>

namespace sandbox_runtime {

enum class Arch {
  Arm,
  Arm64,
  RiscV64,
  X86,
  X86_64,
  Unknown,
};

enum class Platform {
  kMacOS,
  kLinux,
  kWindows,
  kUnknown,
};

/** Returns e.g. aarch64, x86_64, etc */
const std::string& HostArchStr();
Arch HostArch();

Platform HostPlatform();
/** Only macOS and Linux have a confinement strategy. */
bool IsSupportedPlatform(Platform platform);

std::ostream& operator<<(std::ostream&, Arch);
std::ostream& operator<<(std::ostream&, Platform);

}  // namespace sandbox_runtime

#endif
