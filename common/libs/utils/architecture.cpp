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
#include "common/libs/utils/architecture.h"

#include <sys/utsname.h>

#include <ostream>
#include <string>

#include <absl/log/log.h>

namespace sandbox_runtime {
namespace {

std::string UnameField(char utsname::*field) {
  utsname buf;
  if (uname(&buf) < 0) {
    PLOG(ERROR) << "`uname` failed";
    return "";
  }
  return std::string(buf.*field);
}

}  // namespace

const std::string& HostArchStr() {
  static const std::string* arch = new std::string(UnameField(&utsname::machine));
  return *arch;
}

Arch HostArch() {
  const std::string& arch_str = HostArchStr();
  if (arch_str == "aarch64" || arch_str == "arm64") {
    return Arch::Arm64;
  } else if (arch_str == "arm") {
    return Arch::Arm;
  } else if (arch_str == "riscv64") {
    return Arch::RiscV64;
  } else if (arch_str == "x86_64" || arch_str == "amd64") {
    return Arch::X86_64;
  } else if (arch_str.size() == 4 && arch_str[0] == 'i' && arch_str[2] == '8' &&
             arch_str[3] == '6') {
    return Arch::X86;
  }
  LOG(WARNING) << "Unknown host architecture: " << arch_str;
  return Arch::Unknown;
}

Platform HostPlatform() {
  static const std::string* sysname =
      new std::string(UnameField(&utsname::sysname));
  if (*sysname == "Darwin") {
    return Platform::kMacOS;
  } else if (*sysname == "Linux") {
    return Platform::kLinux;
  } else if (sysname->rfind("MINGW", 0) == 0 ||
             sysname->rfind("CYGWIN", 0) == 0 || *sysname == "Windows_NT") {
    return Platform::kWindows;
  }
  return Platform::kUnknown;
}

bool IsSupportedPlatform(Platform platform) {
  return platform == Platform::kMacOS || platform == Platform::kLinux;
}

std::ostream& operator<<(std::ostream& out, Arch arch) {
  switch (arch) {
    case Arch::Arm:
      return out << "arm";
    case Arch::Arm64:
      return out << "arm64";
    case Arch::RiscV64:
      return out << "riscv64";
    case Arch::X86:
      return out << "x86";
    case Arch::X86_64:
      return out << "x86_64";
    case Arch::Unknown:
      break;
  }
  return out << "unknown";
}

std::ostream& operator<<(std::ostream& out, Platform platform) {
  switch (platform) {
    case Platform::kMacOS:
      return out << "macos";
    case Platform::kLinux:
      return out << "linux";
    case Platform::kWindows:
      return out << "windows";
    case Platform::kUnknown:
      break;
  }
  return out << "unknown";
}

}  // namespace sandbox_runtime
