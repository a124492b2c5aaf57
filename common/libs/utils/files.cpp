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
#include "common/libs/utils/files.h"

#include <errno.h>
#include <limits.h>
#include <pwd.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <deque>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

namespace sandbox_runtime {

// Adapted from sandboxed_api/util/path.cc

namespace internal {

constexpr char kPathSeparator[] = "/";

std::string JoinPathImpl(std::initializer_list<std::string_view> paths) {
  std::string result;
  for (const auto& path : paths) {
    if (path.empty()) {
      continue;
    }
    if (result.empty()) {
      absl::StrAppend(&result, path);
      continue;
    }
    const auto comp = absl::StripPrefix(path, kPathSeparator);
    if (absl::EndsWith(result, kPathSeparator)) {
      absl::StrAppend(&result, comp);
    } else {
      absl::StrAppend(&result, kPathSeparator, comp);
    }
  }
  return result;
}

}  // namespace internal

// Adapted from sandboxed_api/util/fileops.cc

std::string Dirname(std::string_view path) {
  const auto last_slash = path.find_last_of('/');
  if (last_slash == std::string::npos) {
    return "";
  }
  if (last_slash == 0) {
    return "/";
  }
  return std::string(path.substr(0, last_slash));
}

std::string Basename(std::string_view path) {
  const auto last_slash = path.find_last_of('/');
  if (last_slash == std::string::npos) {
    return std::string(path);
  }
  return std::string(path.substr(last_slash + 1));
}

bool CreateDirectoryRecursively(const std::string& path, int mode) {
  if (mkdir(path.c_str(), mode) == 0 || errno == EEXIST) {
    return true;
  }

  // We couldn't create the dir for reasons we can't handle.
  if (errno != ENOENT) {
    return false;
  }

  // The ENOENT case, the parent directory doesn't exist yet.
  const std::string dir = Dirname(path);
  if (dir == "/" || dir.empty()) {
    return false;
  }
  if (!CreateDirectoryRecursively(dir, mode)) {
    return false;
  }

  return mkdir(path.c_str(), mode) == 0 || errno == EEXIST;
}

std::string CleanPath(const std::string_view unclean_path) {
  int dotdot_num = 0;
  std::deque<std::string_view> parts;
  for (std::string_view part :
       absl::StrSplit(unclean_path, '/', absl::SkipEmpty())) {
    if (part == "..") {
      if (parts.empty()) {
        ++dotdot_num;
      } else {
        parts.pop_back();
      }
    } else if (part != ".") {
      parts.push_back(part);
    }
  }
  if (absl::StartsWith(unclean_path, "/")) {
    if (parts.empty()) {
      return "/";
    }
    parts.push_front("");
  } else {
    for (; dotdot_num; --dotdot_num) {
      parts.push_front("..");
    }
    if (parts.empty()) {
      return ".";
    }
  }
  return absl::StrJoin(parts, "/");
}

bool FileExists(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0;
}

bool DirectoryExists(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

absl::StatusOr<std::string> RealPath(const std::string& path) {
  char resolved[PATH_MAX];
  if (realpath(path.c_str(), resolved) == nullptr) {
    return absl::ErrnoToStatus(errno, absl::StrCat("`realpath(", path, ")`"));
  }
  return std::string(resolved);
}

absl::StatusOr<std::string> CurrentDirectory() {
  char buf[PATH_MAX];
  if (getcwd(buf, sizeof(buf)) == nullptr) {
    return absl::ErrnoToStatus(errno, "`getcwd` failed");
  }
  return std::string(buf);
}

std::string HomeDirectory() {
  const char* home = getenv("HOME");
  if (home != nullptr && *home != '\0') {
    return home;
  }
  passwd* pw = getpwuid(getuid());
  return pw == nullptr || pw->pw_dir == nullptr ? "/" : pw->pw_dir;
}

absl::StatusOr<std::string> ExecutableDirectory() {
  absl::StatusOr<std::string> self = RealPath("/proc/self/exe");
  if (!self.ok()) {
    return self.status();
  }
  return Dirname(*self);
}

absl::StatusOr<std::string> ReadFileContents(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return absl::ErrnoToStatus(errno, absl::StrCat("Failed to open '", path, "'"));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return absl::InternalError(absl::StrCat("Failed to read '", path, "'"));
  }
  return buffer.str();
}

}  // namespace sandbox_runtime
