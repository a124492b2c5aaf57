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
#ifndef SANDBOX_RUNTIME_COMMON_LIBS_UTILS_FILES_H
#define SANDBOX_RUNTIME_COMMON_LIBS_UTILS_FILES_H

#include <initializer_list>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace sandbox_runtime {
namespace internal {

std::string JoinPathImpl(std::initializer_list<std::string_view> paths);

}  // namespace internal

template <typename... T>
std::string JoinPath(const T&... args) {
  return internal::JoinPathImpl({args...});
}

/** Lexically removes `.`, `..` and repeated separators. */
std::string CleanPath(std::string_view unclean_path);

/** Everything before the last separator: "/" for "/a", "" for "a". */
std::string Dirname(std::string_view path);
std::string Basename(std::string_view path);

bool CreateDirectoryRecursively(const std::string& path, int mode);

/** Follows symlinks. */
bool FileExists(const std::string& path);
bool DirectoryExists(const std::string& path);

absl::StatusOr<std::string> RealPath(const std::string& path);
absl::StatusOr<std::string> CurrentDirectory();
/** `$HOME`, falling back to the passwd entry of the current user. */
std::string HomeDirectory();
/** Directory holding the running executable, from /proc/self/exe. */
absl::StatusOr<std::string> ExecutableDirectory();

absl::StatusOr<std::string> ReadFileContents(const std::string& path);

}  // namespace sandbox_runtime

#endif
