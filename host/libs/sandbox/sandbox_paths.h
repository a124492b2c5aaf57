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
#ifndef SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_SANDBOX_PATHS_H
#define SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_SANDBOX_PATHS_H

#include <string>
#include <string_view>
#include <vector>

namespace sandbox_runtime {

inline constexpr char kSandboxTmpDir[] = "/tmp/sandbox-runtime";
inline constexpr char kConfigDirName[] = ".srt";

/** Where relative and `~` patterns are resolved from. */
struct PathContext {
  std::string cwd;
  std::string home;

  /** The current directory and home of this process. */
  static PathContext Current();
};

/** Any of `*`, `?`, `[` or `]`. */
bool ContainsGlobChars(std::string_view pattern);

/** Strips a single trailing `/**`. */
std::string RemoveTrailingGlobSuffix(std::string_view pattern);

/** Text before the first glob character. */
std::string_view GlobStaticPrefix(std::string_view pattern);

/** Directory a glob is rooted at: the static prefix without a trailing
 * separator, or its parent when the prefix ends inside a component. Empty
 * when the glob starts at the root. */
std::string GlobBaseDirectory(std::string_view pattern);

/** Absolute form of `pattern` with symlinks resolved.
 *
 * `~` expands to the home directory and relative paths are taken against the
 * current directory. Globs only have their base directory resolved, the
 * glob suffix is kept as written. Nonexistent trailing components are kept
 * after resolving the longest existing ancestor. */
std::string NormalizePathForSandbox(std::string_view pattern,
                                    const PathContext& context);

/** Converts a gitignore-style glob into an anchored regular expression for
 * Seatbelt `regex` filters. */
std::string GlobToRegex(std::string_view glob);

/** Paths every write policy keeps writable so ordinary tools function. */
std::vector<std::string> DefaultWritePaths(std::string_view home);

/** Every ancestor of `path`, nearest first, excluding `/`. */
std::vector<std::string> AncestorDirectories(std::string_view path);

}  // namespace sandbox_runtime

#endif
