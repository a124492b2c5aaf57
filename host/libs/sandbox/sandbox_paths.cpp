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
#include "host/libs/sandbox/sandbox_paths.h"

#include <string>
#include <string_view>
#include <vector>

#include <absl/log/log.h>
#include <absl/status/statusor.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_replace.h>
#include <absl/strings/strip.h>

#include "common/libs/utils/files.h"

namespace sandbox_runtime {
namespace {

constexpr std::string_view kGlobChars = "*?[]";

/** realpath(3) of the longest existing ancestor, with the rest appended. */
std::string ResolveExistingPrefix(const std::string& absolute) {
  std::string existing = absolute;
  std::string remainder;
  while (!existing.empty() && existing != "/") {
    if (absl::StatusOr<std::string> real = RealPath(existing); real.ok()) {
      return remainder.empty() ? *real : JoinPath(*real, remainder);
    }
    std::string base = Basename(existing);
    remainder = remainder.empty() ? base : JoinPath(base, remainder);
    existing = Dirname(existing);
  }
  return absolute;
}

}  // namespace

PathContext PathContext::Current() {
  absl::StatusOr<std::string> cwd = CurrentDirectory();
  if (!cwd.ok()) {
    LOG(WARNING) << "Falling back to '/' as current directory: " << cwd.status();
  }
  return PathContext{
      .cwd = cwd.ok() ? *cwd : "/",
      .home = HomeDirectory(),
  };
}

bool ContainsGlobChars(std::string_view pattern) {
  return pattern.find_first_of(kGlobChars) != std::string_view::npos;
}

std::string RemoveTrailingGlobSuffix(std::string_view pattern) {
  absl::ConsumeSuffix(&pattern, "/**");
  return std::string(pattern);
}

std::string_view GlobStaticPrefix(std::string_view pattern) {
  return pattern.substr(0, pattern.find_first_of(kGlobChars));
}

std::string GlobBaseDirectory(std::string_view pattern) {
  std::string_view prefix = GlobStaticPrefix(pattern);
  if (prefix.empty() || prefix == "/") {
    return "";
  }
  if (absl::ConsumeSuffix(&prefix, "/")) {
    return std::string(prefix);
  }
  return Dirname(prefix);
}

std::string NormalizePathForSandbox(std::string_view pattern,
                                    const PathContext& context) {
  std::string absolute;
  if (pattern == "~") {
    absolute = context.home;
  } else if (absl::StartsWith(pattern, "~/")) {
    absolute = JoinPath(context.home, pattern.substr(2));
  } else if (absl::StartsWith(pattern, "/")) {
    absolute = std::string(pattern);
  } else {
    absolute = JoinPath(context.cwd, pattern);
  }

  if (ContainsGlobChars(absolute)) {
    std::string base_dir = GlobBaseDirectory(absolute);
    if (base_dir.empty()) {
      return absolute;
    }
    std::string suffix = absolute.substr(base_dir.size());
    return absl::StrCat(ResolveExistingPrefix(CleanPath(base_dir)), suffix);
  }
  return ResolveExistingPrefix(CleanPath(absolute));
}

std::string GlobToRegex(std::string_view glob) {
  std::string escaped;
  for (char c : glob) {
    switch (c) {
      case '.':
      case '^':
      case '$':
      case '+':
      case '{':
      case '}':
      case '(':
      case ')':
      case '|':
      case '\\':
        escaped.push_back('\\');
        break;
      default:
        break;
    }
    escaped.push_back(c);
  }
  // A '[' with no later ']' is a literal bracket.
  size_t last_close = escaped.rfind(']');
  size_t open =
      escaped.find('[', last_close == std::string::npos ? 0 : last_close + 1);
  if (open != std::string::npos) {
    escaped.insert(open, "\\");
  }

  std::string regex = "^";
  for (size_t i = 0; i < escaped.size(); i++) {
    char c = escaped[i];
    if (c == '\\' && i + 1 < escaped.size()) {
      regex.push_back(c);
      regex.push_back(escaped[++i]);
    } else if (c == '*' && i + 1 < escaped.size() && escaped[i + 1] == '*') {
      if (i + 2 < escaped.size() && escaped[i + 2] == '/') {
        regex.append("(.*/)?");
        i += 2;
      } else {
        regex.append(".*");
        i += 1;
      }
    } else if (c == '*') {
      regex.append("[^/]*");
    } else if (c == '?') {
      regex.append("[^/]");
    } else {
      regex.push_back(c);
    }
  }
  regex.push_back('$');
  return regex;
}

std::vector<std::string> DefaultWritePaths(std::string_view home) {
  return {
      "/dev/stdout",
      "/dev/stderr",
      "/dev/null",
      "/dev/tty",
      "/dev/dtracehelper",
      "/dev/autofs_nowait",
      kSandboxTmpDir,
      absl::StrCat("/private", kSandboxTmpDir),
      JoinPath(home, ".npm", "_logs"),
      JoinPath(home, kConfigDirName, "debug"),
  };
}

std::vector<std::string> AncestorDirectories(std::string_view path) {
  std::vector<std::string> ancestors;
  std::string current = Dirname(path);
  while (!current.empty() && current != "/" && current != ".") {
    ancestors.emplace_back(current);
    current = Dirname(current);
  }
  return ancestors;
}

}  // namespace sandbox_runtime
