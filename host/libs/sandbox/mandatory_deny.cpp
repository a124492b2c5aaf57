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
#include "host/libs/sandbox/mandatory_deny.h"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>
#include <absl/time/time.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/subprocess.h"
#include "host/libs/sandbox/policy.h"
#include "host/libs/sandbox/sandbox_paths.h"

namespace sandbox_runtime {
namespace {

constexpr std::string_view kDangerousFiles[] = {
    ".gitconfig", ".gitmodules", ".bashrc",    ".bash_profile", ".zshrc",
    ".zprofile",  ".profile",    ".ripgreprc", ".mcp.json",
};

/** `.git` itself stays writable, only its hooks and config are denied. */
std::vector<std::string> DangerousDirectories() {
  return {
      ".vscode",
      ".idea",
      absl::StrCat(kConfigDirName, "/commands"),
      absl::StrCat(kConfigDirName, "/agents"),
  };
}

std::string Absolute(const std::string& cwd, std::string_view match) {
  if (absl::StartsWith(match, "/")) {
    return CleanPath(match);
  }
  return CleanPath(JoinPath(cwd, match));
}

/** Cuts `path` after the first run of components equal to `dir`, ignoring
 * case. */
std::optional<std::string> PrefixThrough(std::string_view path,
                                         std::string_view dir) {
  std::vector<std::string_view> segments =
      absl::StrSplit(path, '/', absl::SkipEmpty());
  std::vector<std::string_view> wanted =
      absl::StrSplit(dir, '/', absl::SkipEmpty());
  if (wanted.empty() || segments.size() < wanted.size()) {
    return std::nullopt;
  }
  for (size_t i = 0; i + wanted.size() <= segments.size(); i++) {
    bool match = true;
    for (size_t j = 0; j < wanted.size() && match; j++) {
      match = absl::EqualsIgnoreCase(segments[i + j], wanted[j]);
    }
    if (match) {
      std::vector<std::string_view> kept(segments.begin(),
                                         segments.begin() + i + wanted.size());
      return absl::StrCat("/", absl::StrJoin(kept, "/"));
    }
  }
  return std::nullopt;
}

absl::StatusOr<std::vector<std::string>> FindFiles(
    const RipgrepConfig& ripgrep, const std::string& cwd,
    const std::string& glob) {
  return RipGrep(ripgrep,
                 {"--files", "--hidden", "--iglob", glob, "-g",
                  "!**/node_modules/**"},
                 cwd);
}

}  // namespace

absl::StatusOr<std::vector<std::string>> RipGrep(
    const RipgrepConfig& config, const std::vector<std::string>& args,
    const std::string& target, absl::Duration timeout) {
  std::vector<std::string> argv = {config.command};
  argv.insert(argv.end(), config.args.begin(), config.args.end());
  argv.insert(argv.end(), args.begin(), args.end());
  argv.emplace_back(target);

  VLOG(1) << "Scanning: " << absl::StrJoin(argv, " ");
  absl::StatusOr<CapturedOutput> res = RunWithCapturedOutput(argv, timeout);
  if (!res.ok()) {
    if (absl::IsNotFound(res.status())) {
      return absl::FailedPreconditionError(
          absl::StrCat("ripgrep command not found: ", config.command));
    }
    return res.status();
  }
  if (res->exit_code == 1) {
    return std::vector<std::string>();
  } else if (res->exit_code != 0) {
    std::string_view err = absl::StripAsciiWhitespace(res->stderr_str);
    return absl::InternalError(
        absl::StrCat("ripgrep failed with exit code ", res->exit_code, ": ",
                     err.empty() ? "Unknown error" : err));
  }
  std::vector<std::string> lines;
  for (std::string_view line : absl::StrSplit(res->stdout_str, '\n')) {
    line = absl::StripTrailingAsciiWhitespace(line);
    if (!line.empty()) {
      lines.emplace_back(line);
    }
  }
  return lines;
}

absl::StatusOr<std::vector<std::string>> MandatoryDenyWithinAllow(
    const RipgrepConfig& ripgrep, const PathContext& context) {
  const std::string& cwd = context.cwd;
  std::set<std::string> deny;

  deny.insert(JoinPath(context.home, kConfigDirName, "settings.json"));
  deny.insert(JoinPath(cwd, kConfigDirName, "settings.json"));
  deny.insert(JoinPath(cwd, kConfigDirName, "settings.local.json"));

  for (std::string_view file : kDangerousFiles) {
    deny.insert(JoinPath(cwd, file));
    auto matches = FindFiles(ripgrep, cwd, std::string(file));
    if (!matches.ok()) {
      return absl::Status(matches.status().code(),
                          absl::StrCat("Failed to scan for dangerous file '",
                                       file, "': ", matches.status().message()));
    }
    for (const std::string& match : *matches) {
      deny.insert(Absolute(cwd, match));
    }
  }

  for (const std::string& dir : DangerousDirectories()) {
    deny.insert(JoinPath(cwd, dir));
    auto matches = FindFiles(ripgrep, cwd, absl::StrCat("**/", dir, "/**"));
    if (!matches.ok()) {
      return absl::Status(
          matches.status().code(),
          absl::StrCat("Failed to scan for dangerous directory '", dir,
                       "': ", matches.status().message()));
    }
    for (const std::string& match : *matches) {
      if (auto dir_path = PrefixThrough(Absolute(cwd, match), dir)) {
        deny.insert(*dir_path);
      }
    }
  }

  deny.insert(JoinPath(cwd, ".git", "hooks"));
  deny.insert(JoinPath(cwd, ".git", "config"));
  auto heads = FindFiles(ripgrep, cwd, "**/.git/HEAD");
  if (!heads.ok()) {
    return absl::Status(heads.status().code(),
                        absl::StrCat("Failed to scan for .git directories: ",
                                     heads.status().message()));
  }
  for (const std::string& head : *heads) {
    std::string git_dir = Dirname(Absolute(cwd, head));
    deny.insert(JoinPath(git_dir, "hooks"));
    deny.insert(JoinPath(git_dir, "config"));
  }

  VLOG(1) << "Mandatory deny paths: " << deny.size();
  return std::vector<std::string>(deny.begin(), deny.end());
}

}  // namespace sandbox_runtime
