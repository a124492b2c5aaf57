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
#ifndef SANDBOX_RUNTIME_COMMON_LIBS_UTILS_SHELL_QUOTE_H
#define SANDBOX_RUNTIME_COMMON_LIBS_UTILS_SHELL_QUOTE_H

#include <string>
#include <string_view>

#include <absl/types/span.h>

namespace sandbox_runtime {

/** POSIX shell quoting. Words made only of `[A-Za-z0-9@%+=:,./_-]` are left
 * bare, everything else is single quoted with embedded quotes written as
 * `'"'"'`. The empty string becomes `''`. */
std::string ShellQuote(std::string_view word);

/** Quotes every word and joins them with spaces. */
std::string ShellJoin(absl::Span<const std::string> words);

}  // namespace sandbox_runtime

#endif
