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

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "common/libs/utils/shell_quote.h"

namespace sandbox_runtime {

TEST(ShellQuoteTest, SafeWordsStayBare) {
  EXPECT_EQ(ShellQuote("/usr/bin/bwrap"), "/usr/bin/bwrap");
  EXPECT_EQ(ShellQuote("--ro-bind"), "--ro-bind");
  EXPECT_EQ(ShellQuote("KEY=value"), "KEY=value");
}

TEST(ShellQuoteTest, EmptyWord) { EXPECT_EQ(ShellQuote(""), "''"); }

TEST(ShellQuoteTest, SpacesAndMetacharacters) {
  EXPECT_EQ(ShellQuote("echo hi"), "'echo hi'");
  EXPECT_EQ(ShellQuote("a;b"), "'a;b'");
  EXPECT_EQ(ShellQuote("$HOME"), "'$HOME'");
}

TEST(ShellQuoteTest, EmbeddedSingleQuote) {
  EXPECT_EQ(ShellQuote("it's"), "'it'\"'\"'s'");
}

TEST(ShellJoinTest, QuotesEachWord) {
  std::vector<std::string> words = {"sh", "-c", "echo 'x'"};
  EXPECT_EQ(ShellJoin(words), "sh -c 'echo '\"'\"'x'\"'\"''");
}

}  // namespace sandbox_runtime
