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

#include <gtest/gtest.h>

#include "common/libs/utils/files.h"

namespace sandbox_runtime {

TEST(CleanPathTest, CollapsesDotsAndSeparators) {
  EXPECT_EQ(CleanPath("/a//b/./c/../d/"), "/a/b/d");
  EXPECT_EQ(CleanPath("a/../../b"), "../b");
  EXPECT_EQ(CleanPath("/../.."), "/");
  EXPECT_EQ(CleanPath("./"), ".");
}

TEST(JoinPathTest, SingleSeparatorBetweenParts) {
  EXPECT_EQ(JoinPath("/a", "b"), "/a/b");
  EXPECT_EQ(JoinPath("/a/", "/b"), "/a/b");
  EXPECT_EQ(JoinPath("", "b", "c"), "b/c");
}

TEST(DirnameTest, Basics) {
  EXPECT_EQ(Dirname("/a/b"), "/a");
  EXPECT_EQ(Dirname("/a"), "/");
  EXPECT_EQ(Dirname("a"), "");
  EXPECT_EQ(Basename("/a/b"), "b");
}

TEST(CreateDirectoryRecursivelyTest, CreatesParents) {
  std::string tmp = ::testing::TempDir();
  std::string nested = JoinPath(tmp, "files_test", "x", "y", "z");
  ASSERT_TRUE(CreateDirectoryRecursively(nested, 0755));
  EXPECT_TRUE(DirectoryExists(nested));
  // Already present is fine
  EXPECT_TRUE(CreateDirectoryRecursively(nested, 0755));
}

TEST(RealPathTest, MissingPathIsNotFound) {
  auto res = RealPath("/definitely/not/a/real/path");
  EXPECT_FALSE(res.ok());
}

TEST(ExecutableDirectoryTest, ContainsThisTest) {
  auto dir = ExecutableDirectory();
  ASSERT_TRUE(dir.ok()) << dir.status();
  EXPECT_TRUE(DirectoryExists(*dir));
}

}  // namespace sandbox_runtime
