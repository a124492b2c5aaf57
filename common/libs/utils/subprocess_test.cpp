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

#include <absl/status/status.h>
#include <absl/time/time.h>
#include <gtest/gtest.h>

#include "common/libs/utils/architecture.h"
#include "common/libs/utils/subprocess.h"

namespace sandbox_runtime {

TEST(FindExecutableTest, FindsShell) {
  auto sh = FindExecutable("sh");
  ASSERT_TRUE(sh.ok()) << sh.status();
  EXPECT_EQ((*sh)[0], '/');
}

TEST(FindExecutableTest, MissingIsNotFound) {
  auto res = FindExecutable("no-such-binary-for-sandbox-runtime");
  EXPECT_EQ(res.status().code(), absl::StatusCode::kNotFound);
}

TEST(RunWithCapturedOutputTest, CollectsBothStreams) {
  auto res = RunWithCapturedOutput({"sh", "-c", "echo out; echo err >&2"});
  ASSERT_TRUE(res.ok()) << res.status();
  EXPECT_EQ(res->exit_code, 0);
  EXPECT_EQ(res->stdout_str, "out\n");
  EXPECT_EQ(res->stderr_str, "err\n");
}

TEST(RunWithCapturedOutputTest, ReportsExitCode) {
  auto res = RunWithCapturedOutput({"sh", "-c", "exit 3"});
  ASSERT_TRUE(res.ok()) << res.status();
  EXPECT_EQ(res->exit_code, 3);
}

TEST(RunWithCapturedOutputTest, SignalDeathIsShellStyle) {
  auto res = RunWithCapturedOutput({"sh", "-c", "kill -9 $$"});
  ASSERT_TRUE(res.ok()) << res.status();
  EXPECT_EQ(res->exit_code, 128 + 9);
}

TEST(RunWithCapturedOutputTest, TimeoutKillsTree) {
  auto res = RunWithCapturedOutput({"sh", "-c", "sleep 30 | cat"},
                                   absl::Milliseconds(200));
  EXPECT_EQ(res.status().code(), absl::StatusCode::kDeadlineExceeded);
}

TEST(PlatformTest, HostIsLinux) {
  EXPECT_EQ(HostPlatform(), Platform::kLinux);
  EXPECT_TRUE(IsSupportedPlatform(HostPlatform()));
  EXPECT_FALSE(IsSupportedPlatform(Platform::kWindows));
}

}  // namespace sandbox_runtime
