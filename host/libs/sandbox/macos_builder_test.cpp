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
#include "host/libs/sandbox/macos_builder.h"

#include <stdlib.h>

#include <optional>
#include <string>
#include <vector>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"
#include "host/libs/sandbox/command_builder.h"
#include "host/libs/sandbox/sandbox_paths.h"

namespace sandbox_runtime {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;
using ::testing::StartsWith;

constexpr char kTag[] = "CMD64_bHM=_END_000000000000000000_SBX";

class MacOsBuilderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::string templ = JoinPath(testing::TempDir(), "macos_builder_XXXXXX");
    ASSERT_NE(mkdtemp(templ.data()), nullptr);
    dir_ = RealPath(templ).value_or(templ);
  }

  WrapRequest Request(const std::string& command) {
    return WrapRequest{
        .command = command,
        .shell = "sh",
        .paths = PathContext{.cwd = dir_, .home = dir_},
    };
  }

  std::string dir_;
};

}  // namespace

TEST(SessionSuffixTest, StableAndWellFormed) {
  const std::string& suffix = SessionSuffix();
  EXPECT_EQ(suffix.size(), 1 + 18 + 4);
  EXPECT_THAT(suffix, StartsWith("_"));
  EXPECT_TRUE(absl::EndsWith(suffix, "_SBX"));
  EXPECT_EQ(&suffix, &SessionSuffix());
}

TEST(SeatbeltLogTagTest, EncodesCommand) {
  EXPECT_EQ(SeatbeltLogTag("ls", "_abc_SBX"), "CMD64_bHM=_END_abc_SBX");
}

TEST(TmpdirParentsTest, PerUserTmpdir) {
  EXPECT_THAT(TmpdirParents("/var/folders/ab/xyz123/T/"),
              ElementsAre("/var/folders/ab/xyz123",
                          "/private/var/folders/ab/xyz123"));
  EXPECT_THAT(TmpdirParents("/private/var/folders/ab/xyz123/T"),
              ElementsAre("/private/var/folders/ab/xyz123",
                          "/var/folders/ab/xyz123"));
}

TEST(TmpdirParentsTest, OtherValuesIgnored) {
  EXPECT_THAT(TmpdirParents(std::nullopt), IsEmpty());
  EXPECT_THAT(TmpdirParents("/tmp"), IsEmpty());
  EXPECT_THAT(TmpdirParents("/var/folders/abc/xyz/T"), IsEmpty());
  EXPECT_THAT(TmpdirParents("/var/folders/ab/xyz/C"), IsEmpty());
}

TEST(MoveBlockingRulesTest, ProtectsPathAndAncestors) {
  PathContext context{.cwd = "/", .home = "/"};
  std::vector<std::string> rules =
      MoveBlockingRules({"/nonexistent-root/a/b"}, context, "T");
  EXPECT_THAT(rules,
              ElementsAre("(deny file-write-unlink\n  (subpath "
                          "\"/nonexistent-root/a/b\")\n  (with message \"T\"))",
                          "(deny file-write-unlink\n  (literal "
                          "\"/nonexistent-root/a\")\n  (with message \"T\"))",
                          "(deny file-write-unlink\n  (literal "
                          "\"/nonexistent-root\")\n  (with message \"T\"))"));
}

TEST(MoveBlockingRulesTest, GlobsUseRegexAndBaseDirectory) {
  PathContext context{.cwd = "/", .home = "/"};
  std::vector<std::string> rules =
      MoveBlockingRules({"/nonexistent-root/*.env"}, context, "T");
  ASSERT_EQ(rules.size(), 2);
  EXPECT_THAT(rules[0], HasSubstr("(regex \"^/nonexistent-root/[^/]*\\\\.env$\")"));
  EXPECT_THAT(rules[1], HasSubstr("(literal \"/nonexistent-root\")"));
}

TEST_F(MacOsBuilderTest, ProfileHeader) {
  auto profile = SeatbeltProfile(Request("ls"), kTag);
  ASSERT_TRUE(profile.ok()) << profile.status();
  EXPECT_THAT(*profile,
              StartsWith(absl::StrCat("(version 1)\n(deny default (with message \"",
                                      kTag, "\"))\n")));
  EXPECT_THAT(*profile, HasSubstr("(allow process-fork)"));
  EXPECT_THAT(*profile, HasSubstr("(allow network*)\n"));
  EXPECT_THAT(*profile, HasSubstr("(allow file-read*)"));
  EXPECT_THAT(*profile, HasSubstr("(allow file-write*)"));
}

TEST_F(MacOsBuilderTest, NetworkOnlyThroughProxies) {
  WrapRequest request = Request("curl example.com");
  request.needs_network_restriction = true;
  request.http_proxy_port = 8080;
  request.socks_proxy_port = 1081;
  auto profile = SeatbeltProfile(request, kTag);
  ASSERT_TRUE(profile.ok()) << profile.status();
  EXPECT_THAT(*profile, Not(HasSubstr("(allow network*)\n")));
  EXPECT_THAT(*profile, HasSubstr("(allow network-outbound (remote ip "
                                  "\"localhost:8080\"))"));
  EXPECT_THAT(*profile, HasSubstr("(allow network-bind (local ip "
                                  "\"localhost:1081\"))"));
  EXPECT_THAT(*profile, Not(HasSubstr("(subpath \"/\"))")));
}

TEST_F(MacOsBuilderTest, UnixSocketAllowances) {
  WrapRequest request = Request("docker ps");
  request.needs_network_restriction = true;
  request.allow_unix_sockets = std::vector<std::string>{"/nonexistent/d.sock"};
  auto profile = SeatbeltProfile(request, kTag);
  ASSERT_TRUE(profile.ok()) << profile.status();
  EXPECT_THAT(*profile,
              HasSubstr("(allow network* (subpath \"/nonexistent/d.sock\"))"));

  request.allow_all_unix_sockets = true;
  profile = SeatbeltProfile(request, kTag);
  ASSERT_TRUE(profile.ok()) << profile.status();
  EXPECT_THAT(*profile, HasSubstr("(allow network* (subpath \"/\"))"));
}

TEST_F(MacOsBuilderTest, ReadDenyRules) {
  WrapRequest request = Request("cat");
  std::string secret = JoinPath(dir_, "secret");
  request.read = ReadRestriction{.deny_only = {secret, "*.pem"}};
  auto profile = SeatbeltProfile(request, kTag);
  ASSERT_TRUE(profile.ok()) << profile.status();
  EXPECT_THAT(*profile, HasSubstr(absl::StrCat(
                            "(deny file-read*\n  (subpath \"", secret,
                            "\")\n  (with message \"", kTag, "\"))")));
  EXPECT_THAT(*profile, HasSubstr("(deny file-read*\n  (regex \"^"));
  EXPECT_THAT(*profile, HasSubstr("/[^/]*\\\\.pem$\")"));
}

TEST_F(MacOsBuilderTest, WriteRules) {
  WrapRequest request = Request("touch x");
  request.write = WriteRestriction{.allow_only = {"."},
                                   .deny_within_allow = {".env"}};
  request.tmpdir = "/var/folders/ab/xyz123/T/";
  auto profile = SeatbeltProfile(request, kTag);
  ASSERT_TRUE(profile.ok()) << profile.status();
  EXPECT_THAT(*profile, Not(HasSubstr("(allow file-write*)")));
  EXPECT_THAT(*profile, HasSubstr(absl::StrCat("(allow file-write*\n  (subpath \"",
                                               dir_, "\")")));
  EXPECT_THAT(*profile,
              HasSubstr(absl::StrCat("(deny file-write*\n  (subpath \"",
                                     JoinPath(dir_, ".env"), "\")")));
  EXPECT_THAT(*profile, HasSubstr("(subpath \"/var/folders/ab/xyz123\")"));
}

TEST_F(MacOsBuilderTest, QuotesPaths) {
  WrapRequest request = Request("cat");
  request.read = ReadRestriction{.deny_only = {"/nonexistent/a\"b"}};
  auto profile = SeatbeltProfile(request, kTag);
  ASSERT_TRUE(profile.ok()) << profile.status();
  EXPECT_THAT(*profile, HasSubstr("(subpath \"/nonexistent/a\\\"b\")"));
}

TEST_F(MacOsBuilderTest, UnrestrictedCommandIsUnchanged) {
  MacOsCommandBuilder builder("_x_SBX");
  auto wrapped = builder.Wrap(Request("echo hi"));
  ASSERT_TRUE(wrapped.ok()) << wrapped.status();
  EXPECT_EQ(*wrapped, "echo hi");
}

TEST_F(MacOsBuilderTest, WrapsWithSandboxExec) {
  MacOsCommandBuilder builder("_x_SBX");
  WrapRequest request = Request("echo hi");
  request.write = WriteRestriction{};
  auto wrapped = builder.Wrap(request);
  ASSERT_TRUE(wrapped.ok()) << wrapped.status();
  EXPECT_THAT(*wrapped, StartsWith("sandbox-exec -p '(version 1)"));
  EXPECT_THAT(*wrapped,
              HasSubstr("'export SANDBOX_RUNTIME=1 TMPDIR=/tmp/sandbox-runtime "
                        "&& echo hi'"));
  EXPECT_THAT(*wrapped, HasSubstr("CMD64_ZWNobyBoaQ==_END_x_SBX"));
}

}  // namespace sandbox_runtime
