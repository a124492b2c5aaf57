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
#include "host/libs/sandbox/policy_json.h"

#include <stdlib.h>
#include <unistd.h>

#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"

namespace sandbox_runtime {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

constexpr char kFullDocument[] = R"({
  "network": {
    "allowedDomains": ["example.com", "*.github.com"],
    "deniedDomains": ["evil.example.com"],
    "allowUnixSockets": ["/var/run/docker.sock"],
    "allowAllUnixSockets": false,
    "allowLocalBinding": true,
    "httpProxyPort": 8080,
    "socksProxyPort": 1081
  },
  "filesystem": {
    "denyRead": ["~/.ssh"],
    "allowRead": [],
    "allowWrite": ["."],
    "denyWrite": [".env"]
  },
  "ignoreViolations": {"*": ["/usr/bin"], "git push": ["/private/tmp"]},
  "enableWeakerNestedSandbox": true,
  "ripgrep": {"command": "/opt/rg", "args": ["--hidden"]},
  "unknownKey": 1
})";

std::string WriteTempFile(const std::string& contents) {
  std::string templ = JoinPath(testing::TempDir(), "policy_XXXXXX");
  int fd = mkstemp(templ.data());
  EXPECT_GE(fd, 0);
  close(fd);
  std::ofstream(templ) << contents;
  return templ;
}

}  // namespace

TEST(ParsePolicyJsonTest, ReadsEveryField) {
  auto policy = ParsePolicyJson(kFullDocument);
  ASSERT_TRUE(policy.ok()) << policy.status();

  EXPECT_THAT(policy->network.allowed_domains,
              ElementsAre("example.com", "*.github.com"));
  EXPECT_THAT(policy->network.denied_domains, ElementsAre("evil.example.com"));
  ASSERT_TRUE(policy->network.allow_unix_sockets.has_value());
  EXPECT_THAT(*policy->network.allow_unix_sockets,
              ElementsAre("/var/run/docker.sock"));
  EXPECT_TRUE(policy->network.allow_local_binding);
  EXPECT_EQ(policy->network.external_http_proxy_port, 8080);
  EXPECT_EQ(policy->network.external_socks_proxy_port, 1081);

  EXPECT_THAT(policy->filesystem.deny_read, ElementsAre("~/.ssh"));
  ASSERT_TRUE(policy->filesystem.allow_write.has_value());
  EXPECT_THAT(*policy->filesystem.allow_write, ElementsAre("."));
  EXPECT_THAT(policy->filesystem.deny_write, ElementsAre(".env"));

  EXPECT_THAT(policy->ignore_violations["git push"],
              ElementsAre("/private/tmp"));
  EXPECT_TRUE(policy->enable_weaker_nested_sandbox);
  EXPECT_EQ(policy->ripgrep.command, "/opt/rg");
  EXPECT_THAT(policy->ripgrep.args, ElementsAre("--hidden"));
}

TEST(ParsePolicyJsonTest, AbsentKeysTakeDefaults) {
  auto policy = ParsePolicyJson("{}");
  ASSERT_TRUE(policy.ok()) << policy.status();
  EXPECT_TRUE(policy->network.allowed_domains.empty());
  EXPECT_FALSE(policy->network.allow_unix_sockets.has_value());
  EXPECT_FALSE(policy->network.external_http_proxy_port.has_value());
  EXPECT_FALSE(policy->filesystem.allow_write.has_value());
  EXPECT_EQ(policy->ripgrep.command, "rg");
}

TEST(ParsePolicyJsonTest, EmptyAllowWriteIsKept) {
  auto policy = ParsePolicyJson(R"({"filesystem": {"allowWrite": []}})");
  ASSERT_TRUE(policy.ok()) << policy.status();
  ASSERT_TRUE(policy->filesystem.allow_write.has_value());
  EXPECT_TRUE(policy->filesystem.allow_write->empty());
}

TEST(ParsePolicyJsonTest, NullPortIsAbsent) {
  auto policy = ParsePolicyJson(R"({"network": {"httpProxyPort": null}})");
  ASSERT_TRUE(policy.ok()) << policy.status();
  EXPECT_FALSE(policy->network.external_http_proxy_port.has_value());
}

TEST(ParsePolicyJsonTest, RejectsWrongTypes) {
  for (const char* doc : {
           R"([])",
           R"({"network": []})",
           R"({"network": {"allowedDomains": "example.com"}})",
           R"({"network": {"allowedDomains": [1]}})",
           R"({"network": {"allowLocalBinding": "yes"}})",
           R"({"network": {"httpProxyPort": "8080"}})",
           R"({"ripgrep": {"command": 3}})",
       }) {
    auto policy = ParsePolicyJson(doc);
    EXPECT_EQ(policy.status().code(), absl::StatusCode::kInvalidArgument)
        << doc;
  }
}

TEST(ParsePolicyJsonTest, RejectsOutOfRangePorts) {
  auto policy = ParsePolicyJson(R"({"network": {"socksProxyPort": 70000}})");
  EXPECT_THAT(policy.status().message(),
              HasSubstr("network.socksProxyPort"));
  EXPECT_FALSE(ParsePolicyJson(R"({"network": {"httpProxyPort": 0}})").ok());
}

TEST(ParsePolicyJsonTest, ValidatesDomains) {
  auto policy = ParsePolicyJson(R"({"network": {"allowedDomains": ["*.com"]}})");
  EXPECT_EQ(policy.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(ParsePolicyJsonTest, MalformedJson) {
  auto policy = ParsePolicyJson("{\"network\": ");
  EXPECT_THAT(policy.status().message(), HasSubstr("Malformed JSON"));
}

TEST(LoadPolicyFromFileTest, MissingFileIsNullopt) {
  auto policy = LoadPolicyFromFile("/nonexistent/srt-settings.json");
  ASSERT_TRUE(policy.ok()) << policy.status();
  EXPECT_FALSE(policy->has_value());
}

TEST(LoadPolicyFromFileTest, BlankFileIsNullopt) {
  std::string path = WriteTempFile("  \n");
  auto policy = LoadPolicyFromFile(path);
  ASSERT_TRUE(policy.ok()) << policy.status();
  EXPECT_FALSE(policy->has_value());
  unlink(path.c_str());
}

TEST(LoadPolicyFromFileTest, ErrorNamesFile) {
  std::string path = WriteTempFile("not json");
  auto policy = LoadPolicyFromFile(path);
  EXPECT_EQ(policy.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(policy.status().message(), HasSubstr(path));
  unlink(path.c_str());
}

TEST(LoadPolicyFromFileTest, ReadsDocument) {
  std::string path = WriteTempFile(kFullDocument);
  auto policy = LoadPolicyFromFile(path);
  ASSERT_TRUE(policy.ok()) << policy.status();
  ASSERT_TRUE(policy->has_value());
  EXPECT_EQ((*policy)->network.external_http_proxy_port, 8080);
  unlink(path.c_str());
}

}  // namespace sandbox_runtime
