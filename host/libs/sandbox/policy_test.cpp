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
#include "host/libs/sandbox/policy.h"

#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace sandbox_runtime {

using ::testing::HasSubstr;

TEST(ValidateDomainPatternTest, AcceptsDomains) {
  EXPECT_TRUE(ValidateDomainPattern("localhost").ok());
  EXPECT_TRUE(ValidateDomainPattern("example.com").ok());
  EXPECT_TRUE(ValidateDomainPattern("api.github.com").ok());
  EXPECT_TRUE(ValidateDomainPattern("*.example.com").ok());
}

TEST(ValidateDomainPatternTest, RejectsInjection) {
  for (const char* domain :
       {"https://example.com", "example.com/path", "example.com:443",
        "localhost:8080"}) {
    absl::Status status = ValidateDomainPattern(domain);
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument) << domain;
  }
}

TEST(ValidateDomainPatternTest, RejectsBroadOrMisplacedWildcards) {
  for (const char* domain : {"*.com", "*example.com", "*.", "foo.*.com",
                             "*.example.", "*"}) {
    EXPECT_FALSE(ValidateDomainPattern(domain).ok()) << domain;
  }
}

TEST(ValidateDomainPatternTest, RejectsUnqualified) {
  EXPECT_FALSE(ValidateDomainPattern("intranet").ok());
  EXPECT_FALSE(ValidateDomainPattern(".example.com").ok());
  EXPECT_FALSE(ValidateDomainPattern("example.com.").ok());
}

TEST(ValidateDomainPatternTest, MessageNamesDomain) {
  absl::Status status = ValidateDomainPattern("*.com");
  EXPECT_THAT(status.message(), HasSubstr("'*.com'"));
}

TEST(ValidatePolicyTest, DefaultIsValid) {
  EXPECT_TRUE(ValidatePolicy(DefaultPolicy()).ok());
}

TEST(ValidatePolicyTest, RejectsBlankPaths) {
  RestrictionPolicy policy = DefaultPolicy();
  policy.filesystem.deny_read = {"/etc/passwd", "   "};
  EXPECT_EQ(ValidatePolicy(policy).code(), absl::StatusCode::kInvalidArgument);

  policy = DefaultPolicy();
  policy.filesystem.allow_write = std::vector<std::string>{""};
  EXPECT_THAT(ValidatePolicy(policy).message(), HasSubstr("allowWrite"));

  policy = DefaultPolicy();
  policy.network.allow_unix_sockets = std::vector<std::string>{" "};
  EXPECT_FALSE(ValidatePolicy(policy).ok());
}

TEST(ValidatePolicyTest, RejectsBadIgnoreRules) {
  RestrictionPolicy policy = DefaultPolicy();
  policy.ignore_violations["git"] = {""};
  EXPECT_FALSE(ValidatePolicy(policy).ok());
}

TEST(ValidatePolicyTest, RejectsZeroPortAndEmptyRipgrep) {
  RestrictionPolicy policy = DefaultPolicy();
  policy.network.external_http_proxy_port = 0;
  EXPECT_FALSE(ValidatePolicy(policy).ok());

  policy = DefaultPolicy();
  policy.ripgrep.command = "";
  EXPECT_FALSE(ValidatePolicy(policy).ok());
}

TEST(ApplyOverridesTest, UnsetFieldsInheritBase) {
  RestrictionPolicy base = DefaultPolicy();
  base.network.allowed_domains = {"example.com"};
  base.network.denied_domains = {"bad.example.com"};
  base.filesystem.deny_read = {"~/.ssh"};

  PolicyOverrides overrides;
  overrides.allowed_domains = std::vector<std::string>{"github.com"};
  overrides.allow_local_binding = true;

  auto merged = ApplyOverrides(base, overrides);
  ASSERT_TRUE(merged.ok()) << merged.status();
  EXPECT_EQ(merged->network.allowed_domains,
            std::vector<std::string>{"github.com"});
  EXPECT_EQ(merged->network.denied_domains, base.network.denied_domains);
  EXPECT_TRUE(merged->network.allow_local_binding);
  EXPECT_EQ(merged->filesystem, base.filesystem);
}

TEST(ApplyOverridesTest, EmptyListOverridesToEmpty) {
  RestrictionPolicy base = DefaultPolicy();
  base.filesystem.deny_read = {"/secret"};
  PolicyOverrides overrides;
  overrides.deny_read = std::vector<std::string>();
  auto merged = ApplyOverrides(base, overrides);
  ASSERT_TRUE(merged.ok());
  EXPECT_TRUE(merged->filesystem.deny_read.empty());
}

TEST(ApplyOverridesTest, ResultIsValidated) {
  PolicyOverrides overrides;
  overrides.allowed_domains = std::vector<std::string>{"*.com"};
  EXPECT_FALSE(ApplyOverrides(DefaultPolicy(), overrides).ok());
}

TEST(NeedsNetworkRestrictionTest, FollowsAllowedDomains) {
  RestrictionPolicy policy = DefaultPolicy();
  EXPECT_FALSE(NeedsNetworkRestriction(policy));
  policy.network.denied_domains = {"example.com"};
  EXPECT_FALSE(NeedsNetworkRestriction(policy));
  policy.network.allowed_domains = {"example.com"};
  EXPECT_TRUE(NeedsNetworkRestriction(policy));
}

TEST(RestrictionPolicyTest, PrintsUnrestrictedWrites) {
  RestrictionPolicy policy;
  std::stringstream out;
  out << policy;
  EXPECT_THAT(out.str(), HasSubstr("allow_write: (unrestricted)"));
}

}  // namespace sandbox_runtime
