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

#include "host/libs/network/domain_filter.h"

namespace sandbox_runtime {

TEST(MatchesDomainPatternTest, ExactIsCaseInsensitive) {
  EXPECT_TRUE(MatchesDomainPattern("GitHub.com", "github.com"));
  EXPECT_FALSE(MatchesDomainPattern("api.github.com", "github.com"));
  EXPECT_FALSE(MatchesDomainPattern("github.co", "github.com"));
}

TEST(MatchesDomainPatternTest, WildcardMatchesSubdomainsOnly) {
  EXPECT_TRUE(MatchesDomainPattern("api.github.com", "*.github.com"));
  EXPECT_TRUE(MatchesDomainPattern("a.b.GITHUB.com", "*.github.com"));
  EXPECT_FALSE(MatchesDomainPattern("github.com", "*.github.com"));
  EXPECT_FALSE(MatchesDomainPattern("evilgithub.com", "*.github.com"));
  EXPECT_FALSE(MatchesDomainPattern(".github.com", "*.github.com"));
}

TEST(FilterNetworkRequestTest, AllowedHostPasses) {
  EXPECT_TRUE(FilterNetworkRequest(443, "example.com", {"example.com"}, {},
                                   nullptr));
}

TEST(FilterNetworkRequestTest, DenyWinsOverAllow) {
  std::vector<std::string> allowed = {"*.example.com"};
  std::vector<std::string> denied = {"bad.example.com"};
  EXPECT_FALSE(
      FilterNetworkRequest(443, "bad.example.com", allowed, denied, nullptr));
  EXPECT_TRUE(
      FilterNetworkRequest(443, "good.example.com", allowed, denied, nullptr));
}

TEST(FilterNetworkRequestTest, EmptyAllowListDenies) {
  EXPECT_FALSE(FilterNetworkRequest(80, "example.com", {}, {}, nullptr));
}

TEST(FilterNetworkRequestTest, UnlistedHostGoesToAsk) {
  std::string asked_host;
  uint16_t asked_port = 0;
  AskCallback ask = [&](uint16_t port, const std::string& host) {
    asked_host = host;
    asked_port = port;
    return host == "yes.test";
  };
  EXPECT_TRUE(FilterNetworkRequest(8080, "yes.test", {}, {}, ask));
  EXPECT_EQ(asked_host, "yes.test");
  EXPECT_EQ(asked_port, 8080);
  EXPECT_FALSE(FilterNetworkRequest(8080, "no.test", {}, {}, ask));
}

TEST(FilterNetworkRequestTest, ListedHostsSkipAsk) {
  bool asked = false;
  AskCallback ask = [&](uint16_t, const std::string&) {
    asked = true;
    return true;
  };
  EXPECT_TRUE(FilterNetworkRequest(443, "a.test", {"a.test"}, {}, ask));
  EXPECT_FALSE(FilterNetworkRequest(443, "b.test", {}, {"b.test"}, ask));
  EXPECT_FALSE(asked);
}

}  // namespace sandbox_runtime
