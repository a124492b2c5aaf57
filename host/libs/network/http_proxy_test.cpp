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

#include <sys/socket.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/escaping.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/synchronization/mutex.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "host/libs/network/domain_filter.h"
#include "host/libs/network/http_proxy.h"
#include "host/libs/network/proxy_server.h"
#include "host/libs/network/tcp_socket.h"

namespace sandbox_runtime {
namespace {

using namespace std::string_literals;

using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::Pair;
using ::testing::StartsWith;

std::string ReadToEof(int fd) {
  std::string data;
  char buf[4096];
  while (true) {
    absl::StatusOr<size_t> got = RecvSome(fd, buf, sizeof(buf));
    if (!got.ok() || *got == 0) {
      return data;
    }
    data.append(buf, *got);
  }
}

std::string ReadUntil(int fd, std::string_view terminator) {
  std::string data;
  char byte;
  while (!absl::EndsWith(data, terminator)) {
    absl::StatusOr<size_t> got = RecvSome(fd, &byte, 1);
    if (!got.ok() || *got == 0) {
      break;
    }
    data.push_back(byte);
  }
  return data;
}

void Echo(int client, const ServerStop&) {
  char buf[1024];
  while (true) {
    absl::StatusOr<size_t> got = RecvSome(client, buf, sizeof(buf));
    if (!got.ok() || *got == 0 ||
        !SendAll(client, std::string_view(buf, *got)).ok()) {
      return;
    }
  }
}

/** Minimal origin server answering every request with a fixed body. */
class Origin {
 public:
  Origin() {
    auto server = ProxyServer::Listen(
        "origin", "127.0.0.1", 0, [this](int client, const ServerStop&) {
          std::string head = ReadUntil(client, "\r\n\r\n");
          {
            absl::MutexLock lock(&mu_);
            last_head_ = head;
          }
          SendAll(client,
                  "HTTP/1.1 200 OK\r\nX-Origin: yes\r\nContent-Length: 5\r\n"
                  "\r\nhello")
              .IgnoreError();
        });
    if (server.ok()) {
      server_ = std::move(*server);
    } else {
      ADD_FAILURE() << server.status();
    }
  }

  uint16_t Port() const { return server_->Port(); }

  std::string LastHead() {
    absl::MutexLock lock(&mu_);
    return last_head_;
  }

 private:
  std::unique_ptr<ProxyServer> server_;
  absl::Mutex mu_;
  std::string last_head_ ABSL_GUARDED_BY(mu_);
};

bool AllowLoopbackOnly(uint16_t, const std::string& host) {
  return host == "127.0.0.1" || host == "localhost";
}

bool AllowAllowedTestOnly(uint16_t port, const std::string& host) {
  return FilterNetworkRequest(port, host, {"*.allowed.test"}, {}, nullptr);
}

}  // namespace

TEST(ParseHttpRequestHeadTest, RequestLineAndHeaders) {
  auto head = ParseHttpRequestHead(
      "GET http://example.com/x HTTP/1.1\r\nHost: example.com\r\n"
      "X-Thing:  spaced  ");
  ASSERT_TRUE(head.ok()) << head.status();
  EXPECT_EQ(head->method, "GET");
  EXPECT_EQ(head->target, "http://example.com/x");
  EXPECT_EQ(head->version, "HTTP/1.1");
  EXPECT_EQ(head->Header("host"), "example.com");
  EXPECT_EQ(head->Header("X-THING"), "spaced");
  EXPECT_EQ(head->Header("Missing"), std::nullopt);
}

TEST(ParseHttpRequestHeadTest, RejectsMalformedInput) {
  EXPECT_FALSE(ParseHttpRequestHead("GET /").ok());
  EXPECT_FALSE(ParseHttpRequestHead("GET / FTP/1.0").ok());
  EXPECT_FALSE(ParseHttpRequestHead("GET / HTTP/1.1\r\nno colon here").ok());
  EXPECT_FALSE(ParseHttpRequestHead("GET / HTTP/1.1\r\n: empty name").ok());
}

TEST(ParseAuthorityTest, HostAndPort) {
  auto parsed = ParseAuthority("example.com:8443", std::nullopt);
  ASSERT_TRUE(parsed.ok()) << parsed.status();
  EXPECT_EQ(parsed->host, "example.com");
  EXPECT_EQ(parsed->port, 8443);
}

TEST(ParseAuthorityTest, BracketedIpv6) {
  auto parsed = ParseAuthority("[::1]:443", std::nullopt);
  ASSERT_TRUE(parsed.ok()) << parsed.status();
  EXPECT_EQ(parsed->host, "::1");
  EXPECT_EQ(parsed->port, 443);
  auto defaulted = ParseAuthority("[::1]", 80);
  ASSERT_TRUE(defaulted.ok()) << defaulted.status();
  EXPECT_EQ(defaulted->port, 80);
}

TEST(ParseAuthorityTest, DefaultPort) {
  auto parsed = ParseAuthority("example.com", 80);
  ASSERT_TRUE(parsed.ok()) << parsed.status();
  EXPECT_EQ(parsed->port, 80);
  EXPECT_FALSE(ParseAuthority("example.com", std::nullopt).ok());
}

TEST(ParseAuthorityTest, RejectsBadPorts) {
  EXPECT_FALSE(ParseAuthority("example.com:0", std::nullopt).ok());
  EXPECT_FALSE(ParseAuthority("example.com:65536", std::nullopt).ok());
  EXPECT_FALSE(ParseAuthority("example.com:http", std::nullopt).ok());
  EXPECT_FALSE(ParseAuthority(":443", std::nullopt).ok());
  EXPECT_FALSE(ParseAuthority("[::1", 443).ok());
  EXPECT_FALSE(ParseAuthority("example.com:+80", std::nullopt).ok());
  EXPECT_FALSE(ParseAuthority("example.com: 80", std::nullopt).ok());
}

TEST(ParseAuthorityTest, RejectsCharactersOutsideHostNames) {
  EXPECT_FALSE(ParseAuthority("127.0.0.1\0.allowed.test:443"s, std::nullopt)
                   .ok());
  EXPECT_FALSE(ParseAuthority("evil.test?.allowed.test", 80).ok());
  EXPECT_FALSE(ParseAuthority("evil.test#.allowed.test", 80).ok());
  EXPECT_FALSE(ParseAuthority("user@evil.test", 80).ok());
  EXPECT_FALSE(ParseAuthority("evil.test\\.allowed.test", 80).ok());
  EXPECT_FALSE(ParseAuthority("evil.test .allowed.test", 80).ok());
  EXPECT_FALSE(ParseAuthority("::1", 80).ok());
  EXPECT_FALSE(ParseAuthority("[example.com]:80", std::nullopt).ok());
}

TEST(UpstreamForTest, AbsoluteFormTarget) {
  HttpRequestHead head = {
      .method = "GET",
      .target = "http://example.com:8080/path?q=1",
      .version = "HTTP/1.1",
      .headers = {{"Host", "example.com:8080"},
                  {"Proxy-Connection", "keep-alive"},
                  {"Accept", "*/*"}},
  };
  auto upstream = UpstreamFor(head);
  ASSERT_TRUE(upstream.ok()) << upstream.status();
  EXPECT_EQ(upstream->destination.host, "example.com");
  EXPECT_EQ(upstream->destination.port, 8080);
  EXPECT_EQ(upstream->request.method, "GET");
  EXPECT_EQ(upstream->request.url, "http://example.com:8080/path?q=1");
  EXPECT_THAT(upstream->request.headers,
              Contains(Pair("Host", "example.com:8080")));
  EXPECT_THAT(upstream->request.headers, Contains(Pair("Accept", "*/*")));
  EXPECT_THAT(upstream->request.headers,
              Not(Contains(Pair("Proxy-Connection", "keep-alive"))));
}

TEST(UpstreamForTest, DefaultPortsAndBarePath) {
  HttpRequestHead http = {.method = "GET", .target = "http://example.com",
                          .version = "HTTP/1.1"};
  auto upstream = UpstreamFor(http);
  ASSERT_TRUE(upstream.ok()) << upstream.status();
  EXPECT_EQ(upstream->destination.port, 80);
  EXPECT_EQ(upstream->request.url, "http://example.com/");

  HttpRequestHead https = {.method = "GET",
                           .target = "https://example.com/a",
                           .version = "HTTP/1.1"};
  upstream = UpstreamFor(https);
  ASSERT_TRUE(upstream.ok()) << upstream.status();
  EXPECT_EQ(upstream->destination.port, 443);
  EXPECT_EQ(upstream->request.url, "https://example.com/a");
}

TEST(UpstreamForTest, OriginFormUsesHostHeader) {
  HttpRequestHead head = {.method = "POST",
                          .target = "/submit",
                          .version = "HTTP/1.1",
                          .headers = {{"host", "api.test:81"}}};
  auto upstream = UpstreamFor(head);
  ASSERT_TRUE(upstream.ok()) << upstream.status();
  EXPECT_EQ(upstream->destination.host, "api.test");
  EXPECT_EQ(upstream->destination.port, 81);
  EXPECT_EQ(upstream->request.url, "http://api.test:81/submit");

  head.headers.clear();
  EXPECT_FALSE(UpstreamFor(head).ok());
}

TEST(UpstreamForTest, DestinationIsTheHostTheUrlReaches) {
  HttpRequestHead query = {.method = "GET",
                           .target = "http://evil.test?.allowed.test/",
                           .version = "HTTP/1.1"};
  auto upstream = UpstreamFor(query);
  ASSERT_TRUE(upstream.ok()) << upstream.status();
  EXPECT_EQ(upstream->destination.host, "evil.test");
  EXPECT_EQ(upstream->destination.port, 80);
  EXPECT_EQ(upstream->request.url, "http://evil.test/?.allowed.test/");

  HttpRequestHead fragment = {.method = "GET",
                              .target = "http://evil.test#.allowed.test/",
                              .version = "HTTP/1.1"};
  upstream = UpstreamFor(fragment);
  ASSERT_TRUE(upstream.ok()) << upstream.status();
  EXPECT_EQ(upstream->destination.host, "evil.test");
  EXPECT_EQ(upstream->request.url, "http://evil.test/");
}

TEST(UpstreamForTest, RejectsAmbiguousAuthorities) {
  for (const std::string& target :
       {"http://www.allowed.test@evil.test/"s,
        "http://www.allowed.test:x@evil.test/"s,
        "http://evil.test\\.allowed.test/"s,
        "http://evil.test%2e.allowed.test/"s,
        "http://127.0.0.1\0.allowed.test/"s}) {
    HttpRequestHead head = {
        .method = "GET", .target = target, .version = "HTTP/1.1"};
    EXPECT_FALSE(UpstreamFor(head).ok()) << absl::CHexEscape(target);
  }
  for (const std::string& host :
       {"evil.test?.allowed.test"s, "evil.test#.allowed.test"s,
        "user@evil.test"s, "evil.test/.allowed.test"s}) {
    HttpRequestHead head = {.method = "GET",
                            .target = "/",
                            .version = "HTTP/1.1",
                            .headers = {{"Host", host}}};
    EXPECT_FALSE(UpstreamFor(head).ok()) << host;
  }
}

TEST(UpstreamForTest, KeepsPathAsSent) {
  HttpRequestHead head = {.method = "GET",
                          .target = "http://example.com/a/../b?x=1#frag",
                          .version = "HTTP/1.1"};
  auto upstream = UpstreamFor(head);
  ASSERT_TRUE(upstream.ok()) << upstream.status();
  EXPECT_EQ(upstream->request.url, "http://example.com/a/../b?x=1");
}

TEST(UpstreamForTest, RejectsOtherTargets) {
  HttpRequestHead head = {.method = "GET",
                          .target = "ftp://example.com/",
                          .version = "HTTP/1.1"};
  EXPECT_FALSE(UpstreamFor(head).ok());
}

TEST(HttpProxyTest, BlockedRequestGets403) {
  auto proxy = HttpProxy::Start("127.0.0.1", 0, AllowLoopbackOnly);
  ASSERT_TRUE(proxy.ok()) << proxy.status();

  auto client = ConnectTcp("127.0.0.1", (*proxy)->Port());
  ASSERT_TRUE(client.ok()) << client.status();
  ASSERT_TRUE(SendAll(client->Get(),
                      "GET http://blocked.test/ HTTP/1.1\r\n"
                      "Host: blocked.test\r\n\r\n")
                  .ok());
  std::string response = ReadToEof(client->Get());
  EXPECT_THAT(response, StartsWith("HTTP/1.1 403 Forbidden\r\n"));
  EXPECT_THAT(response, HasSubstr("X-Proxy-Error: blocked-by-allowlist\r\n"));
  EXPECT_THAT(response, HasSubstr("Connection blocked by network allowlist"));
  (*proxy)->Close();
}

TEST(HttpProxyTest, BlockedConnectGets403) {
  auto proxy = HttpProxy::Start("127.0.0.1", 0, AllowLoopbackOnly);
  ASSERT_TRUE(proxy.ok()) << proxy.status();

  auto client = ConnectTcp("127.0.0.1", (*proxy)->Port());
  ASSERT_TRUE(client.ok()) << client.status();
  ASSERT_TRUE(SendAll(client->Get(),
                      "CONNECT blocked.test:443 HTTP/1.1\r\n"
                      "Host: blocked.test:443\r\n\r\n")
                  .ok());
  EXPECT_THAT(ReadToEof(client->Get()),
              StartsWith("HTTP/1.1 403 Forbidden\r\n"));
}

TEST(HttpProxyTest, QueryInAuthorityIsFilteredOnTheRealHost) {
  auto proxy = HttpProxy::Start("127.0.0.1", 0, AllowAllowedTestOnly);
  ASSERT_TRUE(proxy.ok()) << proxy.status();

  auto client = ConnectTcp("127.0.0.1", (*proxy)->Port());
  ASSERT_TRUE(client.ok()) << client.status();
  ASSERT_TRUE(SendAll(client->Get(),
                      "GET http://127.0.0.1?.allowed.test/ HTTP/1.1\r\n"
                      "Host: 127.0.0.1\r\n\r\n")
                  .ok());
  EXPECT_THAT(ReadToEof(client->Get()),
              StartsWith("HTTP/1.1 403 Forbidden\r\n"));
}

TEST(HttpProxyTest, HostHeaderWithQueryGets400) {
  auto proxy = HttpProxy::Start("127.0.0.1", 0, AllowAllowedTestOnly);
  ASSERT_TRUE(proxy.ok()) << proxy.status();

  auto client = ConnectTcp("127.0.0.1", (*proxy)->Port());
  ASSERT_TRUE(client.ok()) << client.status();
  ASSERT_TRUE(SendAll(client->Get(),
                      "GET / HTTP/1.1\r\n"
                      "Host: 127.0.0.1?.allowed.test\r\n\r\n")
                  .ok());
  EXPECT_THAT(ReadToEof(client->Get()),
              StartsWith("HTTP/1.1 400 Bad Request\r\n"));
}

TEST(HttpProxyTest, NulInConnectTargetGets400) {
  auto echo = ProxyServer::Listen("echo", "127.0.0.1", 0, Echo);
  ASSERT_TRUE(echo.ok()) << echo.status();
  auto proxy = HttpProxy::Start("127.0.0.1", 0, AllowAllowedTestOnly);
  ASSERT_TRUE(proxy.ok()) << proxy.status();

  auto client = ConnectTcp("127.0.0.1", (*proxy)->Port());
  ASSERT_TRUE(client.ok()) << client.status();
  ASSERT_TRUE(SendAll(client->Get(),
                      absl::StrCat("CONNECT 127.0.0.1\0.allowed.test:"s,
                                   (*echo)->Port(), " HTTP/1.1\r\n\r\n"))
                  .ok());
  EXPECT_THAT(ReadToEof(client->Get()),
              StartsWith("HTTP/1.1 400 Bad Request\r\n"));
}

TEST(HttpProxyTest, MalformedRequestGets400) {
  auto proxy = HttpProxy::Start("127.0.0.1", 0, AllowLoopbackOnly);
  ASSERT_TRUE(proxy.ok()) << proxy.status();

  auto client = ConnectTcp("127.0.0.1", (*proxy)->Port());
  ASSERT_TRUE(client.ok()) << client.status();
  ASSERT_TRUE(SendAll(client->Get(), "nonsense\r\n\r\n").ok());
  EXPECT_THAT(ReadToEof(client->Get()),
              StartsWith("HTTP/1.1 400 Bad Request\r\n"));
}

TEST(HttpProxyTest, ConnectTunnelsToAllowedHost) {
  auto echo = ProxyServer::Listen("echo", "127.0.0.1", 0, Echo);
  ASSERT_TRUE(echo.ok()) << echo.status();
  auto proxy = HttpProxy::Start("127.0.0.1", 0, AllowLoopbackOnly);
  ASSERT_TRUE(proxy.ok()) << proxy.status();

  auto client = ConnectTcp("127.0.0.1", (*proxy)->Port());
  ASSERT_TRUE(client.ok()) << client.status();
  ASSERT_TRUE(SendAll(client->Get(),
                      absl::StrCat("CONNECT 127.0.0.1:", (*echo)->Port(),
                                   " HTTP/1.1\r\n\r\nearly"))
                  .ok());
  EXPECT_EQ(ReadUntil(client->Get(), "\r\n\r\n"),
            "HTTP/1.1 200 Connection Established\r\n\r\n");
  ASSERT_TRUE(SendAll(client->Get(), " data").ok());
  ASSERT_EQ(shutdown(client->Get(), SHUT_WR), 0);
  EXPECT_EQ(ReadToEof(client->Get()), "early data");
}

TEST(HttpProxyTest, ConnectToClosedPortGets502) {
  auto closed = ProxyServer::Listen("closed", "127.0.0.1", 0, Echo);
  ASSERT_TRUE(closed.ok()) << closed.status();
  uint16_t port = (*closed)->Port();
  closed->reset();

  auto proxy = HttpProxy::Start("127.0.0.1", 0, AllowLoopbackOnly);
  ASSERT_TRUE(proxy.ok()) << proxy.status();
  auto client = ConnectTcp("127.0.0.1", (*proxy)->Port());
  ASSERT_TRUE(client.ok()) << client.status();
  ASSERT_TRUE(SendAll(client->Get(), absl::StrCat("CONNECT 127.0.0.1:", port,
                                                  " HTTP/1.1\r\n\r\n"))
                  .ok());
  EXPECT_THAT(ReadToEof(client->Get()),
              StartsWith("HTTP/1.1 502 Bad Gateway\r\n"));
}

TEST(HttpProxyTest, ChunkedBodyGets411) {
  auto proxy = HttpProxy::Start("127.0.0.1", 0, AllowLoopbackOnly);
  ASSERT_TRUE(proxy.ok()) << proxy.status();
  auto client = ConnectTcp("127.0.0.1", (*proxy)->Port());
  ASSERT_TRUE(client.ok()) << client.status();
  ASSERT_TRUE(SendAll(client->Get(),
                      "POST http://127.0.0.1:1/ HTTP/1.1\r\n"
                      "Transfer-Encoding: chunked\r\n\r\n")
                  .ok());
  EXPECT_THAT(ReadToEof(client->Get()),
              StartsWith("HTTP/1.1 411 Length Required\r\n"));
}

TEST(HttpProxyTest, ForwardsPlainRequests) {
  Origin origin;
  auto proxy = HttpProxy::Start("127.0.0.1", 0, AllowLoopbackOnly);
  ASSERT_TRUE(proxy.ok()) << proxy.status();

  auto client = ConnectTcp("127.0.0.1", (*proxy)->Port());
  ASSERT_TRUE(client.ok()) << client.status();
  ASSERT_TRUE(SendAll(client->Get(),
                      absl::StrCat("GET http://127.0.0.1:", origin.Port(),
                                   "/index HTTP/1.1\r\n"
                                   "Proxy-Connection: keep-alive\r\n"
                                   "X-Client: 1\r\n\r\n"))
                  .ok());
  std::string response = ReadToEof(client->Get());
  EXPECT_THAT(response, StartsWith("HTTP/1.1 200 OK\r\n"));
  EXPECT_THAT(response, HasSubstr("X-Origin: yes\r\n"));
  EXPECT_THAT(response, HasSubstr("Content-Length: 5\r\n"));
  EXPECT_TRUE(absl::EndsWith(response, "\r\n\r\nhello"));

  std::string head = origin.LastHead();
  EXPECT_THAT(head, StartsWith("GET /index HTTP/1.1\r\n"));
  EXPECT_THAT(head, HasSubstr("X-Client: 1\r\n"));
  EXPECT_THAT(head, Not(HasSubstr("Proxy-Connection")));
}

}  // namespace sandbox_runtime
