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

#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <gtest/gtest.h>

#include "host/libs/network/domain_filter.h"
#include "host/libs/network/proxy_server.h"
#include "host/libs/network/socks_proxy.h"
#include "host/libs/network/tcp_socket.h"

namespace sandbox_runtime {
namespace {

using namespace std::string_literals;

std::string ReadExactly(int fd, size_t len) {
  std::string data(len, '\0');
  size_t have = 0;
  while (have < len) {
    absl::StatusOr<size_t> got = RecvSome(fd, data.data() + have, len - have);
    if (!got.ok() || *got == 0) {
      data.resize(have);
      return data;
    }
    have += *got;
  }
  return data;
}

std::string ReadToEof(int fd) {
  std::string data;
  char buf[1024];
  while (true) {
    absl::StatusOr<size_t> got = RecvSome(fd, buf, sizeof(buf));
    if (!got.ok() || *got == 0) {
      return data;
    }
    data.append(buf, *got);
  }
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

std::string Bytes(std::initializer_list<uint8_t> bytes) {
  return std::string(bytes.begin(), bytes.end());
}

std::string DomainConnect(std::string_view host, uint16_t port) {
  std::string request = Bytes({0x05, 0x01, 0x00, 0x03});
  request.push_back(static_cast<char>(host.size()));
  request.append(host);
  request.push_back(static_cast<char>(port >> 8));
  request.push_back(static_cast<char>(port & 0xff));
  return request;
}

std::string Reply(SocksReply code) {
  return Bytes({0x05, static_cast<uint8_t>(code), 0x00, 0x01, 0, 0, 0, 0, 0,
                0});
}

class SocksProxyTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto proxy = SocksProxy::Start(
        "127.0.0.1", 0, [](uint16_t, const std::string& host) {
          return host == "127.0.0.1" || host == "localhost";
        });
    ASSERT_TRUE(proxy.ok()) << proxy.status();
    proxy_ = std::move(*proxy);
  }

  /** Connects and completes the no-authentication greeting. */
  absl::StatusOr<UniqueFd> Greet() {
    absl::StatusOr<UniqueFd> client = ConnectTcp("127.0.0.1", proxy_->Port());
    if (!client.ok()) {
      return client;
    }
    absl::Status sent = SendAll(client->Get(), Bytes({0x05, 0x01, 0x00}));
    if (!sent.ok()) {
      return sent;
    }
    if (ReadExactly(client->Get(), 2) != Bytes({0x05, 0x00})) {
      return absl::InternalError("Unexpected method selection");
    }
    return client;
  }

  std::unique_ptr<SocksProxy> proxy_;
};

}  // namespace

TEST(SocksReplyForTest, MapsConnectFailures) {
  EXPECT_EQ(SocksReplyFor(absl::UnavailableError("refused")),
            SocksReply::kConnectionRefused);
  EXPECT_EQ(SocksReplyFor(absl::FailedPreconditionError("unreachable")),
            SocksReply::kNetworkUnreachable);
  EXPECT_EQ(SocksReplyFor(absl::NotFoundError("no such host")),
            SocksReply::kHostUnreachable);
  EXPECT_EQ(SocksReplyFor(absl::DeadlineExceededError("timed out")),
            SocksReply::kTtlExpired);
  EXPECT_EQ(SocksReplyFor(absl::CancelledError("closing")),
            SocksReply::kGeneralFailure);
}

TEST(SocksProxyWildcardTest, NulInDomainNameIsNotAllowed) {
  auto echo = ProxyServer::Listen("echo", "127.0.0.1", 0, Echo);
  ASSERT_TRUE(echo.ok()) << echo.status();
  auto proxy = SocksProxy::Start(
      "127.0.0.1", 0, [](uint16_t port, const std::string& host) {
        return FilterNetworkRequest(port, host, {"*.allowed.test"}, {},
                                    nullptr);
      });
  ASSERT_TRUE(proxy.ok()) << proxy.status();

  auto client = ConnectTcp("127.0.0.1", (*proxy)->Port());
  ASSERT_TRUE(client.ok()) << client.status();
  ASSERT_TRUE(SendAll(client->Get(), Bytes({0x05, 0x01, 0x00})).ok());
  ASSERT_EQ(ReadExactly(client->Get(), 2), Bytes({0x05, 0x00}));
  std::string request = DomainConnect("127.0.0.1\0.allowed.test"s,
                                     (*echo)->Port());
  ASSERT_TRUE(SendAll(client->Get(), request).ok());
  EXPECT_EQ(ReadToEof(client->Get()), Reply(SocksReply::kNotAllowed));
}

TEST(SocksProxyCloseTest, CloseInterruptsPendingConnect) {
  auto proxy = SocksProxy::Start(
      "127.0.0.1", 0, [](uint16_t, const std::string&) { return true; });
  ASSERT_TRUE(proxy.ok()) << proxy.status();

  auto client = ConnectTcp("127.0.0.1", (*proxy)->Port());
  ASSERT_TRUE(client.ok()) << client.status();
  ASSERT_TRUE(SendAll(client->Get(), Bytes({0x05, 0x01, 0x00})).ok());
  ASSERT_EQ(ReadExactly(client->Get(), 2), Bytes({0x05, 0x00}));
  // TEST-NET-1 is not routed, so the upstream connection stays pending.
  ASSERT_TRUE(SendAll(client->Get(),
                      Bytes({0x05, 0x01, 0x00, 0x01, 192, 0, 2, 1, 0, 80}))
                  .ok());
  absl::SleepFor(absl::Milliseconds(200));

  absl::Time start = absl::Now();
  (*proxy)->Close();
  EXPECT_LT(absl::Now() - start, absl::Seconds(5));
}

TEST_F(SocksProxyTest, RejectsAuthenticationOnlyClients) {
  auto client = ConnectTcp("127.0.0.1", proxy_->Port());
  ASSERT_TRUE(client.ok()) << client.status();
  ASSERT_TRUE(SendAll(client->Get(), Bytes({0x05, 0x01, 0x02})).ok());
  EXPECT_EQ(ReadToEof(client->Get()), Bytes({0x05, 0xFF}));
}

TEST_F(SocksProxyTest, OnlyConnectIsSupported) {
  auto client = Greet();
  ASSERT_TRUE(client.ok()) << client.status();
  ASSERT_TRUE(SendAll(client->Get(),
                      Bytes({0x05, 0x02, 0x00, 0x01, 127, 0, 0, 1, 0, 80}))
                  .ok());
  EXPECT_EQ(ReadToEof(client->Get()), Reply(SocksReply::kCommandNotSupported));
}

TEST_F(SocksProxyTest, UnknownAddressType) {
  auto client = Greet();
  ASSERT_TRUE(client.ok()) << client.status();
  ASSERT_TRUE(SendAll(client->Get(), Bytes({0x05, 0x01, 0x00, 0x09})).ok());
  EXPECT_EQ(ReadToEof(client->Get()),
            Reply(SocksReply::kAddressTypeNotSupported));
}

TEST_F(SocksProxyTest, BlockedHostIsNotAllowed) {
  auto client = Greet();
  ASSERT_TRUE(client.ok()) << client.status();
  ASSERT_TRUE(SendAll(client->Get(), DomainConnect("blocked.test", 443)).ok());
  EXPECT_EQ(ReadToEof(client->Get()), Reply(SocksReply::kNotAllowed));
}

TEST_F(SocksProxyTest, ClosedPortIsRefused) {
  auto closed = ProxyServer::Listen("closed", "127.0.0.1", 0, Echo);
  ASSERT_TRUE(closed.ok()) << closed.status();
  uint16_t port = (*closed)->Port();
  closed->reset();

  auto client = Greet();
  ASSERT_TRUE(client.ok()) << client.status();
  ASSERT_TRUE(SendAll(client->Get(), DomainConnect("127.0.0.1", port)).ok());
  EXPECT_EQ(ReadToEof(client->Get()), Reply(SocksReply::kConnectionRefused));
}

TEST_F(SocksProxyTest, ConnectsByDomainName) {
  auto echo = ProxyServer::Listen("echo", "127.0.0.1", 0, Echo);
  ASSERT_TRUE(echo.ok()) << echo.status();

  auto client = Greet();
  ASSERT_TRUE(client.ok()) << client.status();
  ASSERT_TRUE(
      SendAll(client->Get(), DomainConnect("127.0.0.1", (*echo)->Port())).ok());
  EXPECT_EQ(ReadExactly(client->Get(), 10), Reply(SocksReply::kSucceeded));
  ASSERT_TRUE(SendAll(client->Get(), "through socks").ok());
  ASSERT_EQ(shutdown(client->Get(), SHUT_WR), 0);
  EXPECT_EQ(ReadToEof(client->Get()), "through socks");
}

TEST_F(SocksProxyTest, ConnectsByIpv4Address) {
  auto echo = ProxyServer::Listen("echo", "127.0.0.1", 0, Echo);
  ASSERT_TRUE(echo.ok()) << echo.status();
  uint16_t port = (*echo)->Port();

  auto client = Greet();
  ASSERT_TRUE(client.ok()) << client.status();
  std::string request = Bytes({0x05, 0x01, 0x00, 0x01, 127, 0, 0, 1});
  request.push_back(static_cast<char>(port >> 8));
  request.push_back(static_cast<char>(port & 0xff));
  ASSERT_TRUE(SendAll(client->Get(), request).ok());
  EXPECT_EQ(ReadExactly(client->Get(), 10), Reply(SocksReply::kSucceeded));
  ASSERT_TRUE(SendAll(client->Get(), "v4").ok());
  ASSERT_EQ(shutdown(client->Get(), SHUT_WR), 0);
  EXPECT_EQ(ReadToEof(client->Get()), "v4");
}

}  // namespace sandbox_runtime
