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
#ifndef SANDBOX_RUNTIME_HOST_LIBS_NETWORK_HTTP_PROXY_H
#define SANDBOX_RUNTIME_HOST_LIBS_NETWORK_HTTP_PROXY_H

#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "host/libs/network/curl_wrapper.h"
#include "host/libs/network/domain_filter.h"
#include "host/libs/network/proxy_server.h"

namespace sandbox_runtime {

inline constexpr size_t kMaxRequestHeadSize = 64 * 1024;

struct HttpRequestHead {
  std::string method;
  std::string target;
  std::string version;
  std::vector<HttpHeader> headers;

  /** First header named `name`, compared case-insensitively. */
  std::optional<std::string> Header(std::string_view name) const;
};

struct HostPort {
  std::string host;
  uint16_t port;
};

/** Parses a request line and headers, without the terminating blank line. */
absl::StatusOr<HttpRequestHead> ParseHttpRequestHead(std::string_view head);

/** `host:port` or `[v6]:port`, as in a CONNECT request or a `Host` header.
 * The host must pass `ValidateHostName`, so userinfo, `?`, `#`, whitespace and
 * control characters are rejected. */
absl::StatusOr<HostPort> ParseAuthority(std::string_view authority,
                                        std::optional<uint16_t> default_port);

struct UpstreamTarget {
  HostPort destination;
  /** Everything but the body. */
  HttpRequest request;
};

/** Where a plain request goes: the URL of an absolute-form target, or the
 * `Host` header joined with an origin-form target. The URL is split by
 * libcurl and rebuilt from its parts, so `destination` is the host the
 * forwarded request connects to. Hop-by-hop headers are dropped. */
absl::StatusOr<UpstreamTarget> UpstreamFor(const HttpRequestHead& head);

/** Filtering HTTP proxy. CONNECT requests are tunneled, other methods are
 * forwarded with libcurl. */
class HttpProxy {
 public:
  static absl::StatusOr<std::unique_ptr<HttpProxy>> Start(
      const std::string& host, uint16_t port, ConnectionFilter filter);

  uint16_t Port() const;
  void Close();

 private:
  explicit HttpProxy(ConnectionFilter filter);

  void HandleConnection(int client, const ServerStop& stop);
  void HandleConnect(int client, const HttpRequestHead& head,
                     std::string_view buffered, const ServerStop& stop);
  void HandleForward(int client, const HttpRequestHead& head,
                     std::string buffered, const ServerStop& stop);

  ConnectionFilter filter_;
  std::unique_ptr<ProxyServer> server_;
};

}  // namespace sandbox_runtime

#endif
