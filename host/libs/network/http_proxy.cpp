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
#include "host/libs/network/http_proxy.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/ascii.h>
#include <absl/strings/escaping.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

#include "host/libs/network/curl_wrapper.h"
#include "host/libs/network/domain_filter.h"
#include "host/libs/network/forward.h"
#include "host/libs/network/proxy_server.h"
#include "host/libs/network/tcp_socket.h"

namespace sandbox_runtime {
namespace {

constexpr std::string_view kHeadTerminator = "\r\n\r\n";

/** Request headers that describe the hop to this proxy, or that curl sets
 * itself. */
constexpr std::string_view kDroppedRequestHeaders[] = {
    "Host",           "Connection", "Proxy-Connection",  "Proxy-Authorization",
    "Keep-Alive",     "TE",         "Transfer-Encoding", "Content-Length",
    "Accept-Encoding", "Upgrade",
};

constexpr std::string_view kDroppedResponseHeaders[] = {
    "Content-Encoding",
    "Transfer-Encoding",
    "Content-Length",
    "Connection",
};

template <size_t N>
bool IsOneOf(std::string_view name, const std::string_view (&names)[N]) {
  for (std::string_view candidate : names) {
    if (absl::EqualsIgnoreCase(name, candidate)) {
      return true;
    }
  }
  return false;
}

struct ReceivedHead {
  std::string head;
  /** Bytes that arrived after the blank line. */
  std::string rest;
};

/** `OutOfRange` when the client disconnects before finishing the head. */
absl::StatusOr<ReceivedHead> ReceiveHead(int client) {
  std::string buffer;
  char chunk[4096];
  while (true) {
    size_t end = buffer.find(kHeadTerminator);
    if (end != std::string::npos) {
      return ReceivedHead{
          .head = buffer.substr(0, end),
          .rest = buffer.substr(end + kHeadTerminator.size()),
      };
    }
    if (buffer.size() > kMaxRequestHeadSize) {
      return absl::InvalidArgumentError("Request head too large");
    }
    absl::StatusOr<size_t> got = RecvSome(client, chunk, sizeof(chunk));
    if (!got.ok()) {
      return got.status();
    }
    if (*got == 0) {
      return absl::OutOfRangeError("Client closed before the request head");
    }
    buffer.append(chunk, *got);
  }
}

void SendSimpleResponse(int client, int code, std::string_view reason,
                        std::string_view body,
                        const std::vector<HttpHeader>& extra_headers = {}) {
  std::string response = absl::StrCat("HTTP/1.1 ", code, " ", reason, "\r\n");
  for (const auto& [name, value] : extra_headers) {
    absl::StrAppend(&response, name, ": ", value, "\r\n");
  }
  absl::StrAppend(&response, "Content-Type: text/plain\r\n",
                  "Content-Length: ", body.size(), "\r\n",
                  "Connection: close\r\n\r\n", body);
  absl::Status sent = SendAll(client, response);
  if (!sent.ok()) {
    VLOG(1) << "Failed to send " << code << " response: " << sent;
  }
}

void SendBlocked(int client) {
  SendSimpleResponse(client, 403, "Forbidden",
                     "Connection blocked by network allowlist",
                     {{"X-Proxy-Error", "blocked-by-allowlist"}});
}

}  // namespace

std::optional<std::string> HttpRequestHead::Header(
    std::string_view name) const {
  for (const auto& [key, value] : headers) {
    if (absl::EqualsIgnoreCase(key, name)) {
      return value;
    }
  }
  return std::nullopt;
}

absl::StatusOr<HttpRequestHead> ParseHttpRequestHead(std::string_view head) {
  std::vector<std::string_view> lines = absl::StrSplit(head, "\r\n");
  std::vector<std::string_view> request_line =
      absl::StrSplit(lines[0], ' ', absl::SkipEmpty());
  if (request_line.size() != 3 || !absl::StartsWith(request_line[2], "HTTP/")) {
    return absl::InvalidArgumentError(
        absl::StrCat("Malformed request line '", lines[0], "'"));
  }
  HttpRequestHead parsed = {
      .method = std::string(request_line[0]),
      .target = std::string(request_line[1]),
      .version = std::string(request_line[2]),
  };
  for (size_t i = 1; i < lines.size(); i++) {
    size_t colon = lines[i].find(':');
    if (colon == std::string_view::npos || colon == 0) {
      return absl::InvalidArgumentError(
          absl::StrCat("Malformed header line '", lines[i], "'"));
    }
    parsed.headers.emplace_back(
        std::string(lines[i].substr(0, colon)),
        std::string(absl::StripAsciiWhitespace(lines[i].substr(colon + 1))));
  }
  return parsed;
}

absl::StatusOr<HostPort> ParseAuthority(std::string_view authority,
                                        std::optional<uint16_t> default_port) {
  std::string_view host = authority;
  std::string_view port_text;
  bool has_port = false;
  if (absl::StartsWith(authority, "[")) {
    size_t close = authority.find(']');
    if (close == std::string_view::npos) {
      return absl::InvalidArgumentError(
          absl::StrCat("Malformed authority '", authority, "'"));
    }
    host = authority.substr(1, close - 1);
    std::string_view after = authority.substr(close + 1);
    if (absl::ConsumePrefix(&after, ":")) {
      port_text = after;
      has_port = true;
    } else if (!after.empty()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Malformed authority '", authority, "'"));
    }
    if (!absl::StrContains(host, ':')) {
      return absl::InvalidArgumentError(
          absl::StrCat("Bracketed host is not IPv6 in '", authority, "'"));
    }
  } else {
    size_t colon = authority.find(':');
    if (colon != std::string_view::npos) {
      host = authority.substr(0, colon);
      port_text = authority.substr(colon + 1);
      has_port = true;
    }
  }
  if (absl::Status valid = ValidateHostName(host); !valid.ok()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Bad host in '", absl::CHexEscape(authority), "': ", valid.message()));
  }
  uint32_t port = 0;
  if (!has_port) {
    if (!default_port) {
      return absl::InvalidArgumentError(
          absl::StrCat("Missing port in '", authority, "'"));
    }
    port = *default_port;
  } else if (port_text.empty() || port_text.size() > 5 ||
             !std::all_of(port_text.begin(), port_text.end(),
                          absl::ascii_isdigit) ||
             !absl::SimpleAtoi(port_text, &port) || port == 0 ||
             port > 65535) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid port in '", absl::CHexEscape(authority), "'"));
  }
  return HostPort{.host = std::string(host), .port = static_cast<uint16_t>(port)};
}

absl::StatusOr<UpstreamTarget> UpstreamFor(const HttpRequestHead& head) {
  std::string_view target = head.target;
  std::optional<std::string> host_field = head.Header("Host");
  std::string_view authority;
  std::string url;
  if (absl::StartsWith(target, "/")) {
    if (!host_field) {
      return absl::InvalidArgumentError(
          "Origin-form request without a Host header");
    }
    authority = *host_field;
    url = absl::StrCat("http://", *host_field, target);
  } else if (absl::StartsWith(target, "http://") ||
             absl::StartsWith(target, "https://")) {
    std::string_view rest = target.substr(target.find("://") + 3);
    authority = rest.substr(0, rest.find_first_of("/?#"));
    url = head.target;
  } else {
    return absl::InvalidArgumentError(
        absl::StrCat("Unsupported request target '", head.target, "'"));
  }
  // The authority must be a bare host and port, so that the host libcurl
  // connects to is the one checked below.
  absl::StatusOr<HostPort> checked = ParseAuthority(authority, 80);
  if (!checked.ok()) {
    return checked.status();
  }
  absl::StatusOr<UrlParts> parts = ParseHttpUrl(url);
  if (!parts.ok()) {
    return parts.status();
  }
  if (!absl::EqualsIgnoreCase(parts->host, checked->host)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Ambiguous host in '", absl::CHexEscape(head.target), "'"));
  }

  uint16_t scheme_port = parts->scheme == "https" ? 443 : 80;
  std::string host_header = parts->host;
  if (absl::StrContains(host_header, ':')) {
    host_header = absl::StrCat("[", host_header, "]");
  }
  if (parts->port != scheme_port) {
    absl::StrAppend(&host_header, ":", parts->port);
  }

  UpstreamTarget upstream = {
      .destination = {.host = parts->host, .port = parts->port},
      .request =
          {
              .method = head.method,
              .url = absl::StrCat(parts->scheme, "://", host_header,
                                  parts->path),
          },
  };
  upstream.request.headers.emplace_back("Host", host_header);
  for (const auto& header : head.headers) {
    if (!IsOneOf(header.first, kDroppedRequestHeaders)) {
      upstream.request.headers.push_back(header);
    }
  }
  return upstream;
}

absl::StatusOr<std::unique_ptr<HttpProxy>> HttpProxy::Start(
    const std::string& host, uint16_t port, ConnectionFilter filter) {
  std::unique_ptr<HttpProxy> proxy(new HttpProxy(std::move(filter)));
  absl::StatusOr<std::unique_ptr<ProxyServer>> server = ProxyServer::Listen(
      "HTTP", host, port,
      [raw = proxy.get()](int client, const ServerStop& stop) {
        raw->HandleConnection(client, stop);
      });
  if (!server.ok()) {
    return server.status();
  }
  proxy->server_ = std::move(*server);
  return proxy;
}

HttpProxy::HttpProxy(ConnectionFilter filter) : filter_(std::move(filter)) {}

uint16_t HttpProxy::Port() const { return server_->Port(); }

void HttpProxy::Close() { server_->Close(); }

void HttpProxy::HandleConnection(int client, const ServerStop& stop) {
  absl::StatusOr<ReceivedHead> received = ReceiveHead(client);
  if (!received.ok()) {
    if (absl::IsInvalidArgument(received.status())) {
      SendSimpleResponse(client, 400, "Bad Request", "Bad Request");
    }
    VLOG(1) << "Dropping connection: " << received.status();
    return;
  }
  absl::StatusOr<HttpRequestHead> head = ParseHttpRequestHead(received->head);
  if (!head.ok()) {
    LOG(ERROR) << "Invalid request: " << head.status();
    SendSimpleResponse(client, 400, "Bad Request", "Bad Request");
    return;
  }
  if (head->method == "CONNECT") {
    HandleConnect(client, *head, received->rest, stop);
  } else {
    HandleForward(client, *head, std::move(received->rest), stop);
  }
}

void HttpProxy::HandleConnect(int client, const HttpRequestHead& head,
                              std::string_view buffered,
                              const ServerStop& stop) {
  absl::StatusOr<HostPort> target = ParseAuthority(head.target, std::nullopt);
  if (!target.ok()) {
    LOG(ERROR) << "Invalid CONNECT request: " << target.status();
    SendSimpleResponse(client, 400, "Bad Request", "Bad Request");
    return;
  }
  if (!filter_(target->port, target->host)) {
    LOG(ERROR) << "Connection blocked to " << target->host << ":"
               << target->port;
    SendBlocked(client);
    return;
  }
  absl::StatusOr<UniqueFd> upstream =
      ConnectTcp(target->host, target->port, stop.Fd());
  if (!upstream.ok()) {
    LOG(ERROR) << "CONNECT tunnel failed: " << upstream.status();
    SendSimpleResponse(client, 502, "Bad Gateway", "Bad Gateway");
    return;
  }
  absl::Status status =
      SendAll(client, "HTTP/1.1 200 Connection Established\r\n\r\n");
  if (status.ok() && !buffered.empty()) {
    status = SendAll(upstream->Get(), buffered);
  }
  if (status.ok()) {
    status = ForwardDuplex(client, upstream->Get(), stop.Fd());
  }
  if (!status.ok()) {
    VLOG(1) << "Tunnel to " << target->host << ":" << target->port
            << " ended: " << status;
  }
}

void HttpProxy::HandleForward(int client, const HttpRequestHead& head,
                              std::string buffered, const ServerStop& stop) {
  absl::StatusOr<UpstreamTarget> upstream = UpstreamFor(head);
  if (!upstream.ok()) {
    LOG(ERROR) << "Invalid request: " << upstream.status();
    SendSimpleResponse(client, 400, "Bad Request", "Bad Request");
    return;
  }
  const HostPort& destination = upstream->destination;
  if (!filter_(destination.port, destination.host)) {
    LOG(ERROR) << "HTTP request blocked to " << destination.host << ":"
               << destination.port;
    SendBlocked(client);
    return;
  }

  if (head.Header("Transfer-Encoding")) {
    SendSimpleResponse(client, 411, "Length Required",
                       "Chunked request bodies are not supported");
    return;
  }
  size_t content_length = 0;
  if (std::optional<std::string> length = head.Header("Content-Length");
      length && !absl::SimpleAtoi(*length, &content_length)) {
    SendSimpleResponse(client, 400, "Bad Request", "Bad Content-Length");
    return;
  }
  std::string& body = upstream->request.body;
  body = std::move(buffered);
  char chunk[8192];
  while (body.size() < content_length) {
    absl::StatusOr<size_t> got = RecvSome(client, chunk, sizeof(chunk));
    if (!got.ok() || *got == 0) {
      VLOG(1) << "Client went away while sending the request body";
      return;
    }
    body.append(chunk, *got);
  }
  body.resize(content_length);

  absl::StatusOr<std::unique_ptr<CurlWrapper>> curl = CurlWrapper::Create();
  if (!curl.ok()) {
    LOG(ERROR) << curl.status();
    SendSimpleResponse(client, 500, "Internal Server Error",
                       "Internal Server Error");
    return;
  }
  absl::StatusOr<HttpResponse> response = (*curl)->Perform(
      upstream->request, [&stop] { return stop.Requested(); });
  if (!response.ok()) {
    LOG(ERROR) << "Error forwarding HTTP request: " << response.status();
    SendSimpleResponse(client, 502, "Bad Gateway", "Bad Gateway");
    return;
  }

  std::string reply = absl::StrCat("HTTP/1.1 ", response->status_code, " ",
                                   response->reason, "\r\n");
  for (const auto& [name, value] : response->headers) {
    if (!IsOneOf(name, kDroppedResponseHeaders)) {
      absl::StrAppend(&reply, name, ": ", value, "\r\n");
    }
  }
  absl::StrAppend(&reply, "Content-Length: ", response->body.size(), "\r\n",
                  "Connection: close\r\n\r\n", response->body);
  absl::Status sent = SendAll(client, reply);
  if (!sent.ok()) {
    VLOG(1) << "Failed to relay response: " << sent;
  }
}

}  // namespace sandbox_runtime
