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
#ifndef SANDBOX_RUNTIME_HOST_LIBS_NETWORK_CURL_WRAPPER_H
#define SANDBOX_RUNTIME_HOST_LIBS_NETWORK_CURL_WRAPPER_H

#include <stdint.h>

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <absl/status/statusor.h>
#include <curl/curl.h>

namespace sandbox_runtime {

using HttpHeader = std::pair<std::string, std::string>;

struct HttpRequest {
  std::string method = "GET";
  std::string url;
  std::vector<HttpHeader> headers;
  std::string body;
};

struct HttpResponse {
  long status_code = 0;
  std::string reason;
  std::vector<HttpHeader> headers;
  /** Content codings already undone. */
  std::string body;
};

struct UrlParts {
  /** `http` or `https`. */
  std::string scheme;
  /** Without the brackets of an IPv6 literal. */
  std::string host;
  uint16_t port;
  /** Path and query, starting with `/`. The fragment is dropped. */
  std::string path;
};

/** Splits an absolute http(s) URL with libcurl's URL parser, which is the
 * parser the transfer itself uses. Credentials or a zone id in the URL are
 * `InvalidArgument`. */
absl::StatusOr<UrlParts> ParseHttpUrl(const std::string& url);

/** One easy handle performing requests directly, ignoring proxy variables in
 * the environment. Redirects are returned, not followed. */
class CurlWrapper {
 public:
  static absl::StatusOr<std::unique_ptr<CurlWrapper>> Create();

  CurlWrapper(const CurlWrapper&) = delete;
  CurlWrapper& operator=(const CurlWrapper&) = delete;
  ~CurlWrapper();

  /** `cancelled` is polled during the transfer and aborts it when true. A
   * failed transfer is `Unavailable`. */
  absl::StatusOr<HttpResponse> Perform(const HttpRequest& request,
                                       std::function<bool()> cancelled = {});

 private:
  explicit CurlWrapper(CURL* curl);

  CURL* curl_;
};

}  // namespace sandbox_runtime

#endif
