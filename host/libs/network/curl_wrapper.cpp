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
#include "host/libs/network/curl_wrapper.h"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>
#include <curl/curl.h>

namespace sandbox_runtime {
namespace {

size_t BodyCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
  return size * nmemb;
}

size_t HeaderCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* response = static_cast<HttpResponse*>(userdata);
  std::string_view line(ptr, size * nmemb);
  line = absl::StripTrailingAsciiWhitespace(line);
  if (absl::StartsWith(line, "HTTP/")) {
    // A new status line, interim 1xx responses are discarded.
    response->headers.clear();
    std::vector<std::string_view> parts =
        absl::StrSplit(line, absl::MaxSplits(' ', 2));
    response->reason = parts.size() == 3 ? std::string(parts[2]) : "";
    return size * nmemb;
  }
  size_t colon = line.find(':');
  if (colon != std::string_view::npos) {
    response->headers.emplace_back(
        std::string(absl::StripAsciiWhitespace(line.substr(0, colon))),
        std::string(absl::StripAsciiWhitespace(line.substr(colon + 1))));
  }
  return size * nmemb;
}

int ProgressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t,
                     curl_off_t) {
  auto* cancelled = static_cast<std::function<bool()>*>(userdata);
  return (*cancelled && (*cancelled)()) ? 1 : 0;
}

curl_slist* BuildSlist(const std::vector<std::string>& strings) {
  curl_slist* curl_headers = nullptr;
  for (const auto& str : strings) {
    curl_slist* temp = curl_slist_append(curl_headers, str.c_str());
    if (temp == nullptr) {
      LOG(ERROR) << "curl_slist_append failed to add " << str;
      curl_slist_free_all(curl_headers);
      return nullptr;
    }
    curl_headers = temp;
  }
  return curl_headers;
}

using CurlUrlPtr = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

/** `CURLUE_NO_*` when the part is absent. */
CURLUcode GetUrlPart(CURLU* url, CURLUPart part, unsigned int flags,
                     std::string* out) {
  char* value = nullptr;
  CURLUcode rc = curl_url_get(url, part, &value, flags);
  if (rc == CURLUE_OK) {
    *out = value;
    curl_free(value);
  }
  return rc;
}

absl::Status UrlError(const std::string& url, std::string_view what,
                      CURLUcode rc) {
  return absl::InvalidArgumentError(absl::StrCat(
      what, " in '", url, "': ", curl_url_strerror(rc)));
}

}  // namespace

absl::StatusOr<UrlParts> ParseHttpUrl(const std::string& url) {
  CurlUrlPtr handle(curl_url(), curl_url_cleanup);
  if (!handle) {
    return absl::InternalError("Failed to initialize curl URL handle");
  }
  if (CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(),
                                  CURLU_PATH_AS_IS);
      rc != CURLUE_OK) {
    return UrlError(url, "Malformed URL", rc);
  }
  UrlParts parts;
  if (CURLUcode rc =
          GetUrlPart(handle.get(), CURLUPART_SCHEME, 0, &parts.scheme);
      rc != CURLUE_OK) {
    return UrlError(url, "Missing scheme", rc);
  }
  if (parts.scheme != "http" && parts.scheme != "https") {
    return absl::InvalidArgumentError(
        absl::StrCat("Unsupported scheme '", parts.scheme, "'"));
  }
  std::string ignored;
  if (GetUrlPart(handle.get(), CURLUPART_USER, 0, &ignored) == CURLUE_OK ||
      GetUrlPart(handle.get(), CURLUPART_PASSWORD, 0, &ignored) ==
          CURLUE_OK) {
    return absl::InvalidArgumentError(
        absl::StrCat("Credentials are not allowed in '", url, "'"));
  }
  if (GetUrlPart(handle.get(), CURLUPART_ZONEID, 0, &ignored) == CURLUE_OK) {
    return absl::InvalidArgumentError(
        absl::StrCat("Zone ids are not allowed in '", url, "'"));
  }
  if (CURLUcode rc = GetUrlPart(handle.get(), CURLUPART_HOST, 0, &parts.host);
      rc != CURLUE_OK) {
    return UrlError(url, "Missing host", rc);
  }
  if (absl::StartsWith(parts.host, "[") && absl::EndsWith(parts.host, "]")) {
    parts.host = parts.host.substr(1, parts.host.size() - 2);
  }
  std::string port;
  uint32_t port_number = 0;
  if (CURLUcode rc = GetUrlPart(handle.get(), CURLUPART_PORT,
                                CURLU_DEFAULT_PORT, &port);
      rc != CURLUE_OK) {
    return UrlError(url, "Missing port", rc);
  }
  if (!absl::SimpleAtoi(port, &port_number) || port_number == 0 ||
      port_number > 65535) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid port in '", url, "'"));
  }
  parts.port = static_cast<uint16_t>(port_number);
  if (CURLUcode rc = GetUrlPart(handle.get(), CURLUPART_PATH, 0, &parts.path);
      rc != CURLUE_OK) {
    return UrlError(url, "Missing path", rc);
  }
  std::string query;
  if (GetUrlPart(handle.get(), CURLUPART_QUERY, 0, &query) == CURLUE_OK) {
    absl::StrAppend(&parts.path, "?", query);
  }
  return parts;
}

absl::StatusOr<std::unique_ptr<CurlWrapper>> CurlWrapper::Create() {
  CURL* curl = curl_easy_init();
  if (curl == nullptr) {
    return absl::InternalError("Failed to initialize curl");
  }
  return std::unique_ptr<CurlWrapper>(new CurlWrapper(curl));
}

CurlWrapper::CurlWrapper(CURL* curl) : curl_(curl) {}

CurlWrapper::~CurlWrapper() { curl_easy_cleanup(curl_); }

absl::StatusOr<HttpResponse> CurlWrapper::Perform(
    const HttpRequest& request, std::function<bool()> cancelled) {
  VLOG(1) << "Forwarding " << request.method << " " << request.url;
  std::vector<std::string> header_lines;
  for (const auto& [name, value] : request.headers) {
    header_lines.emplace_back(absl::StrCat(name, ": ", value));
  }
  // Suppress headers curl would add on its own.
  header_lines.emplace_back("Expect:");
  curl_slist* curl_headers = BuildSlist(header_lines);

  HttpResponse response;
  char error_buf[CURL_ERROR_SIZE] = {};
  curl_easy_reset(curl_);
  curl_easy_setopt(curl_, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl_, CURLOPT_PROXY, "");
  curl_easy_setopt(curl_, CURLOPT_NOPROXY, "*");
  curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 0L);
  curl_easy_setopt(curl_, CURLOPT_PROTOCOLS_STR, "http,https");
  curl_easy_setopt(curl_, CURLOPT_PATH_AS_IS, 1L);
  curl_easy_setopt(curl_, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, curl_headers);
  curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, error_buf);
  curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, BodyCallback);
  curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, HeaderCallback);
  curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response);
  curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
  curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, &cancelled);
  if (request.method == "HEAD") {
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
  } else {
    curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, request.method.c_str());
  }
  if (!request.body.empty()) {
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request.body.data());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(request.body.size()));
  }

  CURLcode res = curl_easy_perform(curl_);
  if (curl_headers) {
    curl_slist_free_all(curl_headers);
  }
  if (res != CURLE_OK) {
    return absl::UnavailableError(
        absl::StrCat("curl_easy_perform() failed. Code was \"",
                     static_cast<int>(res), "\". Strerror was \"",
                     curl_easy_strerror(res), "\". Error buffer was \"",
                     error_buf, "\"."));
  }
  curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status_code);
  return response;
}

}  // namespace sandbox_runtime
