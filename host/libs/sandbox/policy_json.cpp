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

#include <stdint.h>

#include <map>
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
#include <absl/strings/str_cat.h>
#include <json/json.h>

#include "common/libs/utils/files.h"
#include "host/libs/sandbox/policy.h"

namespace sandbox_runtime {
namespace {

absl::Status WrongType(std::string_view key, std::string_view expected) {
  return absl::InvalidArgumentError(
      absl::StrCat("'", key, "' must be ", expected));
}

absl::Status ReadObject(const Json::Value& parent, const char* key,
                        const Json::Value** out) {
  static const Json::Value kEmpty(Json::objectValue);
  *out = &kEmpty;
  if (!parent.isMember(key)) {
    return absl::OkStatus();
  }
  const Json::Value& value = parent[key];
  if (!value.isObject()) {
    return WrongType(key, "an object");
  }
  *out = &value;
  return absl::OkStatus();
}

absl::Status ReadStringList(const Json::Value& parent, std::string_view prefix,
                            const char* key, std::vector<std::string>* out) {
  if (!parent.isMember(key)) {
    return absl::OkStatus();
  }
  const Json::Value& value = parent[key];
  std::string name = absl::StrCat(prefix, key);
  if (!value.isArray()) {
    return WrongType(name, "an array of strings");
  }
  out->clear();
  for (const Json::Value& member : value) {
    if (!member.isString()) {
      return WrongType(name, "an array of strings");
    }
    out->emplace_back(member.asString());
  }
  return absl::OkStatus();
}

absl::Status ReadOptionalStringList(
    const Json::Value& parent, std::string_view prefix, const char* key,
    std::optional<std::vector<std::string>>* out) {
  if (!parent.isMember(key)) {
    return absl::OkStatus();
  }
  std::vector<std::string> list;
  if (absl::Status s = ReadStringList(parent, prefix, key, &list); !s.ok()) {
    return s;
  }
  *out = std::move(list);
  return absl::OkStatus();
}

absl::Status ReadBool(const Json::Value& parent, std::string_view prefix,
                      const char* key, bool* out) {
  if (!parent.isMember(key)) {
    return absl::OkStatus();
  }
  const Json::Value& value = parent[key];
  if (!value.isBool()) {
    return WrongType(absl::StrCat(prefix, key), "a boolean");
  }
  *out = value.asBool();
  return absl::OkStatus();
}

absl::Status ReadPort(const Json::Value& parent, std::string_view prefix,
                      const char* key, std::optional<uint16_t>* out) {
  if (!parent.isMember(key) || parent[key].isNull()) {
    return absl::OkStatus();
  }
  const Json::Value& value = parent[key];
  std::string name = absl::StrCat(prefix, key);
  if (!value.isIntegral()) {
    return WrongType(name, "an integer");
  }
  Json::Int64 port = value.asInt64();
  if (port < 1 || port > 65535) {
    return absl::InvalidArgumentError(
        absl::StrCat("'", name, "' is out of range: ", port));
  }
  *out = static_cast<uint16_t>(port);
  return absl::OkStatus();
}

absl::Status ReadNetwork(const Json::Value& root, NetworkPolicy* net) {
  const Json::Value* obj;
  if (absl::Status s = ReadObject(root, "network", &obj); !s.ok()) {
    return s;
  }
  constexpr std::string_view kPrefix = "network.";
  for (absl::Status s : {
           ReadStringList(*obj, kPrefix, "allowedDomains",
                          &net->allowed_domains),
           ReadStringList(*obj, kPrefix, "deniedDomains", &net->denied_domains),
           ReadOptionalStringList(*obj, kPrefix, "allowUnixSockets",
                                  &net->allow_unix_sockets),
           ReadBool(*obj, kPrefix, "allowAllUnixSockets",
                    &net->allow_all_unix_sockets),
           ReadBool(*obj, kPrefix, "allowLocalBinding",
                    &net->allow_local_binding),
           ReadPort(*obj, kPrefix, "httpProxyPort",
                    &net->external_http_proxy_port),
           ReadPort(*obj, kPrefix, "socksProxyPort",
                    &net->external_socks_proxy_port),
       }) {
    if (!s.ok()) {
      return s;
    }
  }
  return absl::OkStatus();
}

absl::Status ReadFilesystem(const Json::Value& root, FilesystemPolicy* fs) {
  const Json::Value* obj;
  if (absl::Status s = ReadObject(root, "filesystem", &obj); !s.ok()) {
    return s;
  }
  constexpr std::string_view kPrefix = "filesystem.";
  for (absl::Status s : {
           ReadStringList(*obj, kPrefix, "denyRead", &fs->deny_read),
           ReadStringList(*obj, kPrefix, "allowRead", &fs->allow_read),
           ReadOptionalStringList(*obj, kPrefix, "allowWrite",
                                  &fs->allow_write),
           ReadStringList(*obj, kPrefix, "denyWrite", &fs->deny_write),
       }) {
    if (!s.ok()) {
      return s;
    }
  }
  return absl::OkStatus();
}

absl::Status ReadIgnoreViolations(
    const Json::Value& root,
    std::map<std::string, std::vector<std::string>>* out) {
  const Json::Value* obj;
  if (absl::Status s = ReadObject(root, "ignoreViolations", &obj); !s.ok()) {
    return s;
  }
  for (const std::string& command : obj->getMemberNames()) {
    std::vector<std::string> paths;
    auto s = ReadStringList(*obj, "ignoreViolations.", command.c_str(), &paths);
    if (!s.ok()) {
      return s;
    }
    (*out)[command] = std::move(paths);
  }
  return absl::OkStatus();
}

absl::Status ReadRipgrep(const Json::Value& root, RipgrepConfig* rg) {
  const Json::Value* obj;
  if (absl::Status s = ReadObject(root, "ripgrep", &obj); !s.ok()) {
    return s;
  }
  if (obj->isMember("command")) {
    if (!(*obj)["command"].isString()) {
      return WrongType("ripgrep.command", "a string");
    }
    rg->command = (*obj)["command"].asString();
  }
  return ReadStringList(*obj, "ripgrep.", "args", &rg->args);
}

}  // namespace

absl::StatusOr<Json::Value> ParseJson(std::string_view input) {
  Json::Value root;
  JSONCPP_STRING err;
  Json::CharReaderBuilder builder;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  auto begin = input.data();
  auto end = begin + input.length();
  if (!reader->parse(begin, end, &root, &err)) {
    return absl::InvalidArgumentError(absl::StrCat("Malformed JSON: ", err));
  }
  return root;
}

absl::StatusOr<RestrictionPolicy> PolicyFromJson(const Json::Value& root) {
  if (!root.isObject()) {
    return absl::InvalidArgumentError("Policy document must be an object");
  }
  RestrictionPolicy policy;
  for (absl::Status s : {
           ReadNetwork(root, &policy.network),
           ReadFilesystem(root, &policy.filesystem),
           ReadIgnoreViolations(root, &policy.ignore_violations),
           ReadBool(root, "", "enableWeakerNestedSandbox",
                    &policy.enable_weaker_nested_sandbox),
           ReadRipgrep(root, &policy.ripgrep),
       }) {
    if (!s.ok()) {
      return s;
    }
  }
  if (absl::Status status = ValidatePolicy(policy); !status.ok()) {
    return status;
  }
  return policy;
}

absl::StatusOr<RestrictionPolicy> ParsePolicyJson(std::string_view input) {
  absl::StatusOr<Json::Value> root = ParseJson(input);
  if (!root.ok()) {
    return root.status();
  }
  return PolicyFromJson(*root);
}

absl::StatusOr<std::optional<RestrictionPolicy>> LoadPolicyFromFile(
    const std::string& path) {
  if (!FileExists(path)) {
    VLOG(1) << "No policy file at '" << path << "'";
    return std::nullopt;
  }
  absl::StatusOr<std::string> contents = ReadFileContents(path);
  if (!contents.ok()) {
    return contents.status();
  }
  if (absl::StripAsciiWhitespace(*contents).empty()) {
    VLOG(1) << "Policy file '" << path << "' is empty";
    return std::nullopt;
  }
  absl::StatusOr<RestrictionPolicy> policy = ParsePolicyJson(*contents);
  if (!policy.ok()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid policy file '", path, "': ",
                     policy.status().message()));
  }
  return *policy;
}

}  // namespace sandbox_runtime
