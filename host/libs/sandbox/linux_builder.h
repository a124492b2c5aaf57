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
#ifndef SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_LINUX_BUILDER_H
#define SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_LINUX_BUILDER_H

#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "host/libs/sandbox/command_builder.h"
#include "host/libs/sandbox/policy.h"

namespace sandbox_runtime {

/** Ports the in-sandbox socat listeners bind inside the new network
 * namespace. */
inline constexpr uint16_t kSandboxHttpProxyPort = 3128;
inline constexpr uint16_t kSandboxSocksProxyPort = 1080;

/** Wraps commands in bubblewrap. Network access goes through the bridge
 * sockets, Unix socket creation is blocked with a seccomp filter. */
class LinuxCommandBuilder : public CommandBuilder {
 public:
  LinuxCommandBuilder(std::optional<std::string> seccomp_filter,
                      std::optional<std::string> apply_seccomp);

  absl::StatusOr<std::string> Wrap(const WrapRequest& request) override;
  absl::Status CheckDependencies(const RestrictionPolicy& policy) override;

 private:
  const std::optional<std::string> seccomp_filter_;
  const std::optional<std::string> apply_seccomp_;
};

/** The bwrap arguments confining the filesystem, in mount order. */
absl::StatusOr<std::vector<std::string>> BwrapFilesystemArgs(
    const WrapRequest& request);

}  // namespace sandbox_runtime

#endif
