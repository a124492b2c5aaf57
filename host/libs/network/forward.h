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
#ifndef SANDBOX_RUNTIME_HOST_LIBS_NETWORK_FORWARD_H
#define SANDBOX_RUNTIME_HOST_LIBS_NETWORK_FORWARD_H

#include <absl/status/status.h>

namespace sandbox_runtime {

/** Copies bytes between two connected sockets in both directions until both
 * reach EOF.
 *
 * EOF on one side half-closes the other with `SHUT_WR`. A read or write
 * error, or `stop_fd` becoming readable, shuts both sockets down fully. */
absl::Status ForwardDuplex(int a, int b, int stop_fd = -1);

}  // namespace sandbox_runtime

#endif
