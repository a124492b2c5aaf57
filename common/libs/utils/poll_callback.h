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
#ifndef SANDBOX_RUNTIME_COMMON_LIBS_UTILS_POLL_CALLBACK_H
#define SANDBOX_RUNTIME_COMMON_LIBS_UTILS_POLL_CALLBACK_H

#include <poll.h>

#include <functional>
#include <vector>

#include <absl/status/statusor.h>
#include <absl/time/time.h>

namespace sandbox_runtime {

/** Dispatches `poll(2)` readiness to per-descriptor callbacks. */
class PollCallback {
 public:
  void Add(int fd, std::function<absl::Status(short)> cb);

  /** Waits up to `timeout` (infinite by default) and runs the callbacks of
   * every ready descriptor. Returns how many descriptors were ready, 0 on
   * timeout. */
  absl::StatusOr<int> Poll(absl::Duration timeout = absl::InfiniteDuration());

 private:
  std::vector<pollfd> pollfds_;
  std::vector<std::function<absl::Status(short)>> callbacks_;
};

}  // namespace sandbox_runtime

#endif
