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
#ifndef SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_VIOLATION_STORE_H
#define SANDBOX_RUNTIME_HOST_LIBS_SANDBOX_VIOLATION_STORE_H

#include <stddef.h>
#include <stdint.h>

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/base/thread_annotations.h>
#include <absl/status/statusor.h>
#include <absl/synchronization/mutex.h>
#include <absl/time/time.h>

namespace sandbox_runtime {

/** Base64 of the first 100 bytes of `command`. Embedded in Seatbelt log tags
 * to tie a denial back to the command that caused it. */
std::string EncodeSandboxedCommand(std::string_view command);
absl::StatusOr<std::string> DecodeSandboxedCommand(std::string_view encoded);

struct ViolationEvent {
  std::string line;
  std::optional<std::string> command;
  std::optional<std::string> encoded_command;
  /** `InfinitePast` means "stamp on insertion". */
  absl::Time timestamp = absl::InfinitePast();
};

class ViolationStore;

/** Removes its listener when destroyed. */
class ViolationSubscription {
 public:
  ViolationSubscription(ViolationSubscription&&);
  ViolationSubscription(const ViolationSubscription&) = delete;
  ViolationSubscription& operator=(const ViolationSubscription&) = delete;
  ~ViolationSubscription();

 private:
  friend class ViolationStore;
  ViolationSubscription(ViolationStore*, uint64_t id);

  ViolationStore* store_;
  uint64_t id_;
};

/** Bounded, thread safe, in-memory tail of sandbox denials. */
class ViolationStore {
 public:
  using Listener = std::function<void(const std::vector<ViolationEvent>&)>;

  explicit ViolationStore(size_t max_size = 100);
  ViolationStore(const ViolationStore&) = delete;
  ViolationStore& operator=(const ViolationStore&) = delete;

  /** Appends, evicting the oldest event past `max_size`. */
  void Add(ViolationEvent event);

  /** The most recent `limit` events, oldest first. */
  std::vector<ViolationEvent> GetViolations(
      std::optional<size_t> limit = std::nullopt) const;
  std::vector<ViolationEvent> ViolationsForCommand(
      std::string_view command) const;

  size_t Count() const;
  /** Every event ever added. Neither eviction nor `Clear` lowers it. */
  uint64_t TotalCount() const;

  void Clear();

  /** `listener` sees the current events now and after every change. */
  [[nodiscard]] ViolationSubscription Subscribe(Listener listener);

 private:
  friend class ViolationSubscription;
  void Unsubscribe(uint64_t id);
  void Notify();

  const size_t max_size_;
  mutable absl::Mutex mu_;
  std::deque<ViolationEvent> events_ ABSL_GUARDED_BY(mu_);
  uint64_t total_count_ ABSL_GUARDED_BY(mu_) = 0;
  uint64_t next_listener_id_ ABSL_GUARDED_BY(mu_) = 0;
  std::map<uint64_t, std::shared_ptr<Listener>> listeners_ ABSL_GUARDED_BY(mu_);
};

}  // namespace sandbox_runtime

#endif
