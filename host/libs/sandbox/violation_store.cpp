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
#include "host/libs/sandbox/violation_store.h"

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/escaping.h>
#include <absl/synchronization/mutex.h>
#include <absl/time/clock.h>

namespace sandbox_runtime {

constexpr size_t kEncodedCommandPrefix = 100;

std::string EncodeSandboxedCommand(std::string_view command) {
  return absl::Base64Escape(command.substr(0, kEncodedCommandPrefix));
}

absl::StatusOr<std::string> DecodeSandboxedCommand(std::string_view encoded) {
  std::string decoded;
  if (!absl::Base64Unescape(encoded, &decoded)) {
    return absl::InvalidArgumentError("Command tag is not base64");
  }
  return decoded;
}

ViolationSubscription::ViolationSubscription(ViolationStore* store,
                                             uint64_t id)
    : store_(store), id_(id) {}

ViolationSubscription::ViolationSubscription(ViolationSubscription&& other)
    : store_(other.store_), id_(other.id_) {
  other.store_ = nullptr;
}

ViolationSubscription::~ViolationSubscription() {
  if (store_) {
    store_->Unsubscribe(id_);
  }
}

ViolationStore::ViolationStore(size_t max_size) : max_size_(max_size) {}

void ViolationStore::Add(ViolationEvent event) {
  if (event.timestamp == absl::InfinitePast()) {
    event.timestamp = absl::Now();
  }
  {
    absl::MutexLock lock(&mu_);
    events_.emplace_back(std::move(event));
    total_count_++;
    while (events_.size() > max_size_) {
      events_.pop_front();
    }
  }
  Notify();
}

std::vector<ViolationEvent> ViolationStore::GetViolations(
    std::optional<size_t> limit) const {
  absl::MutexLock lock(&mu_);
  size_t count = std::min(limit.value_or(events_.size()), events_.size());
  return std::vector<ViolationEvent>(events_.end() - count, events_.end());
}

std::vector<ViolationEvent> ViolationStore::ViolationsForCommand(
    std::string_view command) const {
  std::string encoded = EncodeSandboxedCommand(command);
  std::vector<ViolationEvent> matching;
  absl::MutexLock lock(&mu_);
  for (const ViolationEvent& event : events_) {
    if (event.encoded_command == encoded) {
      matching.emplace_back(event);
    }
  }
  return matching;
}

size_t ViolationStore::Count() const {
  absl::MutexLock lock(&mu_);
  return events_.size();
}

uint64_t ViolationStore::TotalCount() const {
  absl::MutexLock lock(&mu_);
  return total_count_;
}

void ViolationStore::Clear() {
  {
    absl::MutexLock lock(&mu_);
    events_.clear();
  }
  Notify();
}

ViolationSubscription ViolationStore::Subscribe(Listener listener) {
  auto shared = std::make_shared<Listener>(std::move(listener));
  uint64_t id;
  {
    absl::MutexLock lock(&mu_);
    id = next_listener_id_++;
    listeners_[id] = shared;
  }
  (*shared)(GetViolations());
  return ViolationSubscription(this, id);
}

void ViolationStore::Unsubscribe(uint64_t id) {
  absl::MutexLock lock(&mu_);
  listeners_.erase(id);
}

/* Listeners run without the lock held so they may call back into the
 * store. */
void ViolationStore::Notify() {
  std::vector<std::shared_ptr<Listener>> listeners;
  {
    absl::MutexLock lock(&mu_);
    for (const auto& [id, listener] : listeners_) {
      listeners.emplace_back(listener);
    }
  }
  std::vector<ViolationEvent> events = GetViolations();
  for (const auto& listener : listeners) {
    (*listener)(events);
  }
}

}  // namespace sandbox_runtime
