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
#ifndef SANDBOX_RUNTIME_COMMON_LIBS_UTILS_UNIQUE_FD_H
#define SANDBOX_RUNTIME_COMMON_LIBS_UTILS_UNIQUE_FD_H

#include <stddef.h>

#include <string>
#include <string_view>
#include <utility>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace sandbox_runtime {

class UniqueFd {
 public:
  UniqueFd() = default;
  explicit UniqueFd(int fd);
  UniqueFd(UniqueFd&&);
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  ~UniqueFd();
  UniqueFd& operator=(UniqueFd&&);

  /** Returns `{read_end, write_end}`, both close-on-exec. */
  static absl::StatusOr<std::pair<UniqueFd, UniqueFd>> Pipe();

  int Get() const;
  int Release();
  void Reset(int fd);

  /** Writes all of `data`, retrying on short writes and EINTR. */
  absl::Status WriteAll(std::string_view data) const;
  /** Returns 0 on EOF. */
  absl::StatusOr<size_t> Read(char* buf, size_t len) const;
  /** Reads until `len` bytes have arrived. EOF before that is an error. */
  absl::Status ReadExact(char* buf, size_t len) const;

 private:
  void Close();

  int fd_ = -1;
};

}  // namespace sandbox_runtime

#endif
