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
#ifndef SANDBOX_RUNTIME_HOST_LIBS_NETWORK_PROXY_SERVER_H
#define SANDBOX_RUNTIME_HOST_LIBS_NETWORK_PROXY_SERVER_H

#include <stdint.h>

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <absl/base/thread_annotations.h>
#include <absl/status/statusor.h>
#include <absl/synchronization/mutex.h>

#include "common/libs/utils/unique_fd.h"

namespace sandbox_runtime {

/** What a connection handler may see of the server. */
class ServerStop {
 public:
  explicit ServerStop(int fd) : fd_(fd) {}

  /** Becomes readable, and stays readable, once the server is closing. */
  int Fd() const { return fd_; }
  bool Requested() const;

 private:
  int fd_;
};

/** Accepts TCP connections and runs `handler` for each on its own thread.
 *
 * The handler borrows the client socket, which is closed when it returns.
 * `Close` stops accepting, shuts down every open client socket and joins
 * every handler. */
class ProxyServer {
 public:
  using Handler = std::function<void(int client, const ServerStop& stop)>;

  static absl::StatusOr<std::unique_ptr<ProxyServer>> Listen(
      const std::string& name, const std::string& host, uint16_t port,
      Handler handler);

  ProxyServer(const ProxyServer&) = delete;
  ProxyServer& operator=(const ProxyServer&) = delete;
  ~ProxyServer();

  uint16_t Port() const { return port_; }

  /** Idempotent. */
  void Close();

 private:
  ProxyServer(std::string name, UniqueFd listener, UniqueFd stop,
              uint16_t port, Handler handler);

  void AcceptLoop();
  void Spawn(UniqueFd client);
  void JoinFinished();

  const std::string name_;
  UniqueFd listener_;
  UniqueFd stop_;
  const uint16_t port_;
  const Handler handler_;
  std::thread accept_thread_;

  absl::Mutex mu_;
  bool closing_ ABSL_GUARDED_BY(mu_) = false;
  uint64_t next_worker_id_ ABSL_GUARDED_BY(mu_) = 0;
  std::map<uint64_t, std::thread> workers_ ABSL_GUARDED_BY(mu_);
  std::vector<uint64_t> finished_ ABSL_GUARDED_BY(mu_);
  std::set<int> clients_ ABSL_GUARDED_BY(mu_);
};

}  // namespace sandbox_runtime

#endif
