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
#include "host/libs/network/proxy_server.h"

#include <errno.h>
#include <poll.h>
#include <stdint.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <map>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/synchronization/mutex.h>

#include "common/libs/utils/poll_callback.h"
#include "common/libs/utils/unique_fd.h"
#include "host/libs/network/tcp_socket.h"

namespace sandbox_runtime {

bool ServerStop::Requested() const {
  pollfd stop = {.fd = fd_, .events = POLLIN};
  return poll(&stop, 1, 0) > 0;
}

absl::StatusOr<std::unique_ptr<ProxyServer>> ProxyServer::Listen(
    const std::string& name, const std::string& host, uint16_t port,
    Handler handler) {
  absl::StatusOr<UniqueFd> listener = ListenTcp(host, port);
  if (!listener.ok()) {
    return listener.status();
  }
  absl::StatusOr<uint16_t> bound = BoundPort(listener->Get());
  if (!bound.ok()) {
    return bound.status();
  }
  UniqueFd stop(eventfd(0, EFD_CLOEXEC));
  if (stop.Get() < 0) {
    return absl::ErrnoToStatus(errno, "`eventfd` failed");
  }
  std::unique_ptr<ProxyServer> server(
      new ProxyServer(name, std::move(*listener), std::move(stop), *bound,
                      std::move(handler)));
  server->accept_thread_ = std::thread([raw = server.get()] {
    raw->AcceptLoop();
  });
  LOG(INFO) << name << " proxy listening on " << host << ":" << *bound;
  return server;
}

ProxyServer::ProxyServer(std::string name, UniqueFd listener, UniqueFd stop,
                         uint16_t port, Handler handler)
    : name_(std::move(name)),
      listener_(std::move(listener)),
      stop_(std::move(stop)),
      port_(port),
      handler_(std::move(handler)) {}

ProxyServer::~ProxyServer() { Close(); }

void ProxyServer::AcceptLoop() {
  bool stopping = false;
  while (!stopping) {
    PollCallback poller;
    poller.Add(listener_.Get(), [this](short) -> absl::Status {
      UniqueFd client(accept4(listener_.Get(), nullptr, nullptr, SOCK_CLOEXEC));
      if (client.Get() < 0) {
        PLOG(ERROR) << name_ << ": Failed to accept incoming connection";
        return absl::OkStatus();
      }
      Spawn(std::move(client));
      return absl::OkStatus();
    });
    poller.Add(stop_.Get(), [&stopping](short) {
      stopping = true;
      return absl::OkStatus();
    });
    absl::StatusOr<int> polled = poller.Poll();
    if (!polled.ok()) {
      LOG(ERROR) << name_ << ": Accept loop failed: " << polled.status();
      return;
    }
    JoinFinished();
  }
  VLOG(1) << name_ << ": Accept loop stopped";
}

void ProxyServer::Spawn(UniqueFd client) {
  absl::MutexLock lock(&mu_);
  if (closing_) {
    return;
  }
  uint64_t id = next_worker_id_++;
  int client_fd = client.Get();
  clients_.insert(client_fd);
  workers_[id] = std::thread(
      [this, id, client = std::move(client)]() mutable {
        handler_(client.Get(), ServerStop(stop_.Get()));
        absl::MutexLock lock(&mu_);
        clients_.erase(client.Get());
        client.Reset(-1);
        finished_.push_back(id);
      });
}

void ProxyServer::JoinFinished() {
  std::vector<std::thread> done;
  {
    absl::MutexLock lock(&mu_);
    for (uint64_t id : finished_) {
      auto it = workers_.find(id);
      if (it != workers_.end()) {
        done.emplace_back(std::move(it->second));
        workers_.erase(it);
      }
    }
    finished_.clear();
  }
  for (auto& worker : done) {
    worker.join();
  }
}

void ProxyServer::Close() {
  std::map<uint64_t, std::thread> workers;
  {
    absl::MutexLock lock(&mu_);
    if (closing_) {
      return;
    }
    closing_ = true;
    uint64_t one = 1;
    if (write(stop_.Get(), &one, sizeof(one)) < 0) {
      PLOG(ERROR) << name_ << ": Failed to signal stop";
    }
    for (int client : clients_) {
      shutdown(client, SHUT_RDWR);
    }
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  {
    absl::MutexLock lock(&mu_);
    workers = std::move(workers_);
    workers_.clear();
    finished_.clear();
  }
  for (auto& [id, worker] : workers) {
    worker.join();
  }
  listener_.Reset(-1);
  VLOG(1) << name_ << ": Closed";
}

}  // namespace sandbox_runtime
