#pragma once

#include "net/socket_address.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

namespace fimgate {

// Byte relay from a public listen address to an internal target. Each
// accepted connection gets a fresh upstream connection and its own relay
// thread; payload is never inspected, so plaintext and TLS behave the same.
class ConnectionProxy {
 public:
  ConnectionProxy(std::string name, SocketAddress listen_address,
                  SocketAddress target_address, std::shared_ptr<Logger> logger,
                  MetricsRegistry *metrics = nullptr);
  ~ConnectionProxy();

  ConnectionProxy(const ConnectionProxy &) = delete;
  ConnectionProxy &operator=(const ConnectionProxy &) = delete;

  // Binds synchronously and starts accepting. Throws ListenerBindError.
  void Start();
  // Closes the listener, tears down live pairs and waits for their threads.
  void Stop();

  int BoundPort() const { return bound_port_.load(); }
  int ActivePairs() const;

 private:
  void Run();
  void RelayPair(int client_fd);
  // Copies bytes until EOF or error. Returns bytes moved.
  std::size_t Pump(int from_fd, int to_fd);

  void Track(int fd);
  void Untrack(int fd);

  std::string name_;
  SocketAddress listen_address_;
  SocketAddress target_address_;
  std::shared_ptr<Logger> logger_;
  MetricsRegistry *metrics_;

  std::atomic<bool> running_{false};
  std::atomic<int> listen_fd_{-1};
  std::atomic<int> bound_port_{-1};
  std::thread accept_thread_;

  mutable std::mutex mutex_;
  std::condition_variable drained_cv_;
  std::unordered_set<int> live_fds_;
  int active_pairs_{0};
};

} // namespace fimgate
