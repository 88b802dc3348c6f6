#include "net/connection_proxy.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

#include <thread>
#include <utility>
#include <vector>

namespace fimgate {

namespace {
constexpr std::size_t kPumpBufferSize = 64 * 1024;
constexpr char kComponent[] = "proxy";
} // namespace

ConnectionProxy::ConnectionProxy(std::string name, SocketAddress listen_address,
                                 SocketAddress target_address,
                                 std::shared_ptr<Logger> logger,
                                 MetricsRegistry *metrics)
    : name_(std::move(name)), listen_address_(std::move(listen_address)),
      target_address_(std::move(target_address)), logger_(std::move(logger)),
      metrics_(metrics) {}

ConnectionProxy::~ConnectionProxy() { Stop(); }

void ConnectionProxy::Start() {
  if (running_) {
    return;
  }
  int fd = BindListener(listen_address_);
  listen_fd_.store(fd);
  bound_port_.store(LocalPort(fd));
  running_ = true;
  accept_thread_ = std::thread(&ConnectionProxy::Run, this);
  logger_->Info(kComponent,
                name_ + " relaying " + listen_address_.ToString() + " -> " +
                    target_address_.ToString(),
                "port=" + std::to_string(bound_port_.load()));
}

void ConnectionProxy::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  // Close the listening socket to unblock accept() in Run().
  int fd = listen_fd_.exchange(-1);
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  std::unique_lock<std::mutex> lock(mutex_);
  for (int live : live_fds_) {
    ::shutdown(live, SHUT_RDWR);
  }
  drained_cv_.wait(lock, [this] { return active_pairs_ == 0; });
}

int ConnectionProxy::ActivePairs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_pairs_;
}

void ConnectionProxy::Run() {
  bool accept_failing = false;
  while (running_) {
    int fd = listen_fd_.load();
    if (fd < 0) {
      break;
    }
    int client_fd = ::accept(fd, nullptr, nullptr);
    if (client_fd < 0) {
      int error = errno;
      if (!running_) {
        break;
      }
      if (error == EINTR || error == ECONNABORTED) {
        continue;
      }
      if (!IsTransientAcceptError(error)) {
        logger_->Error(kComponent, name_ + " accept loop terminated",
                       std::strerror(error));
        break;
      }
      if (!accept_failing) {
        logger_->Warn(kComponent, name_ + " accept failed, retrying",
                      std::strerror(error));
        accept_failing = true;
      }
      std::this_thread::sleep_for(
          std::chrono::milliseconds(kAcceptRetryDelayMs));
      continue;
    }
    if (accept_failing) {
      logger_->Info(kComponent, name_ + " accept recovered");
      accept_failing = false;
    }
    if (!running_) {
      ::close(client_fd);
      break;
    }
    if (metrics_) {
      metrics_->RecordProxyAccept();
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++active_pairs_;
    }
    std::thread(&ConnectionProxy::RelayPair, this, client_fd).detach();
  }
}

void ConnectionProxy::RelayPair(int client_fd) {
  Track(client_fd);
  int upstream_fd = DialTcp(target_address_);
  if (upstream_fd < 0) {
    logger_->Warn(kComponent, name_ + " upstream connect failed",
                  "target=" + target_address_.ToString());
    if (metrics_) {
      metrics_->RecordProxyDialFailure();
    }
  } else {
    Track(upstream_fd);
    std::size_t upstream_bytes = 0;
    std::thread inbound(
        [this, client_fd, upstream_fd, &upstream_bytes] {
          upstream_bytes = Pump(client_fd, upstream_fd);
        });
    std::size_t downstream_bytes = Pump(upstream_fd, client_fd);
    inbound.join();
    logger_->Debug(kComponent, name_ + " pair closed",
                   "in=" + std::to_string(upstream_bytes) +
                       " out=" + std::to_string(downstream_bytes));
    Untrack(upstream_fd);
    ::close(upstream_fd);
  }
  Untrack(client_fd);
  ::close(client_fd);

  std::lock_guard<std::mutex> lock(mutex_);
  --active_pairs_;
  drained_cv_.notify_all();
}

std::size_t ConnectionProxy::Pump(int from_fd, int to_fd) {
  std::vector<char> buffer(kPumpBufferSize);
  std::size_t moved = 0;
  while (true) {
    ssize_t received = ::recv(from_fd, buffer.data(), buffer.size(), 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    if (received == 0) {
      // Orderly close: forward the half-close so the peer sees EOF while the
      // opposite direction keeps draining.
      ::shutdown(to_fd, SHUT_WR);
      return moved;
    }
    if (received < 0) {
      ::shutdown(from_fd, SHUT_RDWR);
      ::shutdown(to_fd, SHUT_RDWR);
      return moved;
    }
    const char *data = buffer.data();
    std::size_t remaining = static_cast<std::size_t>(received);
    while (remaining > 0) {
      ssize_t sent = ::send(to_fd, data, remaining, MSG_NOSIGNAL);
      if (sent < 0 && errno == EINTR) {
        continue;
      }
      if (sent <= 0) {
        ::shutdown(from_fd, SHUT_RDWR);
        ::shutdown(to_fd, SHUT_RDWR);
        return moved;
      }
      data += sent;
      remaining -= static_cast<std::size_t>(sent);
    }
    moved += static_cast<std::size_t>(received);
    if (metrics_) {
      metrics_->RecordProxyBytes(static_cast<std::size_t>(received));
    }
  }
}

void ConnectionProxy::Track(int fd) {
  std::lock_guard<std::mutex> lock(mutex_);
  live_fds_.insert(fd);
  if (!running_) {
    ::shutdown(fd, SHUT_RDWR);
  }
}

void ConnectionProxy::Untrack(int fd) {
  std::lock_guard<std::mutex> lock(mutex_);
  live_fds_.erase(fd);
}

} // namespace fimgate
