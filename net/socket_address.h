#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace fimgate {

// host:port pair as written in configuration ("127.0.0.1:11437", ":11437").
struct SocketAddress {
  std::string host;
  int port{0};

  std::string ToString() const { return host + ":" + std::to_string(port); }
};

// Parses "host:port" or ":port". An empty host becomes `default_host`.
// Returns nullopt for a missing or out-of-range port.
std::optional<SocketAddress> ParseSocketAddress(const std::string &text,
                                                const std::string &default_host);

class ListenerBindError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Creates a listening TCP socket. Throws ListenerBindError when the address
// cannot be resolved, bound or listened on.
int BindListener(const SocketAddress &address, int backlog = 128);

// Connects to `address`. Returns -1 on failure.
int DialTcp(const SocketAddress &address);

// True for accept() failures that clear up on their own: descriptor or
// memory exhaustion and connections reset before they were accepted.
bool IsTransientAcceptError(int error);

// Pause before retrying accept() after a transient failure.
constexpr int kAcceptRetryDelayMs = 100;

// Port a bound socket actually listens on (useful after binding port 0).
int LocalPort(int fd);

} // namespace fimgate
