#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

#include "config.hpp"
#include "connection_session.hpp"
#include "stats.hpp"

// Accepts TCP connections and runs one ConnectionSession per connection on a
// worker pool. What to answer is decided by the handler.
class Server {
 public:
  // stats must outlive the server.
  Server(const ServerConfig& cfg, RequestHandler handler, Stats& stats);

  bool start();  // blocking accept loop
  void stop();   // callable from a signal handler

  // Port actually bound, 0 until start() is listening. Differs from the
  // configured port when that was 0.
  uint16_t bound_port() const { return bound_port_.load(); }

 private:
  void reject_busy(int client_fd, const std::string& peer);
  void serve_client(int fd, const std::string& peer);

  ServerConfig cfg_;
  RequestHandler handler_;
  Stats& stats_;
  std::atomic<bool> running_{false};
  std::atomic<int> listen_fd_{-1};
  std::atomic<uint16_t> bound_port_{0};
  std::atomic<int> active_strict_{0};
};
