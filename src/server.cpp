#include "server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <utility>

#include "logger.hpp"
#include "socket_io.hpp"
#include "thread_pool.hpp"

static constexpr const char* kTag = "server";

// Closes the client socket and releases its connection slot.
struct ClientSlot {
  int fd;
  Stats& stats;
  std::atomic<int>& active;

  ~ClientSlot() {
    ::close(fd);
    stats.dec_active();
    active.fetch_sub(1);
  }
};

Server::Server(const ServerConfig& cfg, RequestHandler handler, Stats& stats)
    : cfg_(cfg), handler_(std::move(handler)), stats_(stats) {}

bool Server::start() {
  stats_.on_start();
  running_.store(true);

  int listen_fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd < 0) {
    perror("socket");
    return false;
  }

  listen_fd_.store(listen_fd);

  int yes = 1;
  if (setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) < 0) {
    perror("setsockopt");
    ::close(listen_fd);
    listen_fd_.store(-1);
    return false;
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(cfg_.port);

  if (bind(listen_fd, (sockaddr*)&addr, sizeof(addr)) < 0) {
    perror("bind");
    ::close(listen_fd);
    listen_fd_.store(-1);
    return false;
  }

  if (listen(listen_fd, 256) < 0) {
    perror("listen");
    ::close(listen_fd);
    listen_fd_.store(-1);
    return false;
  }

  sockaddr_in bound{};
  socklen_t bound_len = sizeof(bound);
  if (getsockname(listen_fd, (sockaddr*)&bound, &bound_len) < 0) {
    perror("getsockname");
    ::close(listen_fd);
    listen_fd_.store(-1);
    return false;
  }
  bound_port_.store(ntohs(bound.sin_port));

  ThreadPool pool(cfg_.threads, cfg_.queue_cap, "workers");
  pool.start();

  log_info("listening on port " + std::to_string(bound_port_.load()) +
               " with " + std::to_string(cfg_.threads) + " threads",
           kTag);

  while (running_.load()) {
    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);
    int client_fd = ::accept(listen_fd, (sockaddr*)&client_addr, &client_len);

    if (client_fd < 0) {
      // stop() closed the socket
      if (!running_.load()) break;
      if (errno == EINTR) continue;
      if (errno == EBADF || errno == EINVAL) break;
      perror("accept");
      continue;
    }

    std::string peer = peer_name(client_addr);

    stats_.inc_active();
    int now = active_strict_.fetch_add(1) + 1;
    if (now > cfg_.max_conns) {
      reject_busy(client_fd, peer);
      continue;
    }

    // Every worker busy and the backlog full: answer now, never block accept.
    bool ok = pool.try_submit([this, client_fd, peer]() {
      ClientSlot slot{client_fd, stats_, active_strict_};
      serve_client(slot.fd, peer);
    });
    if (!ok) reject_busy(client_fd, peer);
  }

  // Queued connections are still served before the workers exit.
  pool.stop();

  int fd = listen_fd_.exchange(-1);
  if (fd != -1) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }

  bound_port_.store(0);
  log_info("stopped after " + std::to_string(stats_.total_requests()) +
               " requests",
           kTag);
  return true;
}

void Server::stop() {
  running_.store(false);

  // Closing the listen fd breaks accept()
  int fd = listen_fd_.exchange(-1);
  if (fd != -1) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
}

void Server::reject_busy(int client_fd, const std::string& peer) {
  log_warn("server busy, rejecting " + peer, kTag);
  send_str(client_fd, encode_response(500, std::string("server busy"),
                                      {{"Connection", "close"}}));
  ::close(client_fd);
  stats_.dec_active();
  active_strict_.fetch_sub(1);
}

void Server::serve_client(int fd, const std::string& peer) {
  log_debug("connection from " + peer, kTag);

  if (cfg_.idle_timeout_sec > 0 && !set_recv_timeout(fd, cfg_.idle_timeout_sec))
    log_warn("could not set receive timeout for " + peer + ": " +
                 std::strerror(errno),
             kTag);

  ConnectionSession session(
      [this](const ParsedRequest& req) {
        stats_.inc_requests();
        return handler_(req);
      },
      [fd](const std::string& wire) { return send_str(fd, wire); }, peer);
  session.set_observer([this](int status) { stats_.on_response(status); });

  char tmp[4096];
  while (running_.load() && session.state() != SessionState::Closed) {
    RecvResult r = recv_some(fd, tmp, sizeof(tmp));
    switch (r.status) {
      case RecvStatus::Data:
        session.on_data(tmp, r.bytes);
        break;
      case RecvStatus::PeerClosed:
        session.on_peer_closed();
        break;
      case RecvStatus::TimedOut:
        log_debug(peer + " idle for " + std::to_string(cfg_.idle_timeout_sec) +
                      "s, closing",
                  kTag);
        session.on_peer_closed();
        break;
      case RecvStatus::Error:
        log_debug("recv from " + peer + " failed: " + std::strerror(errno),
                  kTag);
        session.on_peer_closed();
        break;
    }
  }

  session.on_peer_closed();
  log_debug(peer + " closed after " + std::to_string(session.exchanges()) +
                " exchanges",
            kTag);
}
