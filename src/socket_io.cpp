#include "socket_io.hpp"

#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>

RecvResult recv_some(int fd, char* buf, size_t cap) {
  while (true) {
    ssize_t n = ::recv(fd, buf, cap, 0);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK)
        return {RecvStatus::TimedOut, 0};
      return {RecvStatus::Error, 0};
    }
    if (n == 0) return {RecvStatus::PeerClosed, 0};
    return {RecvStatus::Data, static_cast<size_t>(n)};
  }
}

bool send_all(int fd, const char* data, size_t len) {
  size_t sent = 0;
  while (sent < len) {
    // MSG_NOSIGNAL: a vanished peer is an error return, not SIGPIPE
    ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (n == 0) return false;
    sent += static_cast<size_t>(n);
  }
  return true;
}

bool send_str(int fd, const std::string& s) {
  return send_all(fd, s.data(), s.size());
}

bool set_recv_timeout(int fd, int seconds) {
  timeval tv{};
  tv.tv_sec = seconds;
  tv.tv_usec = 0;
  return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

std::string peer_name(const sockaddr_in& addr) {
  char ip[INET_ADDRSTRLEN] = {0};
  if (!::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip)))
    return "unknown";
  return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}
