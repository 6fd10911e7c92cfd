#pragma once

#include <netinet/in.h>

#include <cstddef>
#include <string>

enum class RecvStatus { Data, PeerClosed, TimedOut, Error };

struct RecvResult {
  RecvStatus status;
  size_t bytes;
};

// One recv() into buf, retrying on EINTR.
RecvResult recv_some(int fd, char* buf, size_t cap);

// Loops over short writes. false on error or if the peer stops reading.
bool send_all(int fd, const char* data, size_t len);
bool send_str(int fd, const std::string& s);

// SO_RCVTIMEO; 0 disables the timeout.
bool set_recv_timeout(int fd, int seconds);

// "a.b.c.d:port"
std::string peer_name(const sockaddr_in& addr);
