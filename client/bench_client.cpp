#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

static bool send_all(int fd, const char* data, size_t len) {
  size_t sent = 0;
  while (sent < len) {
    ssize_t n = send(fd, data + sent, len - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (n == 0) return false;
    sent += (size_t)n;
  }
  return true;
}

// Reads one response framed by Content-Length. Leftover bytes from a
// pipelined batch stay in buf for the next call.
static bool recv_response(int fd, std::string& buf, int& status) {
  while (true) {
    auto hdr_end = buf.find("\r\n\r\n");
    if (hdr_end != std::string::npos) {
      std::string head = buf.substr(0, hdr_end);
      for (auto& c : head)
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));

      size_t body_len = 0;
      auto cl = head.find("content-length:");
      if (cl != std::string::npos)
        body_len = std::strtoul(head.c_str() + cl + 15, nullptr, 10);

      size_t total = hdr_end + 4 + body_len;
      if (buf.size() >= total) {
        status = std::atoi(buf.c_str() + 9);  // "HTTP/1.1 NNN"
        buf.erase(0, total);
        return true;
      }
    }

    char tmp[4096];
    ssize_t n = recv(fd, tmp, sizeof(tmp), 0);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    buf.append(tmp, tmp + n);
  }
}

static int connect_to(const std::string& host, int port) {
  int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) return -1;

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons((uint16_t)port);
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    close(fd);
    return -1;
  }

  if (connect(fd, (sockaddr*)&addr, sizeof(addr)) < 0) {
    close(fd);
    return -1;
  }
  return fd;
}

int main(int argc, char** argv) {
  std::string host = "127.0.0.1";
  int port = 8080;
  int clients = 50;
  int seconds = 5;
  int pipeline = 1;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    if (a == "--help") {
      std::cout << "httpcore_bench --host 127.0.0.1 --port 8080 --clients 100 "
                   "--seconds 10 --pipeline 4\n";
      return 0;
    }
    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << a << "\n";
      return 1;
    }
    std::string v = argv[++i];
    if (a == "--host")
      host = v;
    else if (a == "--port")
      port = std::atoi(v.c_str());
    else if (a == "--clients")
      clients = std::atoi(v.c_str());
    else if (a == "--seconds")
      seconds = std::atoi(v.c_str());
    else if (a == "--pipeline")
      pipeline = std::atoi(v.c_str());
  }
  if (pipeline < 1) pipeline = 1;

  std::atomic<bool> start{false};
  std::atomic<bool> stop{false};
  std::atomic<uint64_t> ok_responses{0};
  std::atomic<uint64_t> failed{0};

  auto worker = [&](int id) {
    (void)id;
    int fd = connect_to(host, port);
    if (fd < 0) {
      failed.fetch_add(1);
      return;
    }

    while (!start.load()) std::this_thread::yield();

    // N requests back to back in one write, then N responses in order
    std::string batch;
    for (int i = 0; i < pipeline; i++)
      batch += "GET / HTTP/1.1\r\nHost: " + host +
               "\r\nConnection: keep-alive\r\n\r\n";

    std::string buf;
    while (!stop.load()) {
      if (!send_all(fd, batch.data(), batch.size())) break;

      bool alive = true;
      for (int i = 0; i < pipeline; i++) {
        int status = 0;
        if (!recv_response(fd, buf, status)) {
          alive = false;
          break;
        }
        if (status == 200)
          ok_responses.fetch_add(1);
        else
          failed.fetch_add(1);
      }
      if (!alive) break;
    }

    close(fd);
  };

  std::vector<std::thread> ts;
  ts.reserve(clients);
  for (int i = 0; i < clients; i++) ts.emplace_back(worker, i);

  auto t0 = std::chrono::steady_clock::now();
  start.store(true);
  std::this_thread::sleep_for(std::chrono::seconds(seconds));
  stop.store(true);

  for (auto& t : ts) t.join();
  auto t1 = std::chrono::steady_clock::now();

  double sec = std::chrono::duration<double>(t1 - t0).count();
  uint64_t total = ok_responses.load();
  std::cout << "clients=" << clients << " pipeline=" << pipeline
            << " seconds=" << sec << " requests=" << total
            << " failed=" << failed.load() << " req/sec=" << (total / sec)
            << "\n";
}
