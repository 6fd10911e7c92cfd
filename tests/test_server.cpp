#include <catch2/catch.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <functional>
#include <string>
#include <thread>

#include "demo_routes.hpp"
#include "server.hpp"
#include "socket_io.hpp"
#include "stats.hpp"

namespace {

using HandlerFactory = std::function<RequestHandler(const Stats&)>;

// Runs a Server on an ephemeral port for the lifetime of the object.
struct RunningServer {
    Stats stats;
    Server server;
    std::thread thread;

    RunningServer(const ServerConfig& cfg, const HandlerFactory& make) : server(cfg, make(stats), stats) {
        thread = std::thread([this]() { server.start(); });
        for (int i = 0; i < 500 && server.bound_port() == 0; i++)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    ~RunningServer() {
        server.stop();
        thread.join();
    }

    uint16_t port() const { return server.bound_port(); }
};

ServerConfig test_config() {
    ServerConfig cfg;
    cfg.port = 0;
    cfg.threads = 2;
    cfg.max_conns = 16;
    cfg.queue_cap = 16;
    cfg.idle_timeout_sec = 2;
    return cfg;
}

HandlerFactory echo_path() {
    return [](const Stats&) -> RequestHandler {
        return [](const ParsedRequest& req) { return ResponseSpec::text(200, "path=" + req.path); };
    };
}

// Connected loopback client with a receive timeout so a broken server fails
// the test instead of hanging it.
struct Client {
    int fd = -1;

    explicit Client(uint16_t port) {
        fd = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (fd >= 0 && ::connect(fd, (sockaddr*)&addr, sizeof(addr)) < 0) {
            ::close(fd);
            fd = -1;
        }
        if (fd >= 0) set_recv_timeout(fd, 5);
    }

    ~Client() { hang_up(); }

    void hang_up() {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }

    bool send(const std::string& s) const { return send_str(fd, s); }

    // Reads one response framed by its Content-Length. Empty on EOF or timeout.
    std::string read_response() {
        char tmp[4096];
        while (true) {
            auto end = pending.find("\r\n\r\n");
            if (end != std::string::npos) {
                size_t len = 0;
                auto cl = pending.find("Content-Length: ");
                if (cl != std::string::npos && cl < end) len = std::stoul(pending.substr(cl + 16));
                if (pending.size() >= end + 4 + len) {
                    std::string out = pending.substr(0, end + 4 + len);
                    pending.erase(0, end + 4 + len);
                    return out;
                }
            }
            RecvResult r = recv_some(fd, tmp, sizeof(tmp));
            if (r.status != RecvStatus::Data) return std::string();
            pending.append(tmp, r.bytes);
        }
    }

    // true when the server closed the connection, false on timeout or error.
    bool read_to_eof(std::string& out) {
        char tmp[4096];
        out = pending;
        pending.clear();
        while (true) {
            RecvResult r = recv_some(fd, tmp, sizeof(tmp));
            if (r.status == RecvStatus::PeerClosed) return true;
            if (r.status != RecvStatus::Data) return false;
            out.append(tmp, r.bytes);
        }
    }

    std::string pending;
};

const std::string kKeepAliveGet = "GET / HTTP/1.1\r\nConnection: keep-alive\r\n\r\n";

std::string body_of(const std::string& wire) {
    auto end = wire.find("\r\n\r\n");
    return end == std::string::npos ? std::string() : wire.substr(end + 4);
}

}  // namespace

TEST_CASE("server binds an ephemeral port and serves the demo routes") {
    ServerConfig cfg = test_config();
    RunningServer rs(cfg, [&cfg](const Stats& stats) { return make_demo_handler(stats, cfg.threads); });
    REQUIRE(rs.port() != 0);

    Client c(rs.port());
    REQUIRE(c.fd >= 0);
    REQUIRE(c.send(kKeepAliveGet));
    std::string resp = c.read_response();
    REQUIRE(resp.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    REQUIRE(body_of(resp) == "Cows will fly!");
    REQUIRE(rs.stats.total_requests() == 1);
}

TEST_CASE("server answers pipelined keep-alive requests in order") {
    RunningServer rs(test_config(), echo_path());
    REQUIRE(rs.port() != 0);

    Client c(rs.port());
    REQUIRE(c.fd >= 0);
    REQUIRE(c.send("GET /a HTTP/1.1\r\nConnection: keep-alive\r\n\r\n"
                   "POST /b HTTP/1.1\r\nConnection: keep-alive\r\nContent-Length: 2\r\n\r\nhi"
                   "GET /c HTTP/1.1\r\nConnection: close\r\n\r\n"));

    REQUIRE(body_of(c.read_response()) == "path=/a");
    REQUIRE(body_of(c.read_response()) == "path=/b");
    std::string last = c.read_response();
    REQUIRE(body_of(last) == "path=/c");
    REQUIRE(last.find("Connection: close\r\n") != std::string::npos);

    std::string rest;
    REQUIRE(c.read_to_eof(rest));
    REQUIRE(rest.empty());
    REQUIRE(rs.stats.total_requests() == 3);
}

TEST_CASE("server turns away connections over the cap") {
    ServerConfig cfg = test_config();
    cfg.max_conns = 1;
    RunningServer rs(cfg, echo_path());
    REQUIRE(rs.port() != 0);

    Client first(rs.port());
    REQUIRE(first.send(kKeepAliveGet));
    REQUIRE(body_of(first.read_response()) == "path=/");

    Client second(rs.port());
    std::string wire;
    REQUIRE(second.read_to_eof(wire));
    REQUIRE(wire.rfind("HTTP/1.1 500 Internal Server Error\r\n", 0) == 0);
    REQUIRE(body_of(wire) == "server busy");

    // The connection holding the slot is unaffected.
    REQUIRE(first.send(kKeepAliveGet));
    REQUIRE(body_of(first.read_response()) == "path=/");
}

TEST_CASE("server answers busy when every worker and queue slot is taken") {
    ServerConfig cfg = test_config();
    cfg.threads = 1;
    cfg.queue_cap = 1;
    RunningServer rs(cfg, echo_path());
    REQUIRE(rs.port() != 0);

    // Occupies the only worker.
    Client held(rs.port());
    REQUIRE(held.send(kKeepAliveGet));
    REQUIRE(body_of(held.read_response()) == "path=/");

    // Fills the only queue slot.
    Client queued(rs.port());
    REQUIRE(queued.send("GET /queued HTTP/1.1\r\nConnection: close\r\n\r\n"));

    Client refused(rs.port());
    std::string wire;
    REQUIRE(refused.read_to_eof(wire));
    REQUIRE(wire.rfind("HTTP/1.1 500 Internal Server Error\r\n", 0) == 0);
    REQUIRE(body_of(wire) == "server busy");

    // Freeing the worker lets the queued connection through.
    held.hang_up();
    REQUIRE(body_of(queued.read_response()) == "path=/queued");
}

TEST_CASE("server closes connections that stay idle") {
    ServerConfig cfg = test_config();
    cfg.idle_timeout_sec = 1;
    RunningServer rs(cfg, echo_path());
    REQUIRE(rs.port() != 0);

    Client c(rs.port());
    REQUIRE(c.send(kKeepAliveGet));
    REQUIRE(body_of(c.read_response()) == "path=/");

    auto t0 = std::chrono::steady_clock::now();
    std::string rest;
    REQUIRE(c.read_to_eof(rest));
    REQUIRE(rest.empty());
    REQUIRE(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(4));
}
