#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

struct ServerConfig {
  uint16_t port = 8080;  // 0 = any free port, see Server::bound_port()
  int threads = 8;
  int max_conns = 2000;
  size_t queue_cap = 4096;
  int idle_timeout_sec = 5;  // 0 = never time out idle connections
  std::string log_level = "info";
};

enum class ParseStatus { Ok, Help, Error };

// Seeds cfg from HTTPCORE_LOG_LEVEL when set.
void apply_env(ServerConfig& cfg);

// Numeric flags out of range keep their default. A flag without a value or an
// unknown flag is an Error with err filled in.
ParseStatus parse_args(int argc, const char* const* argv, ServerConfig& cfg,
                       std::string& err);

std::string usage();
