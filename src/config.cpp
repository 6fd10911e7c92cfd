#include "config.hpp"

#include <cstdlib>
#include <stdexcept>

static uint16_t parse_u16(const char* s, uint16_t def) {
  try {
    int v = std::stoi(s);
    if (v < 0 || v > 65535) return def;
    return static_cast<uint16_t>(v);
  } catch (const std::logic_error&) {
    return def;
  }
}

static int parse_i32(const char* s, int def, int lo, int hi) {
  try {
    int v = std::stoi(s);
    if (v < lo || v > hi) return def;
    return v;
  } catch (const std::logic_error&) {
    return def;
  }
}

void apply_env(ServerConfig& cfg) {
  if (const char* lvl = std::getenv("HTTPCORE_LOG_LEVEL")) {
    if (*lvl) cfg.log_level = lvl;
  }
}

ParseStatus parse_args(int argc, const char* const* argv, ServerConfig& cfg,
                       std::string& err) {
  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];

    if (a == "--help") return ParseStatus::Help;

    if (i + 1 >= argc) {
      err = a.rfind("--", 0) == 0 ? "Missing value for " + a
                                  : "Unknown argument " + a;
      return ParseStatus::Error;
    }
    const char* v = argv[++i];

    if (a == "--port")
      cfg.port = parse_u16(v, cfg.port);
    else if (a == "--threads")
      cfg.threads = parse_i32(v, cfg.threads, 1, 256);
    else if (a == "--max-conns")
      cfg.max_conns = parse_i32(v, cfg.max_conns, 1, 2000000);
    else if (a == "--queue-cap")
      cfg.queue_cap = static_cast<size_t>(
          parse_i32(v, static_cast<int>(cfg.queue_cap), 1, 2000000));
    else if (a == "--idle-timeout")
      cfg.idle_timeout_sec = parse_i32(v, cfg.idle_timeout_sec, 0, 3600);
    else if (a == "--log-level")
      cfg.log_level = v;
    else {
      err = "Unknown argument " + a;
      return ParseStatus::Error;
    }
  }
  return ParseStatus::Ok;
}

std::string usage() {
  return "Usage: httpcore_server [--port N] [--threads N] [--max-conns N] "
         "[--queue-cap N]\n"
         "                       [--idle-timeout SEC] [--log-level "
         "debug|info|warn|error]\n"
         "Env: HTTPCORE_LOG_LEVEL\n";
}
