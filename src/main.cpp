#include <csignal>
#include <iostream>
#include <string>

#include "config.hpp"
#include "demo_routes.hpp"
#include "logger.hpp"
#include "server.hpp"
#include "stats.hpp"

static Server* g_server = nullptr;

static void on_signal(int) {
  if (g_server) g_server->stop();
}

int main(int argc, char** argv) {
  ServerConfig cfg;
  apply_env(cfg);

  std::string err;
  switch (parse_args(argc, argv, cfg, err)) {
    case ParseStatus::Help:
      std::cout << usage();
      return 0;
    case ParseStatus::Error:
      std::cerr << err << "\n" << usage();
      return 1;
    case ParseStatus::Ok:
      break;
  }

  if (!set_log_level_from_string(cfg.log_level))
    log_warn("unknown log level '" + cfg.log_level + "', using info", "main");

  Stats stats;
  Server s(cfg, make_demo_handler(stats, cfg.threads), stats);

  g_server = &s;
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  bool ok = s.start();
  g_server = nullptr;
  return ok ? 0 : 1;
}
