#include "demo_routes.hpp"

#include "stats.hpp"

RequestHandler make_demo_handler(const Stats& stats, int threads) {
  return [&stats, threads](const ParsedRequest& req) {
    if (req.path == "/") return ResponseSpec::text(200, "Cows will fly!");

    if (req.path == "/stats") return ResponseSpec::text(200, stats.render(threads));

    return ResponseSpec::text(404, "Not Found");
  };
}
