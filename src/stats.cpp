#include "stats.hpp"

#include <sstream>

void Stats::on_start() { start_ = std::chrono::steady_clock::now(); }

void Stats::inc_active() { active_.fetch_add(1); }

void Stats::dec_active() { active_.fetch_sub(1); }

void Stats::inc_requests() { total_requests_.fetch_add(1); }

void Stats::on_response(int status) {
  if (status >= 500)
    responses_5xx_.fetch_add(1);
  else if (status >= 400)
    responses_4xx_.fetch_add(1);
  else
    responses_ok_.fetch_add(1);

  if (status == 400) bad_requests_.fetch_add(1);
}

std::string Stats::render(int threads) const {
  auto now = std::chrono::steady_clock::now();
  auto up =
      std::chrono::duration_cast<std::chrono::seconds>(now - start_).count();

  std::ostringstream out;

  out << "UPTIME " << up << "s\n";
  out << "ACTIVE_CONNECTIONS " << active_.load() << "\n";
  out << "TOTAL_REQUESTS " << total_requests_.load() << "\n";
  out << "RESPONSES_OK " << responses_ok_.load() << "\n";
  out << "RESPONSES_4XX " << responses_4xx_.load() << "\n";
  out << "RESPONSES_5XX " << responses_5xx_.load() << "\n";
  out << "BAD_REQUESTS " << bad_requests_.load() << "\n";
  out << "THREADS " << threads << "\n";

  return out.str();
}
