#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

// Server-wide counters, updated concurrently by connection workers.
class Stats {
 public:
  void on_start();
  void inc_active();
  void dec_active();
  void inc_requests();
  // Classifies by status: 2xx/3xx, 4xx (400 also counted as a bad request), 5xx.
  void on_response(int status);

  int active() const { return active_.load(); }
  uint64_t total_requests() const { return total_requests_.load(); }
  uint64_t bad_requests() const { return bad_requests_.load(); }
  uint64_t responses_4xx() const { return responses_4xx_.load(); }

  std::string render(int threads) const;

 private:
  std::chrono::steady_clock::time_point start_ = std::chrono::steady_clock::now();
  std::atomic<int> active_{0};
  std::atomic<uint64_t> total_requests_{0};
  std::atomic<uint64_t> responses_ok_{0};
  std::atomic<uint64_t> responses_4xx_{0};
  std::atomic<uint64_t> responses_5xx_{0};
  std::atomic<uint64_t> bad_requests_{0};
};
