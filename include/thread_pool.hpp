#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include "blocking_queue.hpp"

// Fixed set of workers; each job typically serves one connection to the end.
class ThreadPool {
 public:
  using Job = std::function<void()>;

  ThreadPool(int threads, size_t queue_cap, std::string name = "pool");
  ~ThreadPool();

  void start();
  // Closes the queue, lets queued jobs drain, joins the workers.
  void stop();

  // false if stopped or the queue is full.
  bool try_submit(Job job);

  int threads() const { return threads_; }
  uint64_t completed() const { return completed_.load(); }
  uint64_t failed() const { return failed_.load(); }

 private:
  void worker_loop(int id);
  void run_job(int id, Job& job);

  int threads_;
  std::string name_;
  BlockingQueue<Job> q_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> completed_{0};
  std::atomic<uint64_t> failed_{0};
};
