#include "thread_pool.hpp"

#include <exception>
#include <utility>

#include "logger.hpp"

ThreadPool::ThreadPool(int threads, size_t queue_cap, std::string name)
    : threads_(threads), name_(std::move(name)), q_(queue_cap) {}

ThreadPool::~ThreadPool() { stop(); }

void ThreadPool::start() {
  if (running_.exchange(true)) return;

  for (int i = 0; i < threads_; i++) {
    workers_.emplace_back([this, i]() { worker_loop(i); });
  }
  log_debug(std::to_string(threads_) + " workers started", name_);
}

void ThreadPool::stop() {
  if (!running_.exchange(false)) return;

  q_.close();

  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }

  workers_.clear();
  log_debug("stopped after " + std::to_string(completed_.load()) + " jobs",
            name_);
}

bool ThreadPool::try_submit(Job job) { return q_.try_push(std::move(job)); }

// Drains the queue even after stop() so no accepted connection is leaked.
void ThreadPool::worker_loop(int id) {
  while (true) {
    auto job = q_.pop();
    if (!job.has_value()) break;
    run_job(id, *job);
  }
}

void ThreadPool::run_job(int id, Job& job) {
  try {
    job();
    completed_.fetch_add(1);
  } catch (const std::exception& e) {
    failed_.fetch_add(1);
    log_error("worker " + std::to_string(id) + " job failed: " + e.what(),
              name_);
  } catch (...) {
    failed_.fetch_add(1);
    log_error("worker " + std::to_string(id) + " job failed", name_);
  }
}
