#include "tradeagent/concurrent/worker_pool.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace tradeagent {

WorkerPool::WorkerPool(std::string name, std::size_t workers)
    : name_(std::move(name)), worker_count_(workers == 0 ? 1 : workers) {}

WorkerPool::~WorkerPool() { stop(); }

// -----------------------------------------------------------------------------
// start(): spawn workers once
// -----------------------------------------------------------------------------
void WorkerPool::start() {
  if (stopped_.load() || !threads_.empty()) {
    return;
  }

  running_.store(true);
  threads_.reserve(worker_count_);
  for (std::size_t i = 0; i < worker_count_; ++i) {
    threads_.emplace_back([this] { run(); });
  }
}

// -----------------------------------------------------------------------------
// stop(): close the queue, let workers drain it, join
// -----------------------------------------------------------------------------
void WorkerPool::stop() {
  bool expected = false;
  if (!stopped_.compare_exchange_strong(expected, true)) {
    return;
  }

  tasks_.close();
  for (auto& t : threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
  running_.store(false);

  // Tasks accepted while the pool was never started have no worker to run
  // them. Drop them here so their captured state is released.
  std::size_t dropped = 0;
  while (tasks_.try_pop()) {
    ++dropped;
  }
  if (dropped > 0) {
    std::cerr << "[" << name_ << "] dropped " << dropped
              << " task(s) queued before start()\n";
  }
}

bool WorkerPool::submit(Task task) {
  if (stopped_.load()) {
    return false;
  }
  return tasks_.push(std::move(task));
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void WorkerPool::run() {
  while (auto task = tasks_.pop()) {
    try {
      (*task)();
    } catch (const std::exception& e) {
      std::cerr << "[" << name_ << "] task failed: " << e.what() << "\n";
    }
  }
}

}  // namespace tradeagent
