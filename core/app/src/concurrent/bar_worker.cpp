#include "simex/concurrent/bar_worker.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace simex {

BarWorker::BarWorker(std::size_t capacity, Handler handler)
    : queue_(capacity), handler_(std::move(handler)) {}

BarWorker::~BarWorker() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void BarWorker::start() {
  if (thread_.joinable() || queue_.closed()) {
    return;
  }
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop(): cancel, let the in-flight bar finish, drop the rest, join
// -----------------------------------------------------------------------------
void BarWorker::stop() {
  // Set before close() so the worker, woken by close(), sees the flag and
  // does not go on to drain the backlog.
  cancelled_.store(true);
  queue_.close();

  if (thread_.joinable()) {
    thread_.join();
  }

  std::size_t dropped = queue_.clear();
  if (dropped > 0) {
    discarded_.fetch_add(dropped);
    std::cout << "[BarWorker] discarded " << dropped
              << " queued bar(s) on cancellation.\n";
  }
}

bool BarWorker::submit(domain::Bar bar) { return queue_.push(std::move(bar)); }

// -----------------------------------------------------------------------------
// run() — worker loop
// -----------------------------------------------------------------------------
void BarWorker::run() {
  while (!cancelled_.load()) {
    std::optional<domain::Bar> bar = queue_.pop();
    if (!bar) {
      break;  // closed and empty
    }
    if (cancelled_.load()) {
      discarded_.fetch_add(1);
      break;
    }

    try {
      handler_(*bar);
      handled_.fetch_add(1);
    } catch (const std::exception& e) {
      failed_.fetch_add(1);
      std::cerr << "[BarWorker] bar handler threw: " << e.what()
                << ". Continuing with next bar.\n";
    }
  }
}

}  // namespace simex
