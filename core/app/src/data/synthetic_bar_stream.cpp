#include "simex/data/synthetic_bar_stream.hpp"

#include <iostream>
#include <utility>

namespace simex {

SyntheticBarStream::SyntheticBarStream(const ITimeProvider& clock,
                                       std::chrono::milliseconds interval,
                                       std::uint32_t seed)
    : clock_(clock), interval_(interval), generator_(seed) {}

SyntheticBarStream::~SyntheticBarStream() { stop(); }

void SyntheticBarStream::start(BarSink sink) {
  if (thread_.joinable()) {
    return;
  }
  sink_ = std::move(sink);
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread([this] { run(); });
  std::cout << "[SyntheticBarStream] started, interval " << interval_.count()
            << "ms.\n";
}

void SyntheticBarStream::stop() {
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
    std::cout << "[SyntheticBarStream] stopped after " << emitted_.load()
              << " bar(s).\n";
  }
}

void SyntheticBarStream::run() {
  std::unique_lock lock(mutex_);
  while (!stop_requested_) {
    lock.unlock();
    sink_(generator_.next(clock_.now_ms()));
    emitted_.fetch_add(1);
    lock.lock();

    cv_.wait_for(lock, interval_, [this] { return stop_requested_; });
  }
}

}  // namespace simex
