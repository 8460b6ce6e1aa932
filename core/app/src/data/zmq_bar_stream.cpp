#include "simex/data/zmq_bar_stream.hpp"
#include "simex/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace simex {

// -----------------------------------------------------------------------------
// decodeBar
// -----------------------------------------------------------------------------
std::optional<domain::Bar> decodeBar(const std::string& payload) {
  try {
    auto json = nlohmann::json::parse(payload);

    domain::Bar bar;
    bar.timestamp = ms_to_timestamp(json.at("timestamp_ms").get<std::int64_t>());
    bar.open = json.at("open").get<double>();
    bar.high = json.at("high").get<double>();
    bar.low = json.at("low").get<double>();
    bar.close = json.at("close").get<double>();
    bar.volume = json.value("volume", 0.0);
    return bar;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[ZmqBarStream] JSON decode error: " << e.what()
              << ", payload: " << payload << "\n";
    return std::nullopt;
  }
}

ZmqBarStream::ZmqBarStream(const ITimeProvider& clock,
                           ZmqStreamOptions options)
    : clock_(clock), options_(std::move(options)) {}

ZmqBarStream::~ZmqBarStream() { stop(); }

// -----------------------------------------------------------------------------
// start() / stop()
// -----------------------------------------------------------------------------
void ZmqBarStream::start(BarSink sink) {
  if (thread_.joinable()) {
    return;
  }
  sink_ = std::move(sink);
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread([this] {
    std::cout << "[ZmqBarStream] subscribing to " << options_.endpoint << "\n";
    run();
    std::cout << "[ZmqBarStream] stream thread exited.\n";
  });
}

void ZmqBarStream::stop() {
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool ZmqBarStream::stopRequested() {
  std::lock_guard lock(mutex_);
  return stop_requested_;
}

bool ZmqBarStream::waitFor(std::chrono::milliseconds delay) {
  std::unique_lock lock(mutex_);
  return !cv_.wait_for(lock, delay, [this] { return stop_requested_; });
}

// -----------------------------------------------------------------------------
// Socket management (stream thread only)
// -----------------------------------------------------------------------------
void ZmqBarStream::openSocket() {
  socket_ = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::sub);
  socket_->set(zmq::sockopt::linger, 0);
  socket_->set(zmq::sockopt::subscribe, "");
  socket_->set(zmq::sockopt::rcvtimeo,
               static_cast<int>(options_.recv_timeout.count()));
  socket_->connect(options_.endpoint);
}

void ZmqBarStream::closeSocket() {
  if (socket_) {
    socket_->close();
    socket_.reset();
  }
}

// -----------------------------------------------------------------------------
// run(): receive loop with reconnect and degraded fallback
// -----------------------------------------------------------------------------
void ZmqBarStream::run() {
  using Clock = std::chrono::steady_clock;

  auto last_data = Clock::now();
  bool connection_dead = false;

  while (!stopRequested()) {
    if (connection_dead) {
      closeSocket();
      if (reconnect_attempts_.load() >= options_.max_reconnect_attempts) {
        std::cerr << "[ZmqBarStream] " << reconnect_attempts_.load()
                  << " reconnect attempt(s) failed. Switching to synthetic "
                     "bars (degraded mode).\n";
        runDegraded();
        return;
      }
      int attempt = reconnect_attempts_.fetch_add(1) + 1;
      std::cerr << "[ZmqBarStream] no data from " << options_.endpoint
                << ", reconnecting in " << options_.reconnect_delay.count()
                << "ms (attempt " << attempt << "/"
                << options_.max_reconnect_attempts << ").\n";
      if (!waitFor(options_.reconnect_delay)) {
        break;
      }
      connection_dead = false;
      last_data = Clock::now();
    }

    try {
      if (!socket_) {
        openSocket();
      }

      zmq::message_t msg;
      auto result = socket_->recv(msg, zmq::recv_flags::none);

      if (!result.has_value()) {
        if (Clock::now() - last_data >= options_.stale_timeout) {
          connection_dead = true;
        }
        continue;
      }

      std::optional<domain::Bar> bar = decodeBar(msg.to_string());
      if (!bar) {
        continue;
      }
      last_data = Clock::now();
      reconnect_attempts_.store(0);
      received_.fetch_add(1);
      last_bar_ = *bar;
      sink_(std::move(*bar));

    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      std::cerr << "[ZmqBarStream] socket error: " << e.what() << "\n";
      connection_dead = true;
    }
  }

  closeSocket();
}

void ZmqBarStream::runDegraded() {
  degraded_.store(true);
  if (last_bar_) {
    std::cerr << "[ZmqBarStream] synthetic bars resume from close "
              << last_bar_->close << " at "
              << timestamp_to_ms(last_bar_->timestamp) << "ms.\n";
    fallback_.resume(last_bar_->close, timestamp_to_ms(last_bar_->timestamp));
  }
  do {
    sink_(fallback_.next(clock_.now_ms()));
    synthetic_.fetch_add(1);
  } while (waitFor(options_.poll_interval));
}

}  // namespace simex
