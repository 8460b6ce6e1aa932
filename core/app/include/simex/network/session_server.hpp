#pragma once

#include "simex/concurrent/bounded_queue.hpp"
#include "simex/domain/trade.hpp"
#include "simex/time/time_utils.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <variant>

namespace simex {

// Published once when a session transitions to Halted.
struct HaltNotice {
  std::string reason;
  Timestamp timestamp{};
};

using Telemetry = std::variant<domain::Trade, HaltNotice>;

// -----------------------------------------------------------------------------
// SessionServer — ZeroMQ control and telemetry endpoint of a live session
// -----------------------------------------------------------------------------
//
// @brief  One thread serving two optional sockets:
//
//   1. REP command socket: each request string is passed to the command
//      handler (bound to LivePaperRunner::executeCommand()) and its JSON
//      reply is sent back. Commands are PING, STATUS and HALT.
//   2. PUB telemetry socket: one JSON line per fill and per halt, queued by
//      publish() from the session's worker thread and sent from here so
//      serialisation and socket I/O stay off the bar path.
//
// @details
// An empty endpoint disables that socket. publish() never blocks: when the
// telemetry queue is full the message is dropped and counted.
//
// A handler exception is turned into an {"ok": false, "error": ...} reply so
// the REP socket never loses its request/reply lockstep.
//
// Thread model:
//   start()/stop() from the owning thread; publish() from any thread; the
//   handler runs on the server thread.
//
// Ownership:
//   Owns the ZMQ context, both sockets, the telemetry queue and the thread.
// -----------------------------------------------------------------------------
class SessionServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  SessionServer(CommandHandler command_handler, std::string cmd_endpoint,
                std::string pub_endpoint);

  ~SessionServer();

  SessionServer(const SessionServer&) = delete;
  SessionServer& operator=(const SessionServer&) = delete;
  SessionServer(SessionServer&&) = delete;
  SessionServer& operator=(SessionServer&&) = delete;

  // Binds the enabled sockets and spawns the thread. Throws zmq::error_t if
  // a bind fails. No-op when already running.
  void start();

  // Publishes what is still queued, joins the thread, closes the sockets.
  void stop();

  bool publish(Telemetry message);

  bool running() const { return running_.load(); }

  // Actual endpoints after bind (a "*" port is resolved). Empty if the
  // socket is disabled or the server has not been started.
  const std::string& boundCommandEndpoint() const { return bound_cmd_; }
  const std::string& boundTelemetryEndpoint() const { return bound_pub_; }
  std::uint64_t droppedTelemetry() const { return dropped_.load(); }

  static std::string formatTelemetry(const Telemetry& message);

 private:
  static constexpr int kPollTimeoutMs = 50;
  static constexpr std::size_t kTelemetryCapacity = 4096;

  void run();
  void processTelemetry();
  void sendTelemetry(const Telemetry& message);
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;
  std::string bound_cmd_;
  std::string bound_pub_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  BoundedQueue<Telemetry> telemetry_queue_{kTelemetryCapacity};
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace simex
