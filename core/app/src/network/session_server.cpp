#include "simex/network/session_server.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace simex {

SessionServer::SessionServer(CommandHandler command_handler,
                             std::string cmd_endpoint,
                             std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

SessionServer::~SessionServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create and bind the enabled sockets, spawn the server thread
// -----------------------------------------------------------------------------
void SessionServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  if (!cmd_endpoint_.empty()) {
    cmd_socket_ =
        std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
    cmd_socket_->set(zmq::sockopt::linger, 0);
    cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
    cmd_socket_->bind(cmd_endpoint_);
    bound_cmd_ = cmd_socket_->get(zmq::sockopt::last_endpoint);
  }
  if (!pub_endpoint_.empty()) {
    pub_socket_ =
        std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
    pub_socket_->set(zmq::sockopt::linger, 0);
    pub_socket_->bind(pub_endpoint_);
    bound_pub_ = pub_socket_->get(zmq::sockopt::last_endpoint);
  }

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[SessionServer] started. CMD="
            << (bound_cmd_.empty() ? "<disabled>" : bound_cmd_)
            << " PUB=" << (bound_pub_.empty() ? "<disabled>" : bound_pub_)
            << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal, join, close
// -----------------------------------------------------------------------------
void SessionServer::stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[SessionServer] stopped.\n";
}

bool SessionServer::publish(Telemetry message) {
  if (!telemetry_queue_.try_push(std::move(message))) {
    dropped_.fetch_add(1);
    return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// run(): alternate between telemetry drain and command poll
// -----------------------------------------------------------------------------
void SessionServer::run() {
  while (running_.load()) {
    processTelemetry();
    if (cmd_socket_) {
      processCommands();
    } else if (auto message = telemetry_queue_.pop_for(
                   std::chrono::milliseconds(kPollTimeoutMs))) {
      sendTelemetry(*message);
    }
  }

  // Final drain before shutdown.
  processTelemetry();
}

void SessionServer::processTelemetry() {
  while (auto message = telemetry_queue_.try_pop()) {
    sendTelemetry(*message);
  }
}

void SessionServer::sendTelemetry(const Telemetry& message) {
  if (!pub_socket_) {
    return;
  }
  std::string line = formatTelemetry(message);
  try {
    zmq::message_t msg(line.data(), line.size());
    auto sent = pub_socket_->send(msg, zmq::send_flags::dontwait);
    if (!sent.has_value()) {
      dropped_.fetch_add(1);
    }
  } catch (const zmq::error_t& e) {
    dropped_.fetch_add(1);
    std::cerr << "[SessionServer] telemetry send failed: " << e.what() << "\n";
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one poll of the REP socket
// -----------------------------------------------------------------------------
void SessionServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() != EINTR) {
      std::cerr << "[SessionServer] command recv failed: " << e.what() << "\n";
    }
    return;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd = request.to_string();
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[SessionServer] command '" << cmd << "' failed: " << e.what()
              << "\n";
    response = nlohmann::json{{"ok", false}, {"error", e.what()}}.dump();
  }

  try {
    zmq::message_t reply(response.data(), response.size());
    cmd_socket_->send(reply, zmq::send_flags::none);
  } catch (const zmq::error_t& e) {
    std::cerr << "[SessionServer] reply send failed: " << e.what() << "\n";
  }
}

// -----------------------------------------------------------------------------
// formatTelemetry()
// -----------------------------------------------------------------------------
std::string SessionServer::formatTelemetry(const Telemetry& message) {
  nlohmann::json j;
  if (auto* trade = std::get_if<domain::Trade>(&message)) {
    j["type"] = "fill";
    j["order_id"] = trade->order_id;
    j["symbol"] = trade->symbol;
    j["side"] = domain::sideToString(trade->side);
    j["quantity"] = trade->quantity;
    j["price"] = trade->price;
    j["fee"] = trade->fee;
    j["timestamp_ms"] = timestamp_to_ms(trade->timestamp);
  } else if (auto* halt = std::get_if<HaltNotice>(&message)) {
    j["type"] = "halt";
    j["reason"] = halt->reason;
    j["timestamp_ms"] = timestamp_to_ms(halt->timestamp);
  }
  return j.dump();
}

}  // namespace simex
