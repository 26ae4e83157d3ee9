#include "sigexec/network/ipc_server.hpp"
#include "sigexec/events/event_json.hpp"

#include <cerrno>
#include <iostream>
#include <utility>

namespace sigexec {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind sockets, spawn the worker
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  const bool was_running = running_.exchange(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  if (!was_running) {
    return;
  }
  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();
  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): alternate between telemetry and one command poll
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    const std::string payload = eventToJson(*event).dump();
    pub_socket_->send(zmq::buffer(payload), zmq::send_flags::dontwait);
  }
}

void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  const std::string cmd = request.to_string();
  const std::string response = command_handler_(cmd);
  cmd_socket_->send(zmq::buffer(response), zmq::send_flags::none);
}

}  // namespace sigexec
