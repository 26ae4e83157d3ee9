#pragma once

#include "sigexec/concurrent/thread_safe_queue.hpp"
#include "sigexec/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace sigexec {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ status and telemetry endpoint
// -----------------------------------------------------------------------------
//
// @brief  Lets an operator (or a monitoring script) ask the running engine
//         for its state and follow its events live.
//
// @details
// Two sockets served by one worker thread:
//
//   1. REP (cmd_endpoint): one command string per request, one JSON reply.
//      Commands are answered by the CommandHandler (bound to
//      TradingEngine::executeCommand). ZMQ_RCVTIMEO keeps the loop from
//      blocking so it can also service telemetry and notice stop().
//
//   2. PUB (pub_endpoint): every event handed to pushTelemetry() is rendered
//      with eventToJson() and published as one frame.
//
// The tick thread only ever calls pushTelemetry(), which is a queue push;
// JSON rendering and socket I/O happen on the IPC thread.
//
// Thread model:
//   start() binds both sockets (throws zmq::error_t if an endpoint is taken)
//   and spawns the thread. stop() joins it. The CommandHandler runs on the
//   IPC thread and must only read state published for it under a lock.
//
// Ownership: owns the context, sockets, telemetry queue and thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
            std::string pub_endpoint);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // @throws zmq::error_t if a socket cannot be bound.
  void start();

  // Idempotent. Publishes what is still queued before returning.
  void stop();

  // Thread-safe; called from the tick thread.
  void pushTelemetry(Event event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace sigexec
