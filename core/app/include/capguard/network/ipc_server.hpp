#pragma once

#include "capguard/concurrent/thread_safe_queue.hpp"
#include "capguard/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace capguard {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ control gateway
// -----------------------------------------------------------------------------
//
// @brief  Serves synchronous JSON commands on a REP socket and broadcasts
//         audit records on a PUB socket, from one dedicated thread.
//
// @details
//   1. REP socket (default tcp://127.0.0.1:5556):
//      Action-gating middleware and admin consoles send one JSON command per
//      request. Each request is handed to the command handler (bound to
//      CapitalControlEngine::executeCommand()) and its JSON response is sent
//      back. ZMQ_RCVTIMEO keeps the receive from blocking the loop.
//
//   2. PUB socket (default tcp://127.0.0.1:5557):
//      Every audit event published on the EventBus is pushed here through
//      pushTelemetry() and broadcast as one JSON audit record per message
//      (see audit_record.hpp). The external governance log subscribes.
//
// Thread model:
//   start() and stop() are called from the owning thread. The worker thread
//   alternates between draining the telemetry queue and polling for one
//   command. pushTelemetry() may be called from any thread; the command
//   handler runs on the worker thread.
//
// Ownership:
//   Owned by CapitalControlEngine via std::unique_ptr. Owns the ZMQ context,
//   both sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. No-op when already running.
  // Throws zmq::error_t if an endpoint cannot be bound.
  void start();

  // Signals the worker, joins it and closes the sockets. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  bool running() const { return running_.load(); }

  // JSON text broadcast for one event.
  static std::string formatTelemetry(const Event& event);

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

}  // namespace capguard
