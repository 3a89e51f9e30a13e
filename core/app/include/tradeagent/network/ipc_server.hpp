#pragma once

#include "tradeagent/concurrent/thread_safe_queue.hpp"
#include "tradeagent/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace tradeagent {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command (REP) and telemetry (PUB) surface
// -----------------------------------------------------------------------------
//
// @brief  One thread that answers operator commands and broadcasts engine
//         events as JSON.
//
// @details
//   REP socket: each request is a command line ("STATUS", "EVALUATE BTC-USDT",
//   "RESOLVE TABTCUSDTS5 FILLED", ...). It is passed to the command handler
//   (TradingEngine::executeCommand) and the returned JSON is sent back.
//
//   PUB socket: events pushed with pushTelemetry() are formatted by
//   formatTelemetry() and published. Every Event alternative has a message
//   type:
//     signal, order_update, order_unknown, position_update, risk_reject,
//     risk_violation, trading_resumed, cycle_error
//   An order that enters UNKNOWN is published as "order_unknown" so that an
//   operator can subscribe to exactly the rows that need reconciliation.
//
// Thread model:
//   start() / stop() from the owning thread. pushTelemetry() from any thread
//   (EventBus subscribers run on lane and exchange threads); the queue
//   decouples them from socket I/O. The command handler runs on the IPC
//   thread.
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

  void start();
  void stop();

  void pushTelemetry(Event event);

  static std::string formatTelemetry(const Event& event);

  // {"status":"error","response":message}, the reply shape of every failed
  // command.
  static std::string errorReply(const std::string& message);

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

}  // namespace tradeagent
