#include "tradeagent/network/ipc_server.hpp"
#include "tradeagent/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <exception>
#include <iostream>
#include <utility>

namespace tradeagent {

namespace {

using nlohmann::json;

json orderJson(const domain::Order& o) {
  json j;
  j["key"] = o.idempotency_key;
  j["instrument"] = o.instrument;
  j["side"] = domain::sideToString(o.side);
  j["type"] = domain::orderTypeToString(o.type);
  j["size"] = o.size;
  j["price"] = o.price;
  j["status"] = domain::orderStatusToString(o.status);
  j["filled_quantity"] = o.filled_quantity;
  j["average_fill_price"] = o.average_fill_price;
  j["exchange_order_id"] = o.exchange_order_id;
  j["attempts"] = o.attempts;
  j["signal_sequence"] = o.signal_sequence;
  if (!o.reject_reason.empty()) {
    j["reason"] = o.reject_reason;
  }
  return j;
}

struct TelemetryFormatter {
  json operator()(const SignalEvent& e) const {
    json j;
    j["type"] = "signal";
    j["instrument"] = e.instrument;
    j["signal"] = domain::signalTypeToString(e.type);
    j["sequence"] = e.sequence;
    j["rule"] = e.rule;
    j["close"] = e.close;
    j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
    return j;
  }

  json operator()(const OrderUpdateEvent& e) const {
    json j;
    j["type"] = e.order.status == domain::OrderStatus::Unknown
                    ? "order_unknown"
                    : "order_update";
    j["order"] = orderJson(e.order);
    j["previous_status"] = domain::orderStatusToString(e.previous_status);
    j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
    return j;
  }

  json operator()(const PositionUpdateEvent& e) const {
    json j;
    j["type"] = "position_update";
    j["instrument"] = e.position.instrument;
    j["side"] = domain::positionSideToString(e.position.side);
    j["size"] = e.position.size;
    j["average_entry_price"] = e.position.average_entry_price;
    j["realized_pnl"] = e.position.realized_pnl;
    j["mark_price"] = e.mark_price;
    j["unrealized_pnl"] = domain::unrealizedPnl(e.position, e.mark_price);
    j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
    return j;
  }

  json operator()(const RiskRejectEvent& e) const {
    json j;
    j["type"] = "risk_reject";
    j["instrument"] = e.instrument;
    j["signal"] = domain::signalTypeToString(e.signal_type);
    j["sequence"] = e.sequence;
    j["reason"] = e.reason;
    j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
    return j;
  }

  json operator()(const RiskViolationEvent& e) const {
    json j;
    j["type"] = "risk_violation";
    j["instrument"] = e.instrument;
    j["reason"] = e.reason;
    j["current_value"] = e.current_value;
    j["limit_value"] = e.limit_value;
    j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
    return j;
  }

  json operator()(const TradingResumedEvent& e) const {
    json j;
    j["type"] = "trading_resumed";
    j["reason"] = e.reason;
    j["realized_pnl"] = e.realized_pnl;
    j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
    return j;
  }

  json operator()(const CycleErrorEvent& e) const {
    json j;
    j["type"] = "cycle_error";
    j["instrument"] = e.instrument;
    j["code"] = e.core_error ? errorCodeToString(e.code) : "exception";
    j["message"] = e.message;
    j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
    return j;
  }
};

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind sockets, spawn the IPC thread
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
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  // Publish whatever was queued during shutdown.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    std::string payload = formatTelemetry(*event);
    zmq::message_t msg(payload.data(), payload.size());
    if (!pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      std::cerr << "[IpcServer] telemetry dropped (socket busy)\n";
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one REQ/REP exchange per call, bounded by rcvtimeo
// -----------------------------------------------------------------------------
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

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    // REP must answer every request or the socket stays in the send state.
    std::cerr << "[IpcServer] command '" << cmd << "' failed: " << e.what()
              << "\n";
    response = errorReply(e.what());
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

std::string IpcServer::errorReply(const std::string& message) {
  json j;
  j["status"] = "error";
  j["response"] = message;
  return j.dump();
}

std::string IpcServer::formatTelemetry(const Event& event) {
  return std::visit(TelemetryFormatter{}, event).dump();
}

}  // namespace tradeagent
