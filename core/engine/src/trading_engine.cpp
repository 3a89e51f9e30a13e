#include "tradeagent/engine/trading_engine.hpp"
#include "tradeagent/domain/errors.hpp"
#include "tradeagent/domain/order_status.hpp"
#include "tradeagent/time/live_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>
#include <sstream>
#include <utility>
#include <vector>

namespace tradeagent {

namespace {

using nlohmann::json;

json orderJson(const domain::Order& o) {
  json j;
  j["key"] = o.idempotency_key;
  j["instrument"] = o.instrument;
  j["side"] = domain::sideToString(o.side);
  j["type"] = domain::orderTypeToString(o.type);
  j["intent"] = domain::signalTypeToString(o.intent);
  j["size"] = o.size;
  j["price"] = o.price;
  j["status"] = domain::orderStatusToString(o.status);
  j["filled_quantity"] = o.filled_quantity;
  j["average_fill_price"] = o.average_fill_price;
  j["exchange_order_id"] = o.exchange_order_id;
  j["attempts"] = o.attempts;
  j["signal_sequence"] = o.signal_sequence;
  j["submitted_at_ms"] = o.submitted_at_ms;
  j["reason"] = o.reject_reason;
  return j;
}

json ordersJson(const std::vector<domain::Order>& orders) {
  json arr = json::array();
  for (const auto& o : orders) {
    arr.push_back(orderJson(o));
  }
  return arr;
}

std::vector<std::string> tokenize(const std::string& cmd) {
  std::istringstream in(cmd);
  std::vector<std::string> tokens;
  std::string token;
  while (in >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return s;
}

std::string error(const std::string& message) {
  return IpcServer::errorReply(message);
}

SchedulerOptions schedulerOptions(const config::EngineConfig& cfg) {
  SchedulerOptions options;
  options.workers = cfg.scheduler.workers;
  options.evaluation_interval = cfg.scheduler.evaluation_interval;
  return options;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build the component graph
// -----------------------------------------------------------------------------
TradingEngine::TradingEngine(config::EngineConfig config, IExchange& exchange,
                             const ITimeProvider& clock,
                             SimulationTimeProvider* sim_clock)
    : config_(std::move(config)),
      exchange_(exchange),
      clock_(clock),
      sim_clock_(sim_clock),
      cache_(config_.cache_capacity),
      indicators_(config_.indicators),
      evaluator_(config_.rules),
      positions_(bus_, clock_, config_.instruments, config_.risk),
      orders_(bus_, clock_),
      executor_(bus_, exchange_, positions_, orders_, clock_,
                config_.instruments, config_.retry, config_.entry_cooldown,
                config_.key_prefix,
                OrderExecutionManager::makeRunId(LiveTimeProvider().now_ms())),
      scheduler_(bus_, clock_, cache_, indicators_, evaluator_, positions_,
                 executor_, config_.instrumentIds(),
                 schedulerOptions(config_)) {}

TradingEngine::~TradingEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradingEngine::start(IReconciler* reconciler) {
  if (running_ || stopped_) {
    return;
  }

  // ---  1) Synchronization gate -------------------------------------------
  if (reconciler != nullptr) {
    std::set<std::string> configured;
    for (const auto& ic : config_.instruments) {
      configured.insert(ic.instrument.id);
    }

    std::size_t hydrated_positions = 0;
    for (const auto& pos : reconciler->reconcilePositions()) {
      if (configured.count(pos.instrument) == 0) {
        std::cerr << "[TradingEngine] reconciled position for unconfigured "
                  << pos.instrument << " skipped\n";
        continue;
      }
      positions_.hydratePosition(pos);
      ++hydrated_positions;
    }

    std::size_t hydrated_orders = 0;
    for (const auto& order : reconciler->reconcileOrders()) {
      if (configured.count(order.instrument) == 0) {
        std::cerr << "[TradingEngine] reconciled order " << order.idempotency_key
                  << " for unconfigured " << order.instrument << " skipped\n";
        continue;
      }
      orders_.hydrateOrder(order);
      ++hydrated_orders;
    }

    std::cout << "[TradingEngine] reconciliation complete: "
              << hydrated_positions << " position(s), " << hydrated_orders
              << " order(s) hydrated.\n";
  }

  // ---  2) Fills route through the instrument lanes ------------------------
  exchange_.streamFills(
      [this](const domain::FillEvent& fill) { scheduler_.onFill(fill); });

  // ---  3) Scheduler --------------------------------------------------------
  scheduler_.start();

  // ---  4) IPC surface ------------------------------------------------------
  if (!config_.endpoints.ipc_command.empty() &&
      !config_.endpoints.ipc_telemetry.empty()) {
    ipc_server_ = std::make_shared<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.endpoints.ipc_command, config_.endpoints.ipc_telemetry);
    ipc_server_->start();
    // A publish already in flight may run this after stop() unsubscribed it,
    // so it holds the server weakly instead of reading ipc_server_.
    std::weak_ptr<IpcServer> server = ipc_server_;
    telemetry_subscription_ =
        bus_.subscribe([server](const Event& event) {
          if (auto s = server.lock()) {
            s->pushTelemetry(event);
          }
        });
  }

  // ---  5) Market data last -------------------------------------------------
  if (!config_.endpoints.market_data.empty()) {
    market_data_thread_ = std::make_unique<MarketDataThread>(
        [this](const std::string& instrument, domain::PriceBar bar) {
          pushBar(instrument, bar);
        },
        config_.endpoints.market_data, sim_clock_);
    market_data_thread_->start();
  }

  running_ = true;
  std::cout << "[TradingEngine] started: " << config_.instruments.size()
            << " instrument(s), clock="
            << config::clockModeToString(config_.clock)
            << ", run=" << executor_.runId()
            << (market_data_thread_ ? ", market data" : "")
            << (ipc_server_ ? ", ipc" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TradingEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) No more bars -----------------------------------------------------
  market_data_thread_.reset();

  // ---  2) Drain cycles; in-flight orders settle ---------------------------
  scheduler_.shutdown();

  // ---  3) Detach fills -----------------------------------------------------
  exchange_.streamFills({});

  // ---  4) IPC last, so the final order updates are published -------------
  // The IPC thread may be inside a command that publishes; join it before
  // the subscription goes.
  if (ipc_server_) {
    ipc_server_->stop();
  }
  if (telemetry_subscription_) {
    bus_.unsubscribe(*telemetry_subscription_);
    telemetry_subscription_.reset();
  }
  ipc_server_.reset();

  running_ = false;
  stopped_ = true;

  auto unknown = orders_.unknownOrders();
  if (!unknown.empty()) {
    std::cerr << "[TradingEngine] " << unknown.size()
              << " order(s) still UNKNOWN at shutdown; reconcile manually\n";
  }
  std::cout << "[TradingEngine] stopped.\n";
}

bool TradingEngine::pushBar(const std::string& instrument,
                            domain::PriceBar bar) {
  return scheduler_.onBar(instrument, bar);
}

bool TradingEngine::waitIdle(std::chrono::milliseconds timeout) {
  return scheduler_.waitIdle(timeout);
}

// -----------------------------------------------------------------------------
// executeCommand(): operator command surface
// -----------------------------------------------------------------------------
std::string TradingEngine::executeCommand(const std::string& cmd) {
  auto tokens = tokenize(cmd);
  if (tokens.empty()) {
    return error("empty command");
  }
  const std::string verb = upper(tokens[0]);
  json response;

  if (verb == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (verb == "STATUS") {
    return statusJson();
  } else if (verb == "ORDERS") {
    response["status"] = "ok";
    response["orders"] = ordersJson(orders_.orders());
  } else if (verb == "UNKNOWN") {
    response["status"] = "ok";
    response["orders"] = ordersJson(orders_.unknownOrders());
  } else if (verb == "HALT") {
    positions_.haltTrading("operator halt");
    response["status"] = "ok";
    response["response"] = "Trading halted";
  } else if (verb == "RESUME") {
    if (!positions_.resumeTrading("operator resume")) {
      return error("trading is not halted");
    }
    response["status"] = "ok";
    response["response"] = "Trading resumed";
  } else if (verb == "EVALUATE") {
    if (tokens.size() != 2) {
      return error("usage: EVALUATE <instrument>");
    }
    if (!scheduler_.evaluate(tokens[1])) {
      return error("evaluation not scheduled for " + tokens[1]);
    }
    response["status"] = "ok";
    response["response"] = "evaluation scheduled for " + tokens[1];
  } else if (verb == "RESOLVE") {
    if (tokens.size() != 3) {
      return error("usage: RESOLVE <key> <STATE>");
    }
    auto status = domain::orderStatusFromString(upper(tokens[2]));
    if (!status) {
      return error("unknown order state " + tokens[2]);
    }
    if (!executor_.resolve(tokens[1], *status)) {
      return error("order " + tokens[1] + " cannot be resolved to " +
                   domain::orderStatusToString(*status));
    }
    response["status"] = "ok";
    if (auto order = orders_.find(tokens[1])) {
      response["order"] = orderJson(*order);
    }
  } else {
    return error("Unknown command: " + cmd);
  }

  return response.dump();
}

std::string TradingEngine::statusJson() {
  json response;
  response["status"] = "ok";
  response["halted"] = positions_.isHalted();
  response["accepting"] = scheduler_.accepting();

  ExposureSummary exposure = positions_.exposure();
  response["exposure"] = {
      {"gross_notional", exposure.gross_notional},
      {"reserved_notional", exposure.reserved_notional},
      {"open_positions", exposure.open_positions},
      {"realized_pnl", exposure.realized_pnl},
  };

  json positions = json::array();
  for (const auto& snap : positions_.snapshots()) {
    json p;
    p["instrument"] = snap.position.instrument;
    p["side"] = domain::positionSideToString(snap.position.side);
    p["size"] = snap.position.size;
    p["average_entry_price"] = snap.position.average_entry_price;
    p["realized_pnl"] = snap.position.realized_pnl;
    p["mark_price"] = snap.mark_price;
    p["unrealized_pnl"] = snap.unrealized_pnl;
    p["notional"] = snap.notional;
    positions.push_back(std::move(p));
  }
  response["positions"] = std::move(positions);

  SchedulerStats stats = scheduler_.stats();
  response["scheduler"] = {
      {"cycles", stats.cycles},
      {"cycle_errors", stats.cycle_errors},
      {"signals", stats.actionable_signals},
      {"fills", stats.fills_routed},
  };
  response["unknown_orders"] = orders_.unknownOrders().size();
  response["now_ms"] = clock_.now_ms();
  return response.dump();
}

}  // namespace tradeagent
