#include "tradeagent/scheduler/execution_scheduler.hpp"
#include "tradeagent/domain/errors.hpp"
#include "tradeagent/events/event_types.hpp"
#include "tradeagent/time/time_utils.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace tradeagent {

ExecutionScheduler::ExecutionScheduler(
    EventBus& bus, const ITimeProvider& clock, MarketDataCache& cache,
    const IndicatorEngine& indicators, SignalEvaluator& evaluator,
    PositionTracker& positions, OrderExecutionManager& executor,
    std::vector<std::string> instruments, SchedulerOptions options)
    : bus_(bus),
      clock_(clock),
      cache_(cache),
      indicators_(indicators),
      evaluator_(evaluator),
      positions_(positions),
      executor_(executor),
      instruments_(std::move(instruments)),
      known_(instruments_.begin(), instruments_.end()),
      options_(options),
      pool_("ExecutionScheduler", options.workers),
      lanes_(pool_) {}

ExecutionScheduler::~ExecutionScheduler() { shutdown(); }

bool ExecutionScheduler::knows(const std::string& instrument) const {
  return known_.count(instrument) != 0;
}

void ExecutionScheduler::start() {
  if (stopped_.load() || accepting_.load()) {
    return;
  }
  pool_.start();
  accepting_.store(true);

  if (options_.evaluation_interval.count() > 0) {
    timer_ = std::thread([this] { runTimer(); });
  }

  std::cout << "[ExecutionScheduler] started: " << instruments_.size()
            << " instrument(s), " << pool_.workerCount() << " worker(s)";
  if (options_.evaluation_interval.count() > 0) {
    std::cout << ", interval " << options_.evaluation_interval.count()
              << "ms";
  }
  std::cout << "\n";
}

// -----------------------------------------------------------------------------
// shutdown(): stop intake, drain lanes, stop pool
// -----------------------------------------------------------------------------
void ExecutionScheduler::shutdown() {
  bool expected = false;
  if (!stopped_.compare_exchange_strong(expected, true)) {
    return;
  }
  accepting_.store(false);

  {
    std::lock_guard lock(timer_mutex_);
    timer_stop_ = true;
  }
  timer_cv_.notify_all();
  if (timer_.joinable()) {
    timer_.join();
  }

  if (pool_.running() && !lanes_.waitIdle(options_.drain_timeout)) {
    std::cerr << "[ExecutionScheduler] drain timed out after "
              << options_.drain_timeout.count() << "ms\n";
  }
  pool_.stop();

  SchedulerStats s = stats();
  std::cout << "[ExecutionScheduler] stopped. cycles=" << s.cycles
            << " errors=" << s.cycle_errors
            << " signals=" << s.actionable_signals
            << " fills=" << s.fills_routed << "\n";
}

bool ExecutionScheduler::onBar(const std::string& instrument,
                               domain::PriceBar bar) {
  if (!accepting_.load()) {
    return false;
  }
  if (!knows(instrument)) {
    std::cerr << "[ExecutionScheduler] bar for unconfigured instrument "
              << instrument << " ignored\n";
    return false;
  }

  return lanes_.post(instrument, [this, instrument, bar] {
    AppendResult appended = cache_.append(instrument, bar);
    if (appended == AppendResult::Stale) {
      return;
    }
    try {
      positions_.mark(instrument, bar.close);
    } catch (const Error& e) {
      reportCycleError(instrument, e.code(), true, e.what());
      return;
    }
    runCycle(instrument);
  });
}

// Fills go through the lanes while the pool runs. Once it has stopped no
// lane task can run, so a late fill is applied on the caller's thread and
// positions still match the venue at exit.
bool ExecutionScheduler::onFill(const domain::FillEvent& fill) {
  fills_routed_.fetch_add(1);
  if (!(stopped_.load() && !pool_.running()) &&
      lanes_.post(fill.instrument, [this, fill] { executor_.onFill(fill); })) {
    return true;
  }
  std::cout << "[ExecutionScheduler] fill " << fill.fill_id
            << " after shutdown, applied directly\n";
  executor_.onFill(fill);
  return true;
}

bool ExecutionScheduler::evaluate(const std::string& instrument) {
  if (!accepting_.load() || !knows(instrument)) {
    return false;
  }
  return lanes_.post(instrument, [this, instrument] { runCycle(instrument); });
}

bool ExecutionScheduler::waitIdle(std::chrono::milliseconds timeout) {
  return lanes_.waitIdle(timeout);
}

// -----------------------------------------------------------------------------
// runCycle(): runs on the instrument's lane
// -----------------------------------------------------------------------------
void ExecutionScheduler::runCycle(const std::string& instrument) {
  cycles_.fetch_add(1);
  try {
    auto history = cache_.history(instrument, indicators_.lookback());
    domain::IndicatorSnapshot snapshot =
        indicators_.compute(instrument, history);
    domain::Position position = positions_.position(instrument);

    Evaluation evaluation = evaluator_.evaluate(snapshot, position);
    if (evaluation.outcome == EvaluationOutcome::Suppressed) {
      std::cout << "[ExecutionScheduler] " << instrument << " seq="
                << snapshot.sequence << " "
                << domain::signalTypeToString(evaluation.signal.type)
                << " suppressed in state "
                << domain::positionSideToString(position.side) << "\n";
    }
    if (evaluation.outcome != EvaluationOutcome::Actionable) {
      return;
    }

    actionable_.fetch_add(1);
    const domain::Signal& signal = evaluation.signal;

    SignalEvent event;
    event.instrument = instrument;
    event.type = signal.type;
    event.sequence = signal.sequence;
    event.rule = signal.rule;
    if (const auto* close = snapshot.find("close")) {
      event.close = close->current;
    }
    event.timestamp = ms_to_timestamp(clock_.now_ms());
    bus_.publish(event);

    std::cout << "[ExecutionScheduler] " << instrument << " seq="
              << signal.sequence << " "
              << domain::signalTypeToString(signal.type) << " (rule "
              << signal.rule << ")\n";

    SubmitResult submitted = executor_.submit(signal, instrument);
    std::cout << "[ExecutionScheduler] " << instrument << " submit "
              << submitOutcomeToString(submitted.outcome);
    if (!submitted.idempotency_key.empty()) {
      std::cout << " key=" << submitted.idempotency_key;
    }
    if (!submitted.reason.empty()) {
      std::cout << " (" << submitted.reason << ")";
    }
    std::cout << "\n";
  } catch (const InsufficientHistory& e) {
    bool first = false;
    {
      std::lock_guard lock(warmup_mutex_);
      first = warming_up_logged_.insert(instrument).second;
    }
    if (first) {
      std::cout << "[ExecutionScheduler] " << instrument << " warming up: "
                << e.what() << "\n";
    }
  } catch (const Error& e) {
    reportCycleError(instrument, e.code(), true, e.what());
  } catch (const std::exception& e) {
    reportCycleError(instrument, ErrorCode::InsufficientHistory, false,
                     e.what());
  }
}

void ExecutionScheduler::reportCycleError(const std::string& instrument,
                                          ErrorCode code, bool core_error,
                                          const std::string& message) {
  cycle_errors_.fetch_add(1);
  std::cerr << "[ExecutionScheduler] cycle for " << instrument
            << " skipped: "
            << (core_error ? errorCodeToString(code) : "exception") << ": "
            << message << "\n";

  CycleErrorEvent event;
  event.instrument = instrument;
  event.code = code;
  event.core_error = core_error;
  event.message = message;
  event.timestamp = ms_to_timestamp(clock_.now_ms());
  bus_.publish(event);
}

// -----------------------------------------------------------------------------
// runTimer(): fixed-interval evaluate() for every instrument
// -----------------------------------------------------------------------------
void ExecutionScheduler::runTimer() {
  std::unique_lock lock(timer_mutex_);
  while (!timer_cv_.wait_for(lock, options_.evaluation_interval,
                             [this] { return timer_stop_; })) {
    lock.unlock();
    for (const auto& instrument : instruments_) {
      evaluate(instrument);
    }
    lock.lock();
  }
}

SchedulerStats ExecutionScheduler::stats() const {
  SchedulerStats s;
  s.cycles = cycles_.load();
  s.cycle_errors = cycle_errors_.load();
  s.actionable_signals = actionable_.load();
  s.fills_routed = fills_routed_.load();
  return s;
}

}  // namespace tradeagent
