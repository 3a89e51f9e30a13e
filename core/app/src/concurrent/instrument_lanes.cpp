#include "tradeagent/concurrent/instrument_lanes.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace tradeagent {

InstrumentLanes::InstrumentLanes(WorkerPool& pool) : pool_(pool) {}

InstrumentLanes::Lane& InstrumentLanes::laneFor(const std::string& instrument) {
  std::lock_guard lock(lanes_mutex_);
  auto& slot = lanes_[instrument];
  if (!slot) {
    slot = std::make_unique<Lane>();
    slot->instrument = instrument;
  }
  return *slot;
}

// -----------------------------------------------------------------------------
// post(): enqueue on the lane, schedule a drain job if the lane was idle
// -----------------------------------------------------------------------------
bool InstrumentLanes::post(const std::string& instrument, Task task) {
  Lane& lane = laneFor(instrument);

  {
    std::lock_guard lock(idle_mutex_);
    ++outstanding_;
  }

  bool schedule = false;
  {
    std::lock_guard lock(lane.mutex);
    lane.tasks.push_back(std::move(task));
    if (!lane.scheduled) {
      lane.scheduled = true;
      schedule = true;
    }
  }

  if (!schedule) {
    return true;
  }

  if (pool_.submit([this, &lane] { drain(lane); })) {
    return true;
  }

  // Pool is gone: nothing will ever drain this lane again.
  std::size_t discarded = 0;
  {
    std::lock_guard lock(lane.mutex);
    discarded = lane.tasks.size();
    lane.tasks.clear();
    lane.scheduled = false;
  }
  std::cerr << "[InstrumentLanes] pool stopped, discarded " << discarded
            << " task(s) for " << instrument << "\n";
  finished(discarded);
  return false;
}

// -----------------------------------------------------------------------------
// drain(): run the lane until empty. Only one drain per lane exists at a time.
// -----------------------------------------------------------------------------
void InstrumentLanes::drain(Lane& lane) {
  while (true) {
    Task task;
    {
      std::lock_guard lock(lane.mutex);
      if (lane.tasks.empty()) {
        lane.scheduled = false;
        return;
      }
      task = std::move(lane.tasks.front());
      lane.tasks.pop_front();
      lane.running = 1;
    }

    try {
      task();
    } catch (const std::exception& e) {
      std::cerr << "[InstrumentLanes] task for " << lane.instrument
                << " failed: " << e.what() << "\n";
    }

    {
      std::lock_guard lock(lane.mutex);
      lane.running = 0;
    }
    finished(1);
  }
}

void InstrumentLanes::finished(std::size_t n) {
  if (n == 0) {
    return;
  }
  {
    std::lock_guard lock(idle_mutex_);
    outstanding_ -= n;
  }
  idle_cv_.notify_all();
}

std::size_t InstrumentLanes::pending(const std::string& instrument) const {
  Lane* lane = nullptr;
  {
    std::lock_guard lock(lanes_mutex_);
    auto it = lanes_.find(instrument);
    if (it == lanes_.end()) {
      return 0;
    }
    lane = it->second.get();
  }
  std::lock_guard lock(lane->mutex);
  return lane->tasks.size() + lane->running;
}

bool InstrumentLanes::waitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock lock(idle_mutex_);
  return idle_cv_.wait_for(lock, timeout, [this] { return outstanding_ == 0; });
}

}  // namespace tradeagent
