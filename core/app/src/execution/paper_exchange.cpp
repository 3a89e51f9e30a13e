#include "tradeagent/execution/paper_exchange.hpp"

#include <iostream>
#include <utility>

namespace tradeagent {

PaperExchange::PaperExchange(const ITimeProvider& clock,
                             PaperExchangeOptions options)
    : clock_(clock), options_(options), worker_("PaperExchange", 1) {
  worker_.start();
}

PaperExchange::~PaperExchange() {
  worker_.stop();
  std::lock_guard lock(handler_mutex_);
  handler_ = nullptr;
}

// -----------------------------------------------------------------------------
// placeOrder(): hand the request to the worker, return its future
// -----------------------------------------------------------------------------
std::future<PlaceResult> PaperExchange::placeOrder(
    const domain::OrderRequest& request) {
  auto promise = std::make_shared<std::promise<PlaceResult>>();
  std::future<PlaceResult> future = promise->get_future();

  bool queued = worker_.submit(
      [this, request, promise] { process(request, promise); });
  if (!queued) {
    PlaceResult result;
    result.status = PlaceStatus::TransportError;
    result.reason = "paper exchange stopped";
    promise->set_value(result);
  }
  return future;
}

void PaperExchange::streamFills(FillHandler handler) {
  std::lock_guard lock(handler_mutex_);
  handler_ = std::move(handler);
}

void PaperExchange::failNextTransport(int n) {
  std::lock_guard lock(state_mutex_);
  transport_failures_ = n;
}

void PaperExchange::dropNextAcks(int n) {
  std::lock_guard lock(state_mutex_);
  dropped_acks_ = n;
}

void PaperExchange::rejectNext(int n, std::string reason) {
  std::lock_guard lock(state_mutex_);
  rejections_ = n;
  reject_reason_ = std::move(reason);
}

// -----------------------------------------------------------------------------
// process(): runs on the exchange worker
// -----------------------------------------------------------------------------
void PaperExchange::process(
    domain::OrderRequest request,
    std::shared_ptr<std::promise<PlaceResult>> promise) {
  PlaceResult result;
  bool drop_ack = false;
  std::vector<domain::FillEvent> fills;

  {
    std::lock_guard lock(state_mutex_);
    received_keys_.push_back(request.idempotency_key);

    if (transport_failures_ > 0) {
      --transport_failures_;
      result.status = PlaceStatus::TransportError;
      result.reason = "simulated transport failure";
    } else if (auto it = book_.find(request.idempotency_key);
               it != book_.end()) {
      result = it->second.result;
    } else {
      BookEntry entry;
      entry.request = request;
      if (rejections_ > 0) {
        --rejections_;
        entry.result.status = PlaceStatus::Rejected;
        entry.result.reason = reject_reason_;
      } else {
        entry.result.status = PlaceStatus::Acked;
        entry.result.exchange_order_id = "PX-" + std::to_string(++next_id_);
        if (options_.auto_fill) {
          fills = makeFills(entry);
        }
      }
      result = entry.result;
      book_.emplace(request.idempotency_key, std::move(entry));
    }

    if (result.status != PlaceStatus::TransportError && dropped_acks_ > 0) {
      --dropped_acks_;
      drop_ack = true;
      lost_acks_.push_back(promise);
      while (lost_acks_.size() > options_.max_lost_acks) {
        lost_acks_.pop_front();
      }
    }
  }

  if (options_.fills_before_ack) {
    deliver(fills);
  }
  if (!drop_ack) {
    promise->set_value(result);
  }
  if (!options_.fills_before_ack) {
    deliver(fills);
  }
}

// Caller holds state_mutex_.
std::vector<domain::FillEvent> PaperExchange::makeFills(
    const BookEntry& entry) {
  std::vector<domain::FillEvent> fills;
  const int tranches = options_.fill_tranches < 1 ? 1 : options_.fill_tranches;
  const double slice = entry.request.size / tranches;
  double remaining = entry.request.size;

  for (int i = 1; i <= tranches; ++i) {
    domain::FillEvent fill;
    fill.fill_id =
        entry.result.exchange_order_id + "-F" + std::to_string(i);
    fill.idempotency_key = entry.request.idempotency_key;
    fill.instrument = entry.request.instrument;
    fill.side = entry.request.side;
    fill.quantity = i == tranches ? remaining : slice;
    fill.price = entry.request.price;
    fill.timestamp_ms = clock_.now_ms();
    remaining -= fill.quantity;
    fills.push_back(fill);
  }
  return fills;
}

void PaperExchange::deliver(const std::vector<domain::FillEvent>& fills) {
  if (fills.empty()) {
    return;
  }
  std::lock_guard lock(handler_mutex_);
  if (!handler_) {
    std::cerr << "[PaperExchange] no fill handler, " << fills.size()
              << " execution(s) not delivered\n";
    return;
  }
  for (const auto& fill : fills) {
    handler_(fill);
    if (options_.duplicate_fills) {
      handler_(fill);
    }
  }
}

bool PaperExchange::emitFill(const std::string& idempotency_key,
                             double quantity, double price) {
  domain::FillEvent fill;
  {
    std::lock_guard lock(state_mutex_);
    auto it = book_.find(idempotency_key);
    if (it == book_.end()) {
      return false;
    }
    BookEntry& entry = it->second;
    fill.fill_id = (entry.result.exchange_order_id.empty()
                        ? idempotency_key
                        : entry.result.exchange_order_id) +
                   "-M" + std::to_string(++entry.fills_emitted);
    fill.idempotency_key = idempotency_key;
    fill.instrument = entry.request.instrument;
    fill.side = entry.request.side;
    fill.quantity = quantity;
    fill.price = price;
    fill.timestamp_ms = clock_.now_ms();
  }
  deliver({fill});
  return true;
}

std::vector<std::string> PaperExchange::receivedKeys() const {
  std::lock_guard lock(state_mutex_);
  return received_keys_;
}

std::size_t PaperExchange::bookedOrders() const {
  std::lock_guard lock(state_mutex_);
  return book_.size();
}

std::size_t PaperExchange::lostAcks() const {
  std::lock_guard lock(state_mutex_);
  return lost_acks_.size();
}

void PaperExchange::flush() {
  auto done = std::make_shared<std::promise<void>>();
  std::future<void> ready = done->get_future();
  if (!worker_.submit([done] { done->set_value(); })) {
    return;
  }
  ready.wait();
}

}  // namespace tradeagent
