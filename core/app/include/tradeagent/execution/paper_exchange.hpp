#pragma once

#include "tradeagent/concurrent/worker_pool.hpp"
#include "tradeagent/execution/i_exchange.hpp"
#include "tradeagent/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradeagent {

struct PaperExchangeOptions {
  bool auto_fill{true};          // Fill every accepted order at request.price
  int fill_tranches{1};          // Split each fill into this many executions
  bool duplicate_fills{false};   // Deliver every execution twice
  bool fills_before_ack{false};  // Deliver executions before the ack
  // Dropped-ack promises kept unresolved. Beyond this the oldest is
  // released and its future reports a broken promise.
  std::size_t max_lost_acks{256};
};

// -----------------------------------------------------------------------------
// PaperExchange: in-process simulated venue
// -----------------------------------------------------------------------------
//
// @brief  IExchange that acks and fills orders on its own worker thread,
//         with switches to inject the failures the order manager must
//         survive.
//
// @details
// Orders are processed asynchronously on a single-thread WorkerPool, so the
// caller's future really completes on another thread, as with a remote venue.
//
// The book is keyed by idempotency_key. Placing a key that is already on the
// book returns that order's original outcome and never fills it twice, which
// is what a venue honouring client order ids does.
//
// Fault injection (each counter applies to the next N placeOrder calls):
//   failNextTransport(n)  the call resolves to TransportError and the order
//                         never reaches the book.
//   dropNextAcks(n)       the order is booked (and filled) but its future
//                         never becomes ready: a lost ack.
//   rejectNext(n, why)    the order is booked as rejected.
//
// Accepted orders are filled at request.price when auto_fill is on, in
// fill_tranches executions with ids "<exchange id>-F<i>". emitFill() lets a
// test produce executions by hand.
//
// Thread model:
//   All public methods are safe from any thread. The fill handler runs on
//   the exchange worker (or on the emitFill() caller).
//
// Ownership:
//   Starts its worker in the constructor and stops it in the destructor.
//   Futures of dropped acks are kept alive until destruction so they stay
//   "never ready" rather than turning into broken promises.
// -----------------------------------------------------------------------------
class PaperExchange final : public IExchange {
 public:
  explicit PaperExchange(const ITimeProvider& clock,
                         PaperExchangeOptions options = {});
  ~PaperExchange() override;

  PaperExchange(const PaperExchange&) = delete;
  PaperExchange& operator=(const PaperExchange&) = delete;

  std::future<PlaceResult> placeOrder(
      const domain::OrderRequest& request) override;

  void streamFills(FillHandler handler) override;

  void failNextTransport(int n);
  void dropNextAcks(int n);
  void rejectNext(int n, std::string reason);

  // Delivers one execution for a booked order. Returns false for an unknown
  // key.
  bool emitFill(const std::string& idempotency_key, double quantity,
                double price);

  // Every key passed to placeOrder(), in call order (retries included).
  std::vector<std::string> receivedKeys() const;

  // Distinct orders on the book.
  std::size_t bookedOrders() const;

  // Dropped acks whose promise is still held.
  std::size_t lostAcks() const;

  // Blocks until every placeOrder() accepted so far has been processed.
  void flush();

 private:
  struct BookEntry {
    domain::OrderRequest request;
    PlaceResult result;
    int fills_emitted{0};
  };

  void process(domain::OrderRequest request,
               std::shared_ptr<std::promise<PlaceResult>> promise);
  std::vector<domain::FillEvent> makeFills(const BookEntry& entry);
  void deliver(const std::vector<domain::FillEvent>& fills);

  const ITimeProvider& clock_;
  const PaperExchangeOptions options_;

  mutable std::mutex state_mutex_;
  std::unordered_map<std::string, BookEntry> book_;
  std::vector<std::string> received_keys_;
  std::deque<std::shared_ptr<std::promise<PlaceResult>>> lost_acks_;
  int transport_failures_{0};
  int dropped_acks_{0};
  int rejections_{0};
  std::string reject_reason_;
  std::uint64_t next_id_{0};

  // Held while the handler runs so streamFills() can detach safely.
  std::mutex handler_mutex_;
  FillHandler handler_;

  WorkerPool worker_;
};

}  // namespace tradeagent
