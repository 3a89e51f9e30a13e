#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace tradeagent {

// -----------------------------------------------------------------------------
// RingBuffer<T>: fixed-capacity FIFO that overwrites its oldest element
// -----------------------------------------------------------------------------
// Not thread-safe; MarketDataCache guards each buffer with its own lock.
//
// Storage grows up to capacity with push_back, then head_ marks the oldest
// slot and each further push overwrites it. at(i) is chronological: at(0) is
// the oldest element, at(size() - 1) the newest.
// -----------------------------------------------------------------------------
template <typename T>
class RingBuffer {
 public:
  explicit RingBuffer(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
      throw std::invalid_argument("RingBuffer capacity must be > 0");
    }
    data_.reserve(capacity_);
  }

  void push_back(T value) {
    if (data_.size() < capacity_) {
      data_.push_back(std::move(value));
      return;
    }
    data_[head_] = std::move(value);
    head_ = (head_ + 1) % capacity_;
  }

  const T& at(std::size_t i) const { return data_[(head_ + i) % data_.size()]; }

  T& back() { return data_[(head_ + data_.size() - 1) % data_.size()]; }
  const T& back() const {
    return data_[(head_ + data_.size() - 1) % data_.size()];
  }

  // Last n elements, oldest first. n is clamped to size().
  std::vector<T> last(std::size_t n) const {
    if (n > data_.size()) {
      n = data_.size();
    }
    std::vector<T> out;
    out.reserve(n);
    for (std::size_t i = data_.size() - n; i < data_.size(); ++i) {
      out.push_back(at(i));
    }
    return out;
  }

  std::size_t size() const { return data_.size(); }
  std::size_t capacity() const { return capacity_; }
  bool empty() const { return data_.empty(); }

 private:
  std::vector<T> data_;
  std::size_t capacity_;
  std::size_t head_{0};
};

}  // namespace tradeagent
