#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace cold_chain::core {

// Fixed-capacity ring buffer; the oldest sample is evicted on overflow.
template <typename T>
class RollingWindow {
 public:
  explicit RollingWindow(const std::size_t capacity) : slots_(capacity) {
    if (capacity == 0) {
      throw std::invalid_argument("rolling window capacity must be greater than 0");
    }
  }

  void push(const T& value) {
    slots_[next_] = value;
    next_ = (next_ + 1) % slots_.size();
    if (count_ < slots_.size()) {
      ++count_;
    }
  }

  [[nodiscard]] std::size_t size() const noexcept { return count_; }
  [[nodiscard]] std::size_t capacity() const noexcept { return slots_.size(); }
  [[nodiscard]] bool empty() const noexcept { return count_ == 0; }

  // Oldest-first access.
  [[nodiscard]] const T& operator[](const std::size_t index) const noexcept {
    const std::size_t oldest = (next_ + slots_.size() - count_) % slots_.size();
    return slots_[(oldest + index) % slots_.size()];
  }

  [[nodiscard]] const T& back() const noexcept { return (*this)[count_ - 1]; }

  // Last n samples (or all when fewer are held), oldest first.
  [[nodiscard]] std::vector<T> tail(const std::size_t n) const {
    const std::size_t take = n < count_ ? n : count_;
    std::vector<T> out;
    out.reserve(take);
    for (std::size_t i = count_ - take; i < count_; ++i) {
      out.push_back((*this)[i]);
    }
    return out;
  }

  [[nodiscard]] std::vector<T> values() const { return tail(count_); }

 private:
  std::vector<T> slots_;
  std::size_t count_{0};
  std::size_t next_{0};
};

}  // namespace cold_chain::core
