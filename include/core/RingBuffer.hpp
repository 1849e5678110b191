#pragma once
/** @file  RingBuffer.hpp
 *  @brief Fixed-capacity FIFO used between request threads and the log worker.
 *
 *  © 2025 deskctl contributors — MIT-licensed.
 */

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace deskctl::core {

  /**
 * @class RingBuffer
 * @brief Bounded circular queue; `push()` refuses instead of overwriting.
 *
 *  * Not synchronized: the owner wraps it in its own mutex.
 *  * Capacity is fixed at construction (min 1).
 */
  template <typename T> class RingBuffer {
  public:
    explicit RingBuffer(std::size_t capacity)
        : slots_(capacity == 0 ? 1 : capacity) {}

    /// @returns false when full; the element is left untouched.
    bool push(T&& value) {
      if (full())
        return false;
      slots_[tail_] = std::move(value);
      tail_ = (tail_ + 1) % slots_.size();
      ++size_;
      return true;
    }

    std::optional<T> pop() {
      if (empty())
        return std::nullopt;
      std::optional<T> out{ std::move(*slots_[head_]) };
      slots_[head_].reset();
      head_ = (head_ + 1) % slots_.size();
      --size_;
      return out;
    }

    bool empty() const { return size_ == 0; }
    bool full() const { return size_ == slots_.size(); }
    std::size_t size() const { return size_; }
    std::size_t capacity() const { return slots_.size(); }

  private:
    std::vector<std::optional<T>> slots_;
    std::size_t head_{ 0 };
    std::size_t tail_{ 0 };
    std::size_t size_{ 0 };
  };

} // namespace deskctl::core
