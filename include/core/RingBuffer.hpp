#pragma once
/** @file  RingBuffer.hpp
 *  @brief Fixed-capacity FIFO used by the async Logger.
 *
 *  © 2025 The ivbench authors — MIT-licensed.
 */

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace ivbench::core {

  /**
 * @class RingBuffer
 * @brief Overwrites the oldest element when full. Not thread-safe on its own;
 *        the owner guards it.
 */
  template <typename T> class RingBuffer {
  public:
    explicit RingBuffer(std::size_t capacity) : slots_(capacity == 0 ? 1 : capacity) {}

    /// @returns false if an element had to be dropped to make room.
    bool push(T value) {
      bool dropped = false;
      if (size_ == slots_.size()) {
        head_ = (head_ + 1) % slots_.size();
        --size_;
        dropped = true;
      }
      slots_[(head_ + size_) % slots_.size()] = std::move(value);
      ++size_;
      return !dropped;
    }

    std::optional<T> pop() {
      if (size_ == 0)
        return std::nullopt;
      T out = std::move(slots_[head_]);
      head_ = (head_ + 1) % slots_.size();
      --size_;
      return out;
    }

    bool empty() const { return size_ == 0; }
    std::size_t size() const { return size_; }
    std::size_t capacity() const { return slots_.size(); }

  private:
    std::vector<T> slots_;
    std::size_t head_{ 0 };
    std::size_t size_{ 0 };
  };

} // namespace ivbench::core
