#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded FIFO shared between a producer and the logger worker.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace axostim {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed-capacity circular queue; push fails instead of blocking when full.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity) {
        if (capacity == 0)
          throw std::invalid_argument("[RingBuffer] capacity must be > 0");
      }

      /// false when full; \p item is left untouched in that case.
      bool tryPush(T&& item) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (count_ == slots_.size())
          return false;
        slots_[(head_ + count_) % slots_.size()] = std::move(item);
        ++count_;
        return true;
      }

      /// false when empty.
      bool tryPop(T& out) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (count_ == 0)
          return false;
        out = std::move(slots_[head_]);
        head_ = (head_ + 1) % slots_.size();
        --count_;
        return true;
      }

      /// Discards every queued item and returns how many there were.
      std::size_t clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        const std::size_t discarded = count_;
        for (; count_ > 0; --count_, head_ = (head_ + 1) % slots_.size())
          slots_[head_] = T{};
        head_ = 0;
        return discarded;
      }

      std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return count_;
      }
      bool empty() const { return size() == 0; }
      std::size_t capacity() const { return slots_.size(); }

    private:
      std::vector<T> slots_;
      std::size_t head_{ 0 };
      std::size_t count_{ 0 };
      mutable std::mutex mtx_;
    };

  } // namespace core
} // namespace axostim
