#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded, lock-protected FIFO used between producers and the log worker.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace autopilot {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed-capacity queue; `push()` never blocks, `popFor()` waits up to a timeout.
 *
 *  * Multi-producer / single-consumer in practice, but safe for any mix.
 *  * A full buffer rejects new items (caller decides whether to count drops).
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity) {}

      /// @returns false if the buffer is full.
      bool push(T item) {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          if (size_ == slots_.size())
            return false;
          slots_[(head_ + size_) % slots_.size()] = std::move(item);
          ++size_;
        }
        cv_.notify_one();
        return true;
      }

      /// Blocks until an item is available or \p timeout expires.
      std::optional<T> popFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        if (!cv_.wait_for(lock, timeout, [this] { return size_ > 0; }))
          return std::nullopt;
        T item = std::move(slots_[head_]);
        head_ = (head_ + 1) % slots_.size();
        --size_;
        return item;
      }

      bool empty() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return size_ == 0;
      }

      std::size_t capacity() const { return slots_.size(); }

    private:
      std::vector<T> slots_;
      std::size_t head_{ 0 };
      std::size_t size_{ 0 };
      mutable std::mutex mtx_;
      std::condition_variable cv_;
    };

  } // namespace core
} // namespace autopilot
