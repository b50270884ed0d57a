#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <utility>

namespace stepgrid {

// Bounded single-producer single-consumer FIFO.
//
// Push() fails instead of blocking when the queue is full and Pop()
// returns false when it is empty. Neither allocates, so both ends can be
// used from the audio thread. Slots are moved in and out, which allows
// move-only payloads. A popped slot stays in its moved-from state until
// the producer reuses it.
//
// head_ and tail_ are free-running counters; their difference is the
// number of queued items.
template <typename T, std::size_t Capacity>
class SpscQueue {
  static_assert(Capacity > 0 && (Capacity & (Capacity - 1)) == 0,
                "SpscQueue capacity must be a power of two");

 public:
  SpscQueue() = default;

  SpscQueue(const SpscQueue&) = delete;
  SpscQueue& operator=(const SpscQueue&) = delete;

  // Producer side. On failure `value` is left untouched.
  [[nodiscard]] bool Push(T&& value) noexcept
  {
    const std::size_t tail = tail_.load(std::memory_order_relaxed);
    const std::size_t head = head_.load(std::memory_order_acquire);
    if (tail - head >= Capacity) {
      return false;
    }
    slots_[tail & kMask] = std::move(value);
    tail_.store(tail + 1, std::memory_order_release);
    return true;
  }

  // Consumer side.
  [[nodiscard]] bool Pop(T& out) noexcept
  {
    const std::size_t head = head_.load(std::memory_order_relaxed);
    const std::size_t tail = tail_.load(std::memory_order_acquire);
    if (head == tail) {
      return false;
    }
    out = std::move(slots_[head & kMask]);
    head_.store(head + 1, std::memory_order_release);
    return true;
  }

  // Approximate when called concurrently with the other side.
  [[nodiscard]] std::size_t size() const noexcept
  {
    return tail_.load(std::memory_order_acquire) -
           head_.load(std::memory_order_acquire);
  }
  [[nodiscard]] bool empty() const noexcept { return size() == 0; }
  [[nodiscard]] static constexpr std::size_t capacity() { return Capacity; }

 private:
  static constexpr std::size_t kMask = Capacity - 1;

  std::array<T, Capacity> slots_{};

  alignas(64) std::atomic<std::size_t> head_{0};
  alignas(64) std::atomic<std::size_t> tail_{0};
};

}  // namespace stepgrid
