#pragma once

#include <array>
#include <atomic>
#include <cstdint>

namespace stepgrid {

// Lock-free triple buffer used to hand whole state snapshots from one
// thread to another. Exactly one writer thread and one reader thread;
// Publish() and Read() never block and never retry.
//
// Three slots rotate between the roles "being written", "latest
// published" and "being read". Publish() swaps the written slot with
// the published one and raises a dirty flag; Read() swaps the read
// slot with the published one only when that flag is set. A value the
// reader never picked up is overwritten by the next Publish().
//
// Values are assigned into slots on the writer thread, so whatever a
// slot held before (and its allocations) is released there, never on
// the reader thread.
template <typename T>
class TripleBuffer {
 public:
  explicit TripleBuffer(const T& initial = T{})
      : slots_{initial, initial, initial}
  {
  }

  TripleBuffer(const TripleBuffer&) = delete;
  TripleBuffer& operator=(const TripleBuffer&) = delete;

  // Writer side. Copies `value` into the private slot and makes it the
  // latest published snapshot.
  void Publish(const T& value)
  {
    slots_[write_index_] = value;
    const std::uint8_t previous = shared_.exchange(
        static_cast<std::uint8_t>(write_index_ | kDirtyBit),
        std::memory_order_acq_rel);
    write_index_ = static_cast<std::uint8_t>(previous & kIndexMask);
  }

  // Reader side. Returns the most recent snapshot. The reference stays
  // valid until the next call to Read().
  [[nodiscard]] const T& Read() noexcept
  {
    if (HasUpdate()) {
      const std::uint8_t previous =
          shared_.exchange(read_index_, std::memory_order_acq_rel);
      read_index_ = static_cast<std::uint8_t>(previous & kIndexMask);
    }
    return slots_[read_index_];
  }

  // True when a snapshot newer than the last Read() is waiting.
  [[nodiscard]] bool HasUpdate() const noexcept
  {
    return (shared_.load(std::memory_order_relaxed) & kDirtyBit) != 0;
  }

 private:
  static constexpr std::uint8_t kIndexMask = 0x03;
  static constexpr std::uint8_t kDirtyBit = 0x04;

  std::array<T, 3> slots_;

  // Index of the published slot plus the dirty flag.
  std::atomic<std::uint8_t> shared_{1};

  std::uint8_t write_index_{0};
  std::uint8_t read_index_{2};
};

}  // namespace stepgrid
