#pragma once

#include <cstddef>
#include <vector>

#include "core/Frame.h"

namespace stepgrid {

// Sliding-window RMS meter. The window is allocated on construction;
// Add() and value() never allocate. Until the window has filled up the
// mean is taken over the frames seen so far.
class Rms {
 public:
  explicit Rms(std::size_t window_frames = kDefaultWindow);

  static constexpr std::size_t kDefaultWindow = 1024;

  void Add(const Stereo& frame) noexcept;
  void Reset() noexcept;

  [[nodiscard]] Stereo value() const noexcept;
  [[nodiscard]] std::size_t window_frames() const { return window_.size(); }

 private:
  std::vector<Stereo> window_;
  std::size_t cursor_{0};
  std::size_t filled_{0};
  Stereo sum_{};
};

}  // namespace stepgrid
