#include "core/Rms.h"

#include <algorithm>
#include <cmath>

namespace stepgrid {

Rms::Rms(const std::size_t window_frames)
    : window_(std::max<std::size_t>(window_frames, 1)) {}

void Rms::Add(const Stereo& frame) noexcept
{
  const Stereo squared = frame * frame;
  sum_ += squared - window_[cursor_];
  window_[cursor_] = squared;
  cursor_ = (cursor_ + 1) % window_.size();
  filled_ = std::min(filled_ + 1, window_.size());
}

void Rms::Reset() noexcept
{
  std::fill(window_.begin(), window_.end(), Stereo{});
  cursor_ = 0;
  filled_ = 0;
  sum_ = Stereo{};
}

Stereo Rms::value() const noexcept
{
  Stereo result;
  if (filled_ == 0) {
    return result;
  }
  const auto frames = static_cast<float>(filled_);
  for (std::size_t c = 0; c < Stereo::channels(); ++c) {
    // Running sums can drift slightly below zero.
    result[c] = std::sqrt(std::max(sum_[c], 0.0F) / frames);
  }
  return result;
}

}  // namespace stepgrid
