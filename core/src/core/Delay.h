#pragma once

#include <cstddef>
#include <vector>

#include "core/Device.h"

namespace stepgrid {

// Feedback delay over a circular buffer of `delay_frames` frames. The
// buffer is allocated here, on the control thread.
class Delay : public Device {
 public:
  explicit Delay(std::size_t delay_frames, std::string name = "delay");

  static constexpr float kDefaultFeedback = 0.5F;
  static constexpr float kDefaultDry = 0.8F;
  static constexpr float kDefaultWet = 0.8F;

  void Render(const AudioContext& context, const Stereo* input, Stereo* output,
              std::size_t frames) noexcept override;

  [[nodiscard]] std::size_t delay_frames() const { return buffer_.size(); }

 private:
  std::vector<Stereo> buffer_;
  std::size_t cursor_{0};

  Param* feedback_;
  Param* dry_;
  Param* wet_;
};

}  // namespace stepgrid
