#include "core/Delay.h"

#include <algorithm>
#include <utility>

namespace stepgrid {

Delay::Delay(const std::size_t delay_frames, std::string name)
    : Device(std::move(name)),
      buffer_(std::max<std::size_t>(delay_frames, 1)),
      feedback_(&params_->Add({"feedback", "", 0.0F, 0.99F, kDefaultFeedback})),
      dry_(&params_->Add({"dry", "", 0.0F, 1.0F, kDefaultDry})),
      wet_(&params_->Add({"wet", "", 0.0F, 1.0F, kDefaultWet})) {}

void Delay::Render(const AudioContext& context, const Stereo* input,
                   Stereo* output, const std::size_t frames) noexcept
{
  (void)context;

  const float feedback = feedback_->value();
  const float dry = dry_->value();
  const float wet = wet_->value();

  for (std::size_t i = 0; i < frames; ++i) {
    const Stereo in = input != nullptr ? input[i] : Stereo{};
    // The slot under the cursor was written one buffer length ago.
    const Stereo delayed = buffer_[cursor_];
    buffer_[cursor_] = in + delayed * feedback;
    cursor_ = (cursor_ + 1) % buffer_.size();
    output[i] = in * dry + delayed * wet;
  }
}

}  // namespace stepgrid
