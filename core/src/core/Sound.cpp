#include "core/Sound.h"

#include <cmath>
#include <utility>

namespace stepgrid {

std::size_t FindLeadingSilence(const std::vector<Stereo>& frames,
                               const float threshold)
{
  for (std::size_t i = 0; i < frames.size(); ++i) {
    const Stereo& frame = frames[i];
    if (std::fabs(frame[0]) >= threshold || std::fabs(frame[1]) >= threshold) {
      return i;
    }
  }
  return 0;
}

SoundPtr MakeSound(std::string name, std::vector<Stereo> frames,
                   const double sample_rate, std::string* error)
{
  if (frames.empty()) {
    if (error != nullptr) {
      *error = "empty sound";
    }
    return nullptr;
  }
  if (!(sample_rate > 0.0)) {
    if (error != nullptr) {
      *error = "invalid sample rate";
    }
    return nullptr;
  }

  auto sound = std::make_shared<Sound>();
  sound->name = std::move(name);
  sound->offset = FindLeadingSilence(frames);
  sound->frames = std::move(frames);
  sound->sample_rate = sample_rate;
  return sound;
}

}  // namespace stepgrid
