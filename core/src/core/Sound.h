#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "core/Frame.h"

namespace stepgrid {

// Decoded sample data. Immutable once built and shared by every voice
// and instrument slot that plays it.
struct Sound {
  std::string name;
  std::vector<Stereo> frames;
  double sample_rate{0.0};
  // First audible frame, used as the default playback start.
  std::size_t offset{0};
};

using SoundPtr = std::shared_ptr<const Sound>;

inline constexpr float kSilenceThreshold = 0.01F;

// Index of the first frame where either channel reaches `threshold`,
// or 0 when the whole buffer stays below it.
[[nodiscard]] std::size_t FindLeadingSilence(
    const std::vector<Stereo>& frames, float threshold = kSilenceThreshold);

// Builds a shared Sound and computes its leading-silence offset.
// Returns nullptr and fills `error` when the buffer or the rate is
// unusable.
[[nodiscard]] SoundPtr MakeSound(std::string name, std::vector<Stereo> frames,
                                 double sample_rate,
                                 std::string* error = nullptr);

}  // namespace stepgrid
