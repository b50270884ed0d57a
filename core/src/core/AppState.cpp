#include "core/AppState.h"

#include <algorithm>
#include <cmath>

namespace stepgrid {

std::size_t AppState::NextPattern(const std::size_t current) const
{
  if (song.empty()) {
    return 0;
  }

  const std::size_t last = song.size() - 1;
  auto [start, end] = loop_range.value_or(LoopRange{0, last});
  // A range left over from a longer song is cut to the current one.
  end = std::min(end, last);
  start = std::min(start, end);

  const std::size_t next = current + 1;
  if (next > end) {
    return start;
  }
  return next;
}

const EnginePattern* AppState::PatternAt(const std::size_t position) const
{
  if (position >= song.size()) {
    return nullptr;
  }
  const auto it = patterns.find(song[position]);
  if (it == patterns.end() || it->second == nullptr) {
    return nullptr;
  }
  return it->second.get();
}

const Track* AppState::FindTrack(const NodeIndex node) const
{
  for (const auto& track : tracks) {
    if (track.node == node) {
      return &track;
    }
  }
  return nullptr;
}

std::size_t AppState::FramesPerTick() const
{
  const double ticks_per_second = static_cast<double>(std::max(bpm, 1)) *
                                  static_cast<double>(std::max(lines_per_beat, 1)) *
                                  static_cast<double>(kTicksPerLine) / 60.0;
  const auto frames =
      static_cast<std::size_t>(std::lround(kSampleRate / ticks_per_second));
  return std::max<std::size_t>(frames, 1);
}

}  // namespace stepgrid
