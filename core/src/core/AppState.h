#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "core/Constants.h"
#include "core/Event.h"
#include "core/Frame.h"
#include "core/Routing.h"
#include "core/Sound.h"

namespace stepgrid {

using PatternId = int;

// Inclusive range of song positions.
using LoopRange = std::pair<std::size_t, std::size_t>;

// Snapshot published by the control thread for the audio thread.
struct AppState {
  int bpm{120};
  int lines_per_beat{4};
  int octave{4};
  bool playing{false};
  // Song position playback starts from.
  std::size_t selected_position{0};

  std::vector<PatternId> song;
  std::map<PatternId, std::shared_ptr<const EnginePattern>> patterns;
  std::optional<LoopRange> loop_range;

  std::vector<Track> tracks;
  std::array<SoundPtr, kMaxInstruments> instruments{};
  std::vector<NodeEntry> node_order;

  // Song position following `current`, wrapping inside the loop range
  // (or the whole song when none is set).
  [[nodiscard]] std::size_t NextPattern(std::size_t current) const;

  // Compiled pattern at a song position, or nullptr when the position
  // or its pattern is gone.
  [[nodiscard]] const EnginePattern* PatternAt(std::size_t position) const;

  [[nodiscard]] const Track* FindTrack(NodeIndex node) const;

  // Frames between two ticks at the current tempo, at least 1.
  [[nodiscard]] std::size_t FramesPerTick() const;
};

// Snapshot published by the audio thread for the control thread.
struct EngineState {
  std::size_t current_tick{0};
  std::size_t current_pattern{0};
  bool playing{false};
  // Indexed by track node.
  std::array<Stereo, kMaxTracks> rms{};
  std::uint64_t dropped_events{0};
  std::uint64_t rendered_frames{0};
};

}  // namespace stepgrid
