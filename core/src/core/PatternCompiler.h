#pragma once

#include <array>
#include <vector>

#include "core/Constants.h"
#include "core/Event.h"
#include "core/Pattern.h"
#include "core/Sound.h"

namespace stepgrid {

// Where the notes of one pattern column go: the track's routing node
// and the device (its sampler) that plays them.
struct TrackRoute {
  NodeIndex track{kMainOutput};
  NodeIndex device{kMainOutput};
};

using InstrumentSlots = std::array<SoundPtr, kMaxInstruments>;

// Flattens the playable part of `pattern` into tick-sorted events.
// Column i uses routes[i]; columns without a route and steps whose
// instrument slot is empty produce nothing. Runs on the control thread.
[[nodiscard]] EnginePattern CompilePattern(const Pattern& pattern,
                                           const InstrumentSlots& instruments,
                                           const std::vector<TrackRoute>& routes);

}  // namespace stepgrid
