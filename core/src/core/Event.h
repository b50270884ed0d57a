#pragma once

#include <cstddef>
#include <vector>

#include "core/Constants.h"

namespace stepgrid {

enum class EventKind {
  kNoteOn = 0,
  kNoteOff,
};

// Compiled note occurrence inside one pattern loop.
struct Event {
  std::size_t tick{0};
  EventKind kind{EventKind::kNoteOn};
  int pitch{kRootPitch};
  int velocity{kDefaultVelocity};
  std::size_t instrument{0};
  // Routing column the note belongs to (the originating track).
  NodeIndex track{kMainOutput};
  // Device receiving the event.
  NodeIndex device{kMainOutput};

  bool operator==(const Event& other) const = default;
};

// Events of one pattern, sorted by tick. `length` is in ticks.
struct EnginePattern {
  std::vector<Event> events;
  std::size_t length{0};
};

}  // namespace stepgrid
