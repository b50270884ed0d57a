#include "core/PatternCompiler.h"

#include <algorithm>

namespace stepgrid {

namespace {

void EmitStep(const Step& step, const std::size_t tick,
              const std::size_t instrument, const TrackRoute& route,
              std::vector<Event>* events)
{
  Event event;
  event.tick = tick;
  event.instrument = instrument;
  event.track = route.track;
  event.device = route.device;

  if (*step.pitch == kNoteOff) {
    event.kind = EventKind::kNoteOff;
    event.pitch = kNoteOff;
    events->push_back(event);
    return;
  }

  event.kind = EventKind::kNoteOn;
  event.pitch = *step.pitch;
  event.velocity = std::clamp(
      step.effect(EffectKind::kVelocity).value_or(kDefaultVelocity), 0,
      kMaxVelocity);
  events->push_back(event);

  if (const auto chord = step.effect(EffectKind::kChord)) {
    for (const int offset : ChordOffsets(*chord)) {
      const int pitch = *step.pitch + offset;
      if (pitch >= kMaxPitch) {
        continue;
      }
      event.pitch = pitch;
      events->push_back(event);
    }
  }
}

}  // namespace

EnginePattern CompilePattern(const Pattern& pattern,
                             const InstrumentSlots& instruments,
                             const std::vector<TrackRoute>& routes)
{
  EnginePattern compiled;
  compiled.length = pattern.length() * kTicksPerLine;

  const std::size_t num_tracks = std::min(pattern.num_tracks(), routes.size());
  for (std::size_t track = 0; track < num_tracks; ++track) {
    std::size_t tick = 0;
    for (std::size_t line = 0; line < pattern.length();
         ++line, tick += kTicksPerLine) {
      const Step& step = pattern.step(track, line);
      if (!step.pitch.has_value()) {
        continue;
      }

      const std::size_t instrument = step.instrument.value_or(track);
      if (instrument >= instruments.size() || instruments[instrument] == nullptr) {
        continue;
      }

      const int offset = std::clamp(step.effect(EffectKind::kOffset).value_or(0),
                                    0, static_cast<int>(kTicksPerLine) - 1);
      EmitStep(step, tick + static_cast<std::size_t>(offset), instrument,
               routes[track], &compiled.events);
    }
  }

  std::stable_sort(compiled.events.begin(), compiled.events.end(),
                   [](const Event& lhs, const Event& rhs) {
                     return lhs.tick < rhs.tick;
                   });
  return compiled;
}

}  // namespace stepgrid
