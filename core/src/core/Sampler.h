#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "core/Constants.h"
#include "core/Device.h"
#include "core/Envelope.h"

namespace stepgrid {

// Polyphonic sample player with a fixed pool of kMaxVoices voices.
//
// Parameters: attack/decay/release in milliseconds, sustain level and
// gain in dB. A note-on stops (short release) the notes still sounding
// on the same column, unless they were started by the same tick, so
// chords are kept together. When no voice is free the note is dropped
// and counted.
class Sampler : public Device {
 public:
  explicit Sampler(std::string name = "sampler",
                   double sample_rate = kSampleRate);

  bool SendEvent(const AudioContext& context, const Event& event) noexcept override;
  void Render(const AudioContext& context, const Stereo* input, Stereo* output,
              std::size_t frames) noexcept override;
  void ReleaseAll() noexcept override;

  // Returns false only when the note was dropped for lack of a free
  // voice.
  bool NoteOn(const SoundPtr& sound, NodeIndex column, int pitch, int velocity,
              std::uint64_t serial) noexcept;
  // kNoteOff as pitch releases every note of the column.
  void NoteOff(NodeIndex column, int pitch) noexcept;

  [[nodiscard]] std::size_t active_voices() const;
  [[nodiscard]] std::uint64_t dropped_events() const { return dropped_events_; }

 private:
  struct Voice {
    SoundPtr sound;
    Envelope envelope;
    double position{0.0};
    double pitch_ratio{1.0};
    float volume{1.0F};
    NodeIndex column{kMainOutput};
    int pitch{0};
    std::uint64_t serial{0};
    bool busy{false};
  };

  void FreeVoice(Voice& voice) noexcept;
  void UpdateEnvelopes() noexcept;

  double sample_rate_;
  std::array<Voice, kMaxVoices> voices_;
  std::uint64_t dropped_events_{0};

  Param* attack_;
  Param* decay_;
  Param* sustain_;
  Param* release_;
  Param* gain_;
};

}  // namespace stepgrid
