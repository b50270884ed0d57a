#pragma once

#include "core/Constants.h"
#include "core/Param.h"

namespace stepgrid {

// ADSR amplitude envelope evaluated once per sample. Each stage moves
// the output toward a target slightly past its end point through a
// one-pole filter, so every stage finishes in finite time.
class Envelope {
 public:
  enum class State {
    kIdle = 0,
    kAttack,
    kDecay,
    kSustain,
    kRelease,
  };

  explicit Envelope(double sample_rate = kSampleRate);

  // Times in seconds, sustain in [0, 1]. Poles are only recomputed when
  // a value actually changes.
  void SetParameters(float attack, float decay, float sustain, float release);

  void NoteOn() noexcept;
  void NoteOff() noexcept;
  // Short release used when a voice is retriggered.
  void Stop() noexcept;
  void Reset() noexcept;

  float Next() noexcept;

  [[nodiscard]] State state() const { return state_; }
  [[nodiscard]] float value() const { return value_; }
  [[nodiscard]] bool idle() const { return state_ == State::kIdle; }

  static constexpr float kOvershoot = 0.001F;
  static constexpr float kStopSeconds = 0.005F;

 private:
  [[nodiscard]] float Pole(float seconds, float distance) const;
  void UpdatePoles();

  double sample_rate_;
  State state_{State::kIdle};
  float value_{0.0F};
  float target_{0.0F};
  float pole_{0.0F};

  float attack_{0.001F};
  float decay_{0.2F};
  float sustain_{1.0F};
  float release_{0.1F};

  float attack_pole_{0.0F};
  float decay_pole_{0.0F};
  float release_pole_{0.0F};
  float stop_pole_{0.0F};

  ExpSmoothing smoothed_sustain_;
};

}  // namespace stepgrid
