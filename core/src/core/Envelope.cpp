#include "core/Envelope.h"

#include <algorithm>
#include <cmath>

namespace stepgrid {

namespace {

// Roughly 50 ms at 44.1 kHz.
constexpr std::size_t kSustainSmoothingSamples = 2205;

}  // namespace

Envelope::Envelope(const double sample_rate)
    : sample_rate_(sample_rate > 0.0 ? sample_rate : kSampleRate),
      smoothed_sustain_(sustain_, kSustainSmoothingSamples)
{
  UpdatePoles();
}

float Envelope::Pole(const float seconds, const float distance) const
{
  // Solves distance * pole^n == kOvershoot for n = seconds * rate, i.e.
  // the output lands on the stage end point after `seconds`.
  const double samples =
      std::max(static_cast<double>(seconds) * sample_rate_, 1.0);
  const double ratio = kOvershoot / std::max(distance, kOvershoot);
  return static_cast<float>(std::pow(ratio, 1.0 / samples));
}

void Envelope::UpdatePoles()
{
  attack_pole_ = Pole(attack_, 1.0F + kOvershoot);
  decay_pole_ = Pole(decay_, 1.0F - sustain_ + kOvershoot);
  // Release is measured from full scale so the slope does not depend on
  // the level the voice is released from.
  release_pole_ = Pole(release_, 1.0F + kOvershoot);
  stop_pole_ = Pole(kStopSeconds, 1.0F + kOvershoot);
}

void Envelope::SetParameters(const float attack, const float decay,
                             const float sustain, const float release)
{
  const float clamped_sustain = std::clamp(sustain, 0.0F, 1.0F);
  if (attack == attack_ && decay == decay_ && clamped_sustain == sustain_ &&
      release == release_) {
    return;
  }
  attack_ = std::max(attack, 0.0F);
  decay_ = std::max(decay, 0.0F);
  sustain_ = clamped_sustain;
  release_ = std::max(release, 0.0F);
  smoothed_sustain_.set_target(sustain_);
  UpdatePoles();

  switch (state_) {
    case State::kAttack:
      pole_ = attack_pole_;
      break;
    case State::kDecay:
      pole_ = decay_pole_;
      target_ = sustain_ - kOvershoot;
      break;
    case State::kRelease:
      pole_ = release_pole_;
      break;
    default:
      break;
  }
}

void Envelope::NoteOn() noexcept
{
  state_ = State::kAttack;
  target_ = 1.0F + kOvershoot;
  pole_ = attack_pole_;
}

void Envelope::NoteOff() noexcept
{
  if (state_ == State::kIdle) {
    return;
  }
  state_ = State::kRelease;
  target_ = -kOvershoot;
  pole_ = release_pole_;
}

void Envelope::Stop() noexcept
{
  if (state_ == State::kIdle) {
    return;
  }
  state_ = State::kRelease;
  target_ = -kOvershoot;
  pole_ = std::min(pole_, stop_pole_);
}

void Envelope::Reset() noexcept
{
  state_ = State::kIdle;
  value_ = 0.0F;
  target_ = 0.0F;
  smoothed_sustain_.Reset(sustain_);
}

float Envelope::Next() noexcept
{
  const float sustain = smoothed_sustain_.Next();

  switch (state_) {
    case State::kIdle:
      value_ = 0.0F;
      break;

    case State::kAttack:
      value_ = target_ + (value_ - target_) * pole_;
      if (value_ >= 1.0F) {
        value_ = 1.0F;
        state_ = State::kDecay;
        target_ = sustain_ - kOvershoot;
        pole_ = decay_pole_;
      }
      break;

    case State::kDecay:
      value_ = target_ + (value_ - target_) * pole_;
      if (value_ <= sustain) {
        value_ = sustain;
        state_ = sustain > 0.0F ? State::kSustain : State::kIdle;
      }
      break;

    case State::kSustain:
      value_ = sustain;
      if (value_ <= 0.0F) {
        state_ = State::kIdle;
      }
      break;

    case State::kRelease:
      value_ = target_ + (value_ - target_) * pole_;
      if (value_ <= 0.0F) {
        value_ = 0.0F;
        state_ = State::kIdle;
      }
      break;
  }

  return value_;
}

}  // namespace stepgrid
