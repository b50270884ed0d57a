#include "core/Sampler.h"

#include <cmath>
#include <utility>

namespace stepgrid {

namespace {

constexpr float kMillisecond = 0.001F;

}  // namespace

Sampler::Sampler(std::string name, const double sample_rate)
    : Device(std::move(name)),
      sample_rate_(sample_rate > 0.0 ? sample_rate : kSampleRate),
      attack_(&params_->Add({"attack", "ms", 1.0F, 20000.0F, 1.0F})),
      decay_(&params_->Add({"decay", "ms", 5.0F, 20000.0F, 200.0F})),
      sustain_(&params_->Add({"sustain", "", 0.0F, 1.0F, 1.0F})),
      release_(&params_->Add({"release", "ms", 5.0F, 20000.0F, 100.0F})),
      gain_(&params_->Add({"gain", "dB", -60.0F, 6.0F, 0.0F}))
{
  for (auto& voice : voices_) {
    voice.envelope = Envelope(sample_rate_);
  }
  UpdateEnvelopes();
}

bool Sampler::SendEvent(const AudioContext& context, const Event& event) noexcept
{
  if (event.kind == EventKind::kNoteOff || event.pitch == kNoteOff) {
    NoteOff(event.track, event.pitch);
    return true;
  }

  // The slot may have been cleared since the pattern was compiled.
  const SoundPtr& sound = context.sound(event.instrument);
  if (sound == nullptr) {
    return true;
  }
  return NoteOn(sound, event.track, event.pitch, event.velocity,
                context.tick_serial);
}

bool Sampler::NoteOn(const SoundPtr& sound, const NodeIndex column,
                     const int pitch, const int velocity,
                     const std::uint64_t serial) noexcept
{
  if (pitch == kNoteOff) {
    NoteOff(column, pitch);
    return true;
  }
  if (sound == nullptr || sound->frames.empty()) {
    return true;
  }

  for (auto& voice : voices_) {
    if (voice.busy && voice.column == column &&
        (voice.serial != serial || voice.pitch == pitch)) {
      voice.envelope.Stop();
    }
  }

  Voice* free_voice = nullptr;
  for (auto& voice : voices_) {
    if (!voice.busy) {
      free_voice = &voice;
      break;
    }
  }
  if (free_voice == nullptr) {
    ++dropped_events_;
    return false;
  }

  Voice& voice = *free_voice;
  // Only a free voice takes the new sound; one still sounding keeps the
  // buffer it started with.
  voice.sound = sound;
  voice.position = static_cast<double>(sound->offset);
  voice.pitch_ratio =
      std::pow(2.0, static_cast<double>(pitch - kRootPitch) / 12.0) *
      (sound->sample_rate / sample_rate_);
  voice.volume = VelocityToGain(velocity);
  voice.column = column;
  voice.pitch = pitch;
  voice.serial = serial;
  voice.busy = true;
  voice.envelope.Reset();
  voice.envelope.NoteOn();
  return true;
}

void Sampler::NoteOff(const NodeIndex column, const int pitch) noexcept
{
  for (auto& voice : voices_) {
    if (voice.busy && voice.column == column &&
        (pitch == kNoteOff || voice.pitch == pitch)) {
      voice.envelope.NoteOff();
    }
  }
}

void Sampler::ReleaseAll() noexcept
{
  for (auto& voice : voices_) {
    if (voice.busy) {
      voice.envelope.NoteOff();
    }
  }
}

std::size_t Sampler::active_voices() const
{
  std::size_t count = 0;
  for (const auto& voice : voices_) {
    if (voice.busy) {
      ++count;
    }
  }
  return count;
}

void Sampler::FreeVoice(Voice& voice) noexcept
{
  voice.busy = false;
  voice.envelope.Reset();
  voice.position =
      voice.sound != nullptr ? static_cast<double>(voice.sound->offset) : 0.0;
}

void Sampler::UpdateEnvelopes() noexcept
{
  const float attack = attack_->value() * kMillisecond;
  const float decay = decay_->value() * kMillisecond;
  const float sustain = sustain_->value();
  const float release = release_->value() * kMillisecond;
  for (auto& voice : voices_) {
    voice.envelope.SetParameters(attack, decay, sustain, release);
  }
}

void Sampler::Render(const AudioContext& context, const Stereo* input,
                     Stereo* output, const std::size_t frames) noexcept
{
  (void)context;
  (void)input;

  UpdateEnvelopes();
  const float gain = DbToGain(gain_->value());

  for (auto& voice : voices_) {
    if (!voice.busy) {
      continue;
    }
    if (voice.envelope.idle() || voice.sound == nullptr) {
      FreeVoice(voice);
      continue;
    }

    const std::vector<Stereo>& samples = voice.sound->frames;
    const double last = static_cast<double>(samples.size() - 1);

    for (std::size_t i = 0; i < frames; ++i) {
      if (voice.position >= last) {
        FreeVoice(voice);
        break;
      }

      const auto index = static_cast<std::size_t>(voice.position);
      const auto fraction =
          static_cast<float>(voice.position - static_cast<double>(index));
      const Stereo& a = samples[index];
      const Stereo& b = samples[index + 1];
      const Stereo sample = a + (b - a) * fraction;

      const float level = voice.envelope.Next() * voice.volume * gain;
      output[i] += sample * level;
      voice.position += voice.pitch_ratio;
    }

    if (voice.busy && voice.envelope.idle()) {
      FreeVoice(voice);
    }
  }
}

}  // namespace stepgrid
