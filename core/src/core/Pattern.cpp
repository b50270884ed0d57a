#include "core/Pattern.h"

#include <algorithm>
#include <string_view>

namespace stepgrid {

namespace {

constexpr std::string_view kNoteKeys = "zsxdcvgbhnjm";
constexpr char kNoteOffKey = 'a';
constexpr int kMaxOctave = 8;
constexpr int kMaxChordValue = 999;
constexpr int kMaxOffsetValue = 99;

const Step kEmptyStep;

bool PositionError(std::string* error)
{
  if (error != nullptr) {
    *error = "invalid pattern position";
  }
  return false;
}

}  // namespace

bool Step::empty() const
{
  return !pitch.has_value() && !instrument.has_value() &&
         std::none_of(effects.begin(), effects.end(),
                      [](const auto& effect) { return effect.has_value(); });
}

std::optional<int> Step::effect(const EffectKind kind) const
{
  for (const auto& slot : effects) {
    if (slot.has_value() && slot->kind == kind) {
      return slot->value;
    }
  }
  return std::nullopt;
}

Pattern::Pattern(const std::size_t num_tracks, const std::size_t length)
    : length_(std::clamp<std::size_t>(length, 1, kMaxPatternLength)),
      tracks_(num_tracks, std::vector<Step>(kMaxPatternLength))
{
}

bool Pattern::set_length(const std::size_t length, std::string* error)
{
  if (length == 0 || length > kMaxPatternLength) {
    if (error != nullptr) {
      *error = "pattern length must be between 1 and " +
               std::to_string(kMaxPatternLength);
    }
    return false;
  }
  length_ = length;
  return true;
}

void Pattern::InsertTrack(const std::size_t index)
{
  const std::size_t at = std::min(index, tracks_.size());
  tracks_.insert(tracks_.begin() + static_cast<std::ptrdiff_t>(at),
                 std::vector<Step>(kMaxPatternLength));
}

bool Pattern::RemoveTrack(const std::size_t index)
{
  if (index >= tracks_.size()) {
    return false;
  }
  tracks_.erase(tracks_.begin() + static_cast<std::ptrdiff_t>(index));
  return true;
}

const Step& Pattern::step(const std::size_t track, const std::size_t line) const
{
  if (track >= tracks_.size() || line >= kMaxPatternLength) {
    return kEmptyStep;
  }
  return tracks_[track][line];
}

Step* Pattern::mutable_step(const std::size_t track, const std::size_t line)
{
  if (track >= tracks_.size() || line >= length_) {
    return nullptr;
  }
  return &tracks_[track][line];
}

bool Pattern::SetStep(const std::size_t track, const std::size_t line,
                      const Step& step, std::string* error)
{
  Step* target = mutable_step(track, line);
  if (target == nullptr) {
    return PositionError(error);
  }
  if (step.pitch.has_value() && !ValidatePitch(*step.pitch, error)) {
    return false;
  }
  if (step.instrument.has_value() && *step.instrument >= kMaxInstruments) {
    if (error != nullptr) {
      *error = "invalid instrument slot";
    }
    return false;
  }
  for (const auto& effect : step.effects) {
    if (effect.has_value() && !ValidateEffect(*effect, error)) {
      return false;
    }
  }
  *target = step;
  return true;
}

bool Pattern::ClearStep(const std::size_t track, const std::size_t line,
                        std::string* error)
{
  Step* target = mutable_step(track, line);
  if (target == nullptr) {
    return PositionError(error);
  }
  *target = Step{};
  return true;
}

std::optional<int> KeyToPitch(const char key, const int octave)
{
  if (key == kNoteOffKey) {
    return kNoteOff;
  }
  const auto semitone = kNoteKeys.find(key);
  if (semitone == std::string_view::npos || octave < 0 || octave > kMaxOctave) {
    return std::nullopt;
  }
  const int pitch = octave * 12 + static_cast<int>(semitone);
  if (pitch >= kMaxPitch) {
    return std::nullopt;
  }
  return pitch;
}

std::vector<int> ChordOffsets(const int value)
{
  std::vector<int> offsets;
  const int clamped = std::clamp(value, 0, kMaxChordValue);
  for (const int digit : {clamped / 100, (clamped / 10) % 10, clamped % 10}) {
    if (digit != 0) {
      offsets.push_back(digit);
    }
  }
  return offsets;
}

bool ValidatePitch(const int pitch, std::string* error)
{
  if (pitch < 0 || pitch > kNoteOff) {
    if (error != nullptr) {
      *error = "invalid pitch " + std::to_string(pitch);
    }
    return false;
  }
  return true;
}

bool ValidateEffect(const Effect& effect, std::string* error)
{
  int max = 0;
  switch (effect.kind) {
    case EffectKind::kChord:
      max = kMaxChordValue;
      break;
    case EffectKind::kVelocity:
      max = kMaxVelocity;
      break;
    case EffectKind::kOffset:
      max = kMaxOffsetValue;
      break;
  }
  if (effect.value < 0 || effect.value > max) {
    if (error != nullptr) {
      *error = "effect value " + std::to_string(effect.value) +
               " out of range [0, " + std::to_string(max) + "]";
    }
    return false;
  }
  return true;
}

}  // namespace stepgrid
