#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "core/Constants.h"

namespace stepgrid {

enum class EffectKind {
  kChord = 0,
  kVelocity,
  kOffset,
};

struct Effect {
  EffectKind kind{EffectKind::kVelocity};
  int value{0};

  bool operator==(const Effect& other) const = default;
};

inline constexpr std::size_t kEffectSlots = 2;

// Content of one (track, line) cell. Every field is optional.
struct Step {
  std::optional<int> pitch;
  std::optional<std::size_t> instrument;
  std::array<std::optional<Effect>, kEffectSlots> effects{};

  [[nodiscard]] bool empty() const;
  // Value of the first effect slot holding `kind`.
  [[nodiscard]] std::optional<int> effect(EffectKind kind) const;

  bool operator==(const Step& other) const = default;
};

// Editable grid: one column of kMaxPatternLength steps per instrument
// track. Only the first length() lines are played; steps past it are
// kept so shrinking and growing the pattern is lossless.
class Pattern {
 public:
  explicit Pattern(std::size_t num_tracks = 0,
                   std::size_t length = kDefaultPatternLength);

  [[nodiscard]] std::size_t length() const { return length_; }
  [[nodiscard]] std::size_t num_tracks() const { return tracks_.size(); }

  bool set_length(std::size_t length, std::string* error = nullptr);

  void InsertTrack(std::size_t index);
  bool RemoveTrack(std::size_t index);

  // Out-of-range positions read as an empty step.
  [[nodiscard]] const Step& step(std::size_t track, std::size_t line) const;
  [[nodiscard]] Step* mutable_step(std::size_t track, std::size_t line);

  bool SetStep(std::size_t track, std::size_t line, const Step& step,
               std::string* error = nullptr);
  bool ClearStep(std::size_t track, std::size_t line,
                 std::string* error = nullptr);

  bool operator==(const Pattern& other) const = default;

 private:
  std::size_t length_;
  std::vector<std::vector<Step>> tracks_;
};

// Keyboard note entry: z s x d c v g b h n j m play the twelve semitones
// of `octave`, 'a' is note-off. Returns nullopt for any other key or a
// pitch out of range.
[[nodiscard]] std::optional<int> KeyToPitch(char key, int octave);

// Extra semitones encoded by a chord effect value: its hundreds, tens
// and units digits, zero digits skipped.
[[nodiscard]] std::vector<int> ChordOffsets(int value);

bool ValidatePitch(int pitch, std::string* error = nullptr);
bool ValidateEffect(const Effect& effect, std::string* error = nullptr);

}  // namespace stepgrid
