#pragma once

#include <cstddef>

namespace stepgrid {

using NodeIndex = int;

inline constexpr double kSampleRate = 44100.0;

// Scheduling resolution. Per-step micro timing ranges over
// [0, kTicksPerLine - 1].
inline constexpr std::size_t kTicksPerLine = 6;

inline constexpr std::size_t kMaxPatternLength = 512;
inline constexpr std::size_t kDefaultPatternLength = 16;
inline constexpr std::size_t kMaxPatterns = 256;

inline constexpr std::size_t kMaxVoices = 8;
inline constexpr std::size_t kMaxInstruments = 32;

// Node indices: [0, kMaxTracks) for tracks and [kMaxTracks, kMaxNodes)
// for devices.
inline constexpr NodeIndex kMaxTracks = 32;
inline constexpr NodeIndex kMaxNodes = 128;
inline constexpr NodeIndex kMainOutput = -1;

inline constexpr std::size_t kCommandQueueCapacity = 64;
inline constexpr std::size_t kMaxBlockFrames = 512;

inline constexpr int kRootPitch = 48;
inline constexpr int kNoteOff = 109;
inline constexpr int kMaxPitch = kNoteOff;
inline constexpr int kDefaultVelocity = 100;
inline constexpr int kMaxVelocity = 127;

}  // namespace stepgrid
