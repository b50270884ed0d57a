#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/Constants.h"

namespace stepgrid {

enum class TrackKind {
  kInstrument = 0,
  kBus,
};

inline constexpr float kDefaultVolumeDb = -6.0F;
inline constexpr float kMinVolumeDb = -60.0F;
inline constexpr float kMaxVolumeDb = 3.0F;
inline constexpr float kVolumeStepDb = 0.25F;

struct Track {
  TrackKind kind{TrackKind::kInstrument};
  NodeIndex node{0};
  // Bus track node, or kMainOutput.
  NodeIndex output{kMainOutput};
  // Device nodes in signal order. Instrument tracks start with their
  // sampler, the rest are effects.
  std::vector<NodeIndex> devices;
  float volume_db{kDefaultVolumeDb};
  bool muted{false};
  std::string name;
};

// Buffer ids used by node entries. Ids below kMaxTracks are the per
// track buffers (same value as the track node), followed by the two
// shared scratch buffers.
inline constexpr int kScratchBufferA = kMaxTracks;
inline constexpr int kScratchBufferB = kMaxTracks + 1;
inline constexpr int kNumBuffers = kMaxTracks + 2;

struct BufferPair {
  int input{0};
  int output{0};

  bool operator==(const BufferPair& other) const = default;
};

// One step of the render order. Device entries carry the buffers they
// read and write; track entries (no pair) mix the track buffer into
// the track's output.
struct NodeEntry {
  NodeIndex node{0};
  std::optional<BufferPair> buffers;

  bool operator==(const NodeEntry& other) const = default;
};

// Builds the render order so that every track comes after all tracks
// routed into it. Fails when the output assignments contain a cycle.
bool ComputeNodeOrder(const std::vector<Track>& tracks,
                      std::vector<NodeEntry>* order,
                      std::string* error = nullptr);

}  // namespace stepgrid
