#pragma once

#include <array>
#include <bitset>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "core/AppState.h"
#include "core/Constants.h"
#include "core/Device.h"
#include "core/EngineCommand.h"
#include "core/Param.h"
#include "core/Rms.h"
#include "core/Sampler.h"

namespace stepgrid {

// Audio-thread side of the instrument: owns the devices, follows the
// published AppState and renders the song.
//
// Each Render() call drains pending commands, picks up the latest
// snapshot and renders in sub-blocks that end exactly on tick
// boundaries, dispatching the events of a tick before rendering the
// frames that follow it. Nothing here blocks or allocates after
// construction.
class Engine {
 public:
  explicit Engine(std::shared_ptr<EngineLink> link);

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;
  Engine(Engine&&) = delete;
  Engine& operator=(Engine&&) = delete;

  ~Engine();

  // Overwrites `output` with the next `frames` frames.
  void Render(Stereo* output, std::size_t frames) noexcept;
  // Same, as interleaved left/right floats.
  void RenderInterleaved(float* output, std::size_t frames) noexcept;

  [[nodiscard]] std::size_t current_tick() const { return current_tick_; }
  [[nodiscard]] std::size_t current_pattern() const { return current_pattern_; }
  [[nodiscard]] std::uint64_t dropped_events() const { return dropped_events_; }

 private:
  void RunCommands() noexcept;
  void Dispose(std::unique_ptr<Device> device) noexcept;
  void FlushDisposals() noexcept;
  void FollowTransport(const AppState& state) noexcept;
  void Tick(const AppState& state) noexcept;
  void RenderBlock(const AppState& state, Stereo* output,
                   std::size_t frames) noexcept;
  void MixTrack(const AppState& state, NodeIndex node, Stereo* output,
                std::size_t frames) noexcept;
  void PublishState(const AppState& state) noexcept;

  [[nodiscard]] Stereo* buffer(int id) noexcept;
  [[nodiscard]] static bool ValidDeviceNode(NodeIndex node);

  std::shared_ptr<EngineLink> link_;

  std::array<std::unique_ptr<Device>, kMaxNodes> devices_;
  // Devices the disposal queue could not take yet.
  std::array<std::unique_ptr<Device>, kMaxNodes> pending_disposals_;
  std::size_t num_pending_disposals_{0};

  // kNumBuffers buffers of kMaxBlockFrames frames, back to back.
  std::vector<Stereo> buffers_;
  std::vector<Stereo> interleave_;

  std::array<Rms, kMaxTracks> meters_;
  std::array<ExpSmoothing, kMaxTracks> track_gains_;
  std::bitset<kMaxTracks> mixed_tracks_;
  std::bitset<kMaxTracks> previously_mixed_;

  Sampler preview_;

  bool playing_{false};
  std::size_t current_pattern_{0};
  std::size_t current_tick_{0};
  std::size_t frames_to_tick_{0};
  std::uint64_t tick_serial_{0};
  std::uint64_t dropped_events_{0};
  std::uint64_t rendered_frames_{0};
};

}  // namespace stepgrid
