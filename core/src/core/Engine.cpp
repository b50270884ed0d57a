#include "core/Engine.h"

#include <algorithm>
#include <utility>

namespace stepgrid {

namespace {

// Column used by one-shot previews.
constexpr NodeIndex kPreviewColumn = kMainOutput;

// Track volume changes are smoothed over about 10 ms.
constexpr std::size_t kTrackGainSmoothing = 441;

struct TickLess {
  bool operator()(const Event& event, const std::size_t tick) const
  {
    return event.tick < tick;
  }
  bool operator()(const std::size_t tick, const Event& event) const
  {
    return tick < event.tick;
  }
};

}  // namespace

Engine::Engine(std::shared_ptr<EngineLink> link)
    : link_(std::move(link)),
      buffers_(static_cast<std::size_t>(kNumBuffers) * kMaxBlockFrames),
      interleave_(kMaxBlockFrames),
      preview_("preview")
{
  for (auto& gain : track_gains_) {
    gain = ExpSmoothing(0.0F, kTrackGainSmoothing);
  }
}

Engine::~Engine() = default;

bool Engine::ValidDeviceNode(const NodeIndex node)
{
  return node >= kMaxTracks && node < kMaxNodes;
}

Stereo* Engine::buffer(const int id) noexcept
{
  if (id < 0 || id >= kNumBuffers) {
    return nullptr;
  }
  return buffers_.data() + static_cast<std::size_t>(id) * kMaxBlockFrames;
}

void Engine::Dispose(std::unique_ptr<Device> device) noexcept
{
  if (device == nullptr) {
    return;
  }
  if (link_->disposals.Push(std::move(device))) {
    return;
  }
  if (num_pending_disposals_ < pending_disposals_.size()) {
    pending_disposals_[num_pending_disposals_++] = std::move(device);
  }
}

void Engine::FlushDisposals() noexcept
{
  std::size_t kept = 0;
  for (std::size_t i = 0; i < num_pending_disposals_; ++i) {
    auto& device = pending_disposals_[i];
    if (!link_->disposals.Push(std::move(device))) {
      pending_disposals_[kept++] = std::move(device);
    }
  }
  num_pending_disposals_ = kept;
}

void Engine::RunCommands() noexcept
{
  FlushDisposals();

  EngineCommand command;
  while (link_->commands.Pop(command)) {
    switch (command.type) {
      case EngineCommandType::kCreateDevice:
        if (ValidDeviceNode(command.node)) {
          auto& slot = devices_[static_cast<std::size_t>(command.node)];
          Dispose(std::move(slot));
          slot = std::move(command.device);
        } else {
          Dispose(std::move(command.device));
        }
        break;

      case EngineCommandType::kDeleteDevice:
        if (ValidDeviceNode(command.node)) {
          Dispose(std::move(devices_[static_cast<std::size_t>(command.node)]));
        }
        break;

      case EngineCommandType::kPreviewSound:
        if (!preview_.NoteOn(command.sound, kPreviewColumn, kRootPitch,
                             kDefaultVelocity, ++tick_serial_)) {
          ++dropped_events_;
        }
        break;

      case EngineCommandType::kNone:
        break;
    }
  }
}

void Engine::FollowTransport(const AppState& state) noexcept
{
  if (state.playing && !playing_) {
    current_pattern_ = state.selected_position;
    current_tick_ = 0;
    frames_to_tick_ = 0;
  } else if (!state.playing && playing_) {
    for (auto& device : devices_) {
      if (device != nullptr) {
        device->ReleaseAll();
      }
    }
  }
  playing_ = state.playing;
}

void Engine::Tick(const AppState& state) noexcept
{
  const EnginePattern* pattern = state.PatternAt(current_pattern_);
  if (pattern == nullptr || current_tick_ >= pattern->length) {
    // Deleted or shortened behind our back: continue with the next
    // position in loop order.
    current_pattern_ = state.NextPattern(current_pattern_);
    current_tick_ = 0;
    pattern = state.PatternAt(current_pattern_);
  }

  ++tick_serial_;
  if (pattern != nullptr) {
    const AudioContext context{&state, tick_serial_};
    const auto due = std::equal_range(pattern->events.begin(),
                                      pattern->events.end(), current_tick_,
                                      TickLess{});
    for (auto it = due.first; it != due.second; ++it) {
      if (!ValidDeviceNode(it->device)) {
        continue;
      }
      Device* device = devices_[static_cast<std::size_t>(it->device)].get();
      if (device != nullptr && !device->SendEvent(context, *it)) {
        ++dropped_events_;
      }
    }
  }

  frames_to_tick_ = state.FramesPerTick();

  ++current_tick_;
  if (pattern == nullptr || current_tick_ >= pattern->length) {
    current_tick_ = 0;
    current_pattern_ = state.NextPattern(current_pattern_);
  }
}

void Engine::MixTrack(const AppState& state, const NodeIndex node,
                      Stereo* output, const std::size_t frames) noexcept
{
  if (node < 0 || node >= kMaxTracks) {
    return;
  }
  const auto index = static_cast<std::size_t>(node);
  Stereo* source = buffer(node);
  const Track* track = state.FindTrack(node);
  if (track == nullptr) {
    std::fill(source, source + frames, Stereo{});
    return;
  }

  Stereo* destination = output;
  if (track->output != kMainOutput && track->output != node &&
      track->output < kMaxTracks && state.FindTrack(track->output) != nullptr) {
    destination = buffer(track->output);
  }

  const float target = track->muted ? 0.0F : DbToGain(track->volume_db);
  ExpSmoothing& gain = track_gains_[index];
  if (!previously_mixed_.test(index) && !mixed_tracks_.test(index)) {
    // New track on this node: start from its own level.
    gain.Reset(target);
    meters_[index].Reset();
  }
  gain.set_target(target);
  mixed_tracks_.set(index);

  Rms& meter = meters_[index];
  for (std::size_t i = 0; i < frames; ++i) {
    const Stereo frame = source[i] * gain.Next();
    meter.Add(frame);
    destination[i] += frame;
    source[i] = Stereo{};
  }
}

void Engine::RenderBlock(const AppState& state, Stereo* output,
                         const std::size_t frames) noexcept
{
  const AudioContext context{&state, tick_serial_};

  for (const NodeEntry& entry : state.node_order) {
    if (!entry.buffers.has_value()) {
      MixTrack(state, entry.node, output, frames);
      continue;
    }
    if (!ValidDeviceNode(entry.node)) {
      continue;
    }
    Device* device = devices_[static_cast<std::size_t>(entry.node)].get();
    Stereo* input = buffer(entry.buffers->input);
    Stereo* target = buffer(entry.buffers->output);
    if (device == nullptr || input == nullptr || target == nullptr) {
      continue;
    }
    device->Render(context, input, target, frames);
  }

  preview_.Render(context, nullptr, output, frames);
}

void Engine::PublishState(const AppState& state) noexcept
{
  EngineState published;
  published.current_tick = current_tick_;
  published.current_pattern = current_pattern_;
  published.playing = state.playing;
  for (std::size_t i = 0; i < meters_.size(); ++i) {
    published.rms[i] = meters_[i].value();
  }
  published.dropped_events = dropped_events_;
  published.rendered_frames = rendered_frames_;
  link_->engine_state.Publish(published);
}

void Engine::Render(Stereo* output, const std::size_t frames) noexcept
{
  RunCommands();
  const AppState& state = link_->app_state.Read();
  FollowTransport(state);

  std::fill(output, output + frames, Stereo{});
  mixed_tracks_.reset();

  std::size_t done = 0;
  while (done < frames) {
    if (playing_ && frames_to_tick_ == 0) {
      Tick(state);
    }

    std::size_t block = std::min(frames - done, kMaxBlockFrames);
    if (playing_) {
      block = std::min(block, frames_to_tick_);
    }

    RenderBlock(state, output + done, block);

    if (playing_) {
      frames_to_tick_ -= block;
    }
    done += block;
  }

  previously_mixed_ = mixed_tracks_;
  rendered_frames_ += frames;
  PublishState(state);
}

void Engine::RenderInterleaved(float* output, const std::size_t frames) noexcept
{
  std::size_t done = 0;
  while (done < frames) {
    const std::size_t block = std::min(frames - done, kMaxBlockFrames);
    Render(interleave_.data(), block);
    for (std::size_t i = 0; i < block; ++i) {
      output[(done + i) * 2] = interleave_[i][0];
      output[(done + i) * 2 + 1] = interleave_[i][1];
    }
    done += block;
  }
}

}  // namespace stepgrid
