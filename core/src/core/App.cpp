#include "core/App.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "core/Delay.h"
#include "core/Engine.h"
#include "core/Sampler.h"

namespace stepgrid {

namespace {

constexpr int kMinBpm = 20;
constexpr int kMaxBpm = 999;
constexpr int kMaxLinesPerBeat = 32;
constexpr int kMaxOctave = 8;
constexpr double kDefaultDelaySeconds = 0.25;

bool Fail(std::string* error, const std::string& message)
{
  if (error != nullptr) {
    *error = message;
  }
  return false;
}

}  // namespace

App::App() : link_(std::make_shared<EngineLink>())
{
  const PatternId id = next_pattern_id_++;
  patterns_.emplace(id, Pattern(0, kDefaultPatternLength));
  state_.song.push_back(id);
  RecompileAll();
  Publish();
}

App::~App() = default;

std::unique_ptr<Engine> App::CreateEngine()
{
  if (engine_created_) {
    return nullptr;
  }
  engine_created_ = true;
  return std::make_unique<Engine>(link_);
}

void App::Publish()
{
  link_->app_state.Publish(state_);
}

std::vector<TrackRoute> App::Routes() const
{
  std::vector<TrackRoute> routes;
  for (const auto& track : state_.tracks) {
    if (track.kind != TrackKind::kInstrument) {
      continue;
    }
    const NodeIndex device =
        track.devices.empty() ? kMainOutput : track.devices.front();
    routes.push_back(TrackRoute{track.node, device});
  }
  return routes;
}

void App::RecompileAll()
{
  const auto routes = Routes();
  state_.patterns.clear();
  for (const auto& [id, pattern] : patterns_) {
    state_.patterns[id] = std::make_shared<const EnginePattern>(
        CompilePattern(pattern, state_.instruments, routes));
  }
}

void App::RecompileSelected()
{
  const PatternId id = state_.song[state_.selected_position];
  state_.patterns[id] = std::make_shared<const EnginePattern>(
      CompilePattern(patterns_.at(id), state_.instruments, Routes()));
}

Track* App::FindTrack(const NodeIndex node)
{
  for (auto& track : state_.tracks) {
    if (track.node == node) {
      return &track;
    }
  }
  return nullptr;
}

std::optional<std::size_t> App::ColumnOf(const NodeIndex track) const
{
  std::size_t column = 0;
  for (const auto& candidate : state_.tracks) {
    if (candidate.kind != TrackKind::kInstrument) {
      continue;
    }
    if (candidate.node == track) {
      return column;
    }
    ++column;
  }
  return std::nullopt;
}

std::size_t App::num_columns() const
{
  return static_cast<std::size_t>(std::count_if(
      state_.tracks.begin(), state_.tracks.end(), [](const Track& track) {
        return track.kind == TrackKind::kInstrument;
      }));
}

const Pattern& App::selected_pattern() const
{
  return patterns_.at(state_.song[state_.selected_position]);
}

Pattern& App::mutable_selected_pattern()
{
  return patterns_.at(state_.song[state_.selected_position]);
}

bool App::ValidOutput(const NodeIndex output, const NodeIndex track,
                      std::string* error) const
{
  if (output == kMainOutput) {
    return true;
  }
  const Track* bus = state_.FindTrack(output);
  if (bus == nullptr || bus->kind != TrackKind::kBus || output == track) {
    return Fail(error, "invalid output track");
  }
  return true;
}

bool App::HasCommandRoom(const std::size_t count, std::string* error) const
{
  // Only this thread pushes, so the free space can only grow until the
  // commands are sent.
  if (link_->commands.size() + count > link_->commands.capacity()) {
    return Fail(error, "unable to send message to engine");
  }
  return true;
}

bool App::Send(EngineCommand command, std::string* error)
{
  if (!link_->commands.Push(std::move(command))) {
    return Fail(error, "unable to send message to engine");
  }
  return true;
}

bool App::CommitTracks(std::vector<Track> tracks, std::string* error)
{
  std::vector<NodeEntry> order;
  if (!ComputeNodeOrder(tracks, &order, error)) {
    return false;
  }
  state_.tracks = std::move(tracks);
  state_.node_order = std::move(order);
  return true;
}

void App::TogglePlay()
{
  state_.playing = !state_.playing;
  Publish();
}

bool App::SetBpm(const int bpm, std::string* error)
{
  if (bpm < kMinBpm || bpm > kMaxBpm) {
    return Fail(error, "bpm must be between " + std::to_string(kMinBpm) +
                           " and " + std::to_string(kMaxBpm));
  }
  state_.bpm = bpm;
  Publish();
  return true;
}

bool App::SetLinesPerBeat(const int lines_per_beat, std::string* error)
{
  if (lines_per_beat < 1 || lines_per_beat > kMaxLinesPerBeat) {
    return Fail(error, "lines per beat must be between 1 and " +
                           std::to_string(kMaxLinesPerBeat));
  }
  state_.lines_per_beat = lines_per_beat;
  Publish();
  return true;
}

bool App::SetOctave(const int octave, std::string* error)
{
  if (octave < 0 || octave > kMaxOctave) {
    return Fail(error, "invalid octave");
  }
  state_.octave = octave;
  Publish();
  return true;
}

bool App::CreateTrack(const TrackKind kind, const NodeIndex output,
                      std::string name, NodeIndex* created,
                      std::string* error)
{
  if (!ValidOutput(output, kMainOutput, error)) {
    return false;
  }

  const auto track_node = nodes_.Reserve(NodeRange::kTrack, error);
  if (!track_node.has_value()) {
    return false;
  }

  Track track;
  track.kind = kind;
  track.node = *track_node;
  track.output = output;
  track.name = std::move(name);

  std::optional<NodeIndex> device_node;
  if (kind == TrackKind::kInstrument) {
    device_node = nodes_.Reserve(NodeRange::kDevice, error);
    if (!device_node.has_value()) {
      nodes_.Release(*track_node);
      return false;
    }
    track.devices.push_back(*device_node);
  }

  const auto release_nodes = [this, track_node, device_node]() {
    nodes_.Release(*track_node);
    if (device_node.has_value()) {
      nodes_.Release(*device_node);
    }
  };

  std::vector<Track> tracks = state_.tracks;
  tracks.push_back(track);
  std::vector<NodeEntry> order;
  if (!ComputeNodeOrder(tracks, &order, error)) {
    release_nodes();
    return false;
  }

  if (device_node.has_value()) {
    auto sampler = std::make_unique<Sampler>(track.name);
    auto params = sampler->params();
    EngineCommand command;
    command.type = EngineCommandType::kCreateDevice;
    command.node = *device_node;
    command.device = std::move(sampler);
    if (!Send(std::move(command), error)) {
      release_nodes();
      return false;
    }
    device_params_[*device_node] = std::move(params);

    const std::size_t column = num_columns();
    for (auto& [id, pattern] : patterns_) {
      pattern.InsertTrack(column);
    }
  }

  state_.tracks = std::move(tracks);
  state_.node_order = std::move(order);
  RecompileAll();
  Publish();

  if (created != nullptr) {
    *created = *track_node;
  }
  return true;
}

bool App::DeleteTrack(const NodeIndex node, std::string* error)
{
  const auto it = std::find_if(
      state_.tracks.begin(), state_.tracks.end(),
      [node](const Track& track) { return track.node == node; });
  if (it == state_.tracks.end()) {
    return Fail(error, "invalid track");
  }
  for (const auto& other : state_.tracks) {
    if (other.output == node) {
      return Fail(error, "track is used as output by '" + other.name + "'");
    }
  }
  if (!HasCommandRoom(it->devices.size(), error)) {
    return false;
  }

  const Track removed = *it;
  std::vector<Track> tracks = state_.tracks;
  tracks.erase(tracks.begin() + (it - state_.tracks.begin()));
  const auto column = ColumnOf(node);
  if (!CommitTracks(std::move(tracks), error)) {
    return false;
  }
  if (column.has_value()) {
    for (auto& [id, pattern] : patterns_) {
      pattern.RemoveTrack(*column);
    }
  }
  RecompileAll();
  Publish();

  for (const NodeIndex device : removed.devices) {
    EngineCommand command;
    command.type = EngineCommandType::kDeleteDevice;
    command.node = device;
    if (!Send(std::move(command), error)) {
      return false;
    }
    device_params_.erase(device);
    nodes_.Release(device);
  }
  nodes_.Release(node);
  return true;
}

bool App::SetTrackOutput(const NodeIndex node, const NodeIndex output,
                         std::string* error)
{
  Track* track = FindTrack(node);
  if (track == nullptr) {
    return Fail(error, "invalid track");
  }
  if (!ValidOutput(output, node, error)) {
    return false;
  }

  std::vector<Track> tracks = state_.tracks;
  for (auto& candidate : tracks) {
    if (candidate.node == node) {
      candidate.output = output;
    }
  }
  if (!CommitTracks(std::move(tracks), error)) {
    return false;
  }
  Publish();
  return true;
}

bool App::SetVolume(const NodeIndex node, const float volume_db,
                    std::string* error)
{
  Track* track = FindTrack(node);
  if (track == nullptr) {
    return Fail(error, "invalid track");
  }
  if (!(volume_db >= kMinVolumeDb && volume_db <= kMaxVolumeDb)) {
    return Fail(error, "volume out of range");
  }
  track->volume_db = volume_db;
  Publish();
  return true;
}

bool App::StepVolume(const NodeIndex node, const int steps, std::string* error)
{
  Track* track = FindTrack(node);
  if (track == nullptr) {
    return Fail(error, "invalid track");
  }
  track->volume_db =
      std::clamp(track->volume_db + static_cast<float>(steps) * kVolumeStepDb,
                 kMinVolumeDb, kMaxVolumeDb);
  Publish();
  return true;
}

bool App::ToggleMute(const NodeIndex node, std::string* error)
{
  Track* track = FindTrack(node);
  if (track == nullptr) {
    return Fail(error, "invalid track");
  }
  track->muted = !track->muted;
  Publish();
  return true;
}

bool App::InstallDevice(const NodeIndex node, std::unique_ptr<Device> device,
                        NodeIndex* created, std::string* error)
{
  Track* track = FindTrack(node);
  if (track == nullptr) {
    return Fail(error, "invalid track");
  }

  const auto device_node = nodes_.Reserve(NodeRange::kDevice, error);
  if (!device_node.has_value()) {
    return false;
  }

  std::vector<Track> tracks = state_.tracks;
  for (auto& candidate : tracks) {
    if (candidate.node == node) {
      candidate.devices.push_back(*device_node);
    }
  }
  std::vector<NodeEntry> order;
  if (!ComputeNodeOrder(tracks, &order, error)) {
    nodes_.Release(*device_node);
    return false;
  }

  auto params = device->params();
  EngineCommand command;
  command.type = EngineCommandType::kCreateDevice;
  command.node = *device_node;
  command.device = std::move(device);
  if (!Send(std::move(command), error)) {
    nodes_.Release(*device_node);
    return false;
  }

  device_params_[*device_node] = std::move(params);
  state_.tracks = std::move(tracks);
  state_.node_order = std::move(order);
  Publish();

  if (created != nullptr) {
    *created = *device_node;
  }
  return true;
}

bool App::AddEffect(const NodeIndex track, const std::string& name,
                    NodeIndex* created, std::string* error)
{
  if (name == "delay") {
    const auto frames =
        static_cast<std::size_t>(std::lround(kDefaultDelaySeconds * kSampleRate));
    return AddDelay(track, frames, created, error);
  }
  return Fail(error, "invalid effect name '" + name + "'");
}

bool App::AddDelay(const NodeIndex track, const std::size_t delay_frames,
                   NodeIndex* created, std::string* error)
{
  if (delay_frames == 0) {
    return Fail(error, "delay time must be at least one frame");
  }
  if (FindTrack(track) == nullptr) {
    return Fail(error, "invalid track");
  }
  // The delay line is allocated here, never on the audio thread.
  return InstallDevice(track, std::make_unique<Delay>(delay_frames), created,
                       error);
}

bool App::RemoveEffect(const NodeIndex node, const NodeIndex device,
                       std::string* error)
{
  Track* track = FindTrack(node);
  if (track == nullptr) {
    return Fail(error, "invalid track");
  }
  const auto it = std::find(track->devices.begin(), track->devices.end(), device);
  if (it == track->devices.end()) {
    return Fail(error, "invalid device");
  }
  if (track->kind == TrackKind::kInstrument && it == track->devices.begin()) {
    return Fail(error, "cannot remove the track instrument");
  }
  if (!HasCommandRoom(1, error)) {
    return false;
  }

  std::vector<Track> tracks = state_.tracks;
  for (auto& candidate : tracks) {
    if (candidate.node == node) {
      candidate.devices.erase(std::find(candidate.devices.begin(),
                                        candidate.devices.end(), device));
    }
  }
  if (!CommitTracks(std::move(tracks), error)) {
    return false;
  }
  Publish();

  EngineCommand command;
  command.type = EngineCommandType::kDeleteDevice;
  command.node = device;
  if (!Send(std::move(command), error)) {
    return false;
  }
  device_params_.erase(device);
  nodes_.Release(device);
  return true;
}

bool App::SetParam(const NodeIndex device, const std::string& name,
                   const float value, std::string* error)
{
  const auto params = device_params(device);
  if (params == nullptr) {
    return Fail(error, "invalid device");
  }
  return params->Set(name, value, error);
}

std::shared_ptr<Params> App::device_params(const NodeIndex device) const
{
  const auto it = device_params_.find(device);
  return it != device_params_.end() ? it->second : nullptr;
}

SoundPtr App::FindCachedSound(const std::string& name) const
{
  const auto it = sound_cache_.find(name);
  return it != sound_cache_.end() ? it->second : nullptr;
}

SoundPtr App::CacheSound(SoundPtr sound)
{
  // A newer buffer under the same name replaces the cached one; slots and
  // voices still playing the old one keep it alive.
  return sound_cache_.insert_or_assign(sound->name, std::move(sound))
      .first->second;
}

bool App::LoadSound(const std::size_t slot, SoundPtr sound, std::string* error)
{
  if (slot >= kMaxInstruments) {
    return Fail(error, "invalid instrument slot");
  }
  if (sound == nullptr || sound->frames.empty()) {
    return Fail(error, "empty sound");
  }
  state_.instruments[slot] = CacheSound(std::move(sound));
  RecompileAll();
  Publish();
  return true;
}

bool App::ClearSound(const std::size_t slot, std::string* error)
{
  if (slot >= kMaxInstruments) {
    return Fail(error, "invalid instrument slot");
  }
  state_.instruments[slot] = nullptr;
  RecompileAll();
  Publish();
  return true;
}

bool App::PreviewSound(SoundPtr sound, std::string* error)
{
  if (sound == nullptr || sound->frames.empty()) {
    return Fail(error, "empty sound");
  }
  EngineCommand command;
  command.type = EngineCommandType::kPreviewSound;
  command.sound = CacheSound(std::move(sound));
  return Send(std::move(command), error);
}

bool App::EditStep(const std::size_t column, const std::size_t line,
                   const Step& step, std::string* error)
{
  if (!mutable_selected_pattern().SetStep(column, line, step, error)) {
    return false;
  }
  RecompileSelected();
  Publish();
  return true;
}

bool App::SetStep(const std::size_t column, const std::size_t line,
                  const Step& step, std::string* error)
{
  return EditStep(column, line, step, error);
}

bool App::SetKey(const std::size_t column, const std::size_t line,
                 const char key, std::string* error)
{
  const auto pitch = KeyToPitch(key, state_.octave);
  if (!pitch.has_value()) {
    return Fail(error, std::string("invalid key '") + key + "'");
  }
  Step step = selected_pattern().step(column, line);
  step.pitch = *pitch;
  return EditStep(column, line, step, error);
}

bool App::SetNoteOff(const std::size_t column, const std::size_t line,
                     std::string* error)
{
  Step step = selected_pattern().step(column, line);
  step.pitch = kNoteOff;
  return EditStep(column, line, step, error);
}

bool App::ClearStep(const std::size_t column, const std::size_t line,
                    std::string* error)
{
  if (!mutable_selected_pattern().ClearStep(column, line, error)) {
    return false;
  }
  RecompileSelected();
  Publish();
  return true;
}

bool App::SetStepInstrument(const std::size_t column, const std::size_t line,
                            const std::optional<std::size_t> slot,
                            std::string* error)
{
  Step step = selected_pattern().step(column, line);
  step.instrument = slot;
  return EditStep(column, line, step, error);
}

bool App::SetStepEffect(const std::size_t column, const std::size_t line,
                        const std::size_t effect_slot,
                        const std::optional<Effect> effect, std::string* error)
{
  if (effect_slot >= kEffectSlots) {
    return Fail(error, "invalid effect slot");
  }
  Step step = selected_pattern().step(column, line);
  step.effects[effect_slot] = effect;
  return EditStep(column, line, step, error);
}

bool App::SetPatternLength(const std::size_t length, std::string* error)
{
  if (!mutable_selected_pattern().set_length(length, error)) {
    return false;
  }
  RecompileSelected();
  Publish();
  return true;
}

void App::InsertIntoSong(const std::size_t position, const PatternId id)
{
  state_.song.insert(state_.song.begin() + static_cast<std::ptrdiff_t>(position),
                     id);
  state_.selected_position = position;
}

bool App::CreatePattern(std::string* error)
{
  if (state_.song.size() >= kMaxPatterns) {
    return Fail(error, "reached max. number of patterns");
  }
  const PatternId id = next_pattern_id_++;
  patterns_.emplace(id, Pattern(num_columns(), selected_pattern().length()));
  InsertIntoSong(state_.selected_position + 1, id);
  RecompileSelected();
  Publish();
  return true;
}

bool App::ClonePattern(std::string* error)
{
  if (state_.song.size() >= kMaxPatterns) {
    return Fail(error, "reached max. number of patterns");
  }
  const PatternId id = next_pattern_id_++;
  patterns_.emplace(id, selected_pattern());
  InsertIntoSong(state_.selected_position + 1, id);
  RecompileSelected();
  Publish();
  return true;
}

bool App::RepeatPattern(std::string* error)
{
  if (state_.song.size() >= kMaxPatterns) {
    return Fail(error, "reached max. number of patterns");
  }
  InsertIntoSong(state_.selected_position + 1,
                 state_.song[state_.selected_position]);
  Publish();
  return true;
}

bool App::DeletePattern(std::string* error)
{
  if (state_.song.size() <= 1) {
    return Fail(error, "cannot delete the last pattern");
  }

  const std::size_t position = state_.selected_position;
  const PatternId id = state_.song[position];
  state_.song.erase(state_.song.begin() + static_cast<std::ptrdiff_t>(position));

  if (std::find(state_.song.begin(), state_.song.end(), id) == state_.song.end()) {
    patterns_.erase(id);
    state_.patterns.erase(id);
  }

  state_.selected_position = std::min(position, state_.song.size() - 1);
  if (state_.loop_range == LoopRange{position, position}) {
    // The loop only covered the deleted position.
    state_.loop_range.reset();
  } else if (state_.loop_range.has_value()) {
    auto& [start, end] = *state_.loop_range;
    if (start > position) {
      --start;
    }
    if (end >= position && end > 0) {
      --end;
    }
    end = std::min(end, state_.song.size() - 1);
    if (start > end) {
      state_.loop_range.reset();
    }
  }
  Publish();
  return true;
}

bool App::SelectPattern(const std::size_t position, std::string* error)
{
  if (position >= state_.song.size()) {
    return Fail(error, "invalid song position");
  }
  state_.selected_position = position;
  Publish();
  return true;
}

void App::ToggleLoop()
{
  if (state_.loop_range.has_value()) {
    state_.loop_range.reset();
  } else {
    state_.loop_range =
        LoopRange{state_.selected_position, state_.selected_position};
  }
  Publish();
}

bool App::ExtendLoop(const std::size_t position, std::string* error)
{
  if (position >= state_.song.size()) {
    return Fail(error, "invalid song position");
  }
  if (!state_.loop_range.has_value()) {
    state_.loop_range = LoopRange{position, position};
  } else {
    auto& [start, end] = *state_.loop_range;
    start = std::min(start, position);
    end = std::max(end, position);
  }
  Publish();
  return true;
}

void App::ClearLoop()
{
  state_.loop_range.reset();
  Publish();
}

std::uint64_t App::Update()
{
  std::unique_ptr<Device> device;
  while (link_->disposals.Pop(device)) {
    device.reset();
    ++disposed_devices_;
  }

  // Whatever only the cache still references can go; snapshots and
  // voices holding a sound keep it alive.
  for (auto it = sound_cache_.begin(); it != sound_cache_.end();) {
    if (it->second.use_count() == 1) {
      it = sound_cache_.erase(it);
    } else {
      ++it;
    }
  }

  engine_state_ = link_->engine_state.Read();
  const std::uint64_t dropped = engine_state_.dropped_events - reported_drops_;
  reported_drops_ = engine_state_.dropped_events;
  return dropped;
}

}  // namespace stepgrid
