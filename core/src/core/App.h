#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/AppState.h"
#include "core/EngineCommand.h"
#include "core/NodeIndex.h"
#include "core/Param.h"
#include "core/Pattern.h"
#include "core/PatternCompiler.h"
#include "core/Routing.h"
#include "core/Sound.h"

namespace stepgrid {

class Engine;

// Control-thread side of the instrument. Owns the editable song and is
// the only writer of AppState.
//
// Every operation either applies completely, recompiles what it
// affected and publishes one new snapshot, or returns false with a
// message in `error` and leaves the state as it was.
class App {
 public:
  App();
  ~App();

  App(const App&) = delete;
  App& operator=(const App&) = delete;
  App(App&&) = delete;
  App& operator=(App&&) = delete;

  // The engine fed by this App, to be driven by the audio thread. Only
  // one engine can be attached; later calls return nullptr.
  [[nodiscard]] std::unique_ptr<Engine> CreateEngine();

  void TogglePlay();
  bool SetBpm(int bpm, std::string* error = nullptr);
  bool SetLinesPerBeat(int lines_per_beat, std::string* error = nullptr);
  bool SetOctave(int octave, std::string* error = nullptr);

  // `output` is a bus track node or kMainOutput. Instrument tracks get
  // a sampler and a new pattern column.
  bool CreateTrack(TrackKind kind, NodeIndex output, std::string name,
                   NodeIndex* created = nullptr, std::string* error = nullptr);
  bool DeleteTrack(NodeIndex track, std::string* error = nullptr);
  bool SetTrackOutput(NodeIndex track, NodeIndex output,
                      std::string* error = nullptr);
  bool SetVolume(NodeIndex track, float volume_db,
                 std::string* error = nullptr);
  bool StepVolume(NodeIndex track, int steps, std::string* error = nullptr);
  bool ToggleMute(NodeIndex track, std::string* error = nullptr);

  // Appends an effect by name ("delay") to the end of a track's chain.
  bool AddEffect(NodeIndex track, const std::string& name,
                 NodeIndex* created = nullptr, std::string* error = nullptr);
  bool AddDelay(NodeIndex track, std::size_t delay_frames,
                NodeIndex* created = nullptr, std::string* error = nullptr);
  bool RemoveEffect(NodeIndex track, NodeIndex device,
                    std::string* error = nullptr);
  bool SetParam(NodeIndex device, const std::string& name, float value,
                std::string* error = nullptr);
  [[nodiscard]] std::shared_ptr<Params> device_params(NodeIndex device) const;

  bool LoadSound(std::size_t slot, SoundPtr sound,
                 std::string* error = nullptr);
  bool ClearSound(std::size_t slot, std::string* error = nullptr);
  bool PreviewSound(SoundPtr sound, std::string* error = nullptr);
  [[nodiscard]] SoundPtr FindCachedSound(const std::string& name) const;

  // Step editing on the selected pattern. `column` counts instrument
  // tracks in creation order.
  bool SetStep(std::size_t column, std::size_t line, const Step& step,
               std::string* error = nullptr);
  bool SetKey(std::size_t column, std::size_t line, char key,
              std::string* error = nullptr);
  bool SetNoteOff(std::size_t column, std::size_t line,
                  std::string* error = nullptr);
  bool ClearStep(std::size_t column, std::size_t line,
                 std::string* error = nullptr);
  bool SetStepInstrument(std::size_t column, std::size_t line,
                         std::optional<std::size_t> slot,
                         std::string* error = nullptr);
  bool SetStepEffect(std::size_t column, std::size_t line,
                     std::size_t effect_slot, std::optional<Effect> effect,
                     std::string* error = nullptr);
  bool SetPatternLength(std::size_t length, std::string* error = nullptr);

  // Song editing relative to the selected position.
  bool CreatePattern(std::string* error = nullptr);
  bool ClonePattern(std::string* error = nullptr);
  bool RepeatPattern(std::string* error = nullptr);
  bool DeletePattern(std::string* error = nullptr);
  bool SelectPattern(std::size_t position, std::string* error = nullptr);

  void ToggleLoop();
  bool ExtendLoop(std::size_t position, std::string* error = nullptr);
  void ClearLoop();

  // Housekeeping for every control cycle: frees devices handed back by
  // the engine, drops sounds nothing plays any more and refreshes the
  // engine view. Returns the number of events dropped since last call.
  std::uint64_t Update();

  [[nodiscard]] const AppState& state() const { return state_; }
  [[nodiscard]] const EngineState& engine_state() const
  {
    return engine_state_;
  }
  [[nodiscard]] const Pattern& selected_pattern() const;
  [[nodiscard]] std::size_t num_columns() const;
  [[nodiscard]] std::size_t disposed_devices() const
  {
    return disposed_devices_;
  }
  [[nodiscard]] std::size_t cached_sounds() const
  {
    return sound_cache_.size();
  }

 private:
  void Publish();
  void RecompileAll();
  void RecompileSelected();
  [[nodiscard]] std::vector<TrackRoute> Routes() const;
  [[nodiscard]] Track* FindTrack(NodeIndex node);
  [[nodiscard]] std::optional<std::size_t> ColumnOf(NodeIndex track) const;
  [[nodiscard]] Pattern& mutable_selected_pattern();
  [[nodiscard]] bool ValidOutput(NodeIndex output, NodeIndex track,
                                 std::string* error) const;
  [[nodiscard]] bool HasCommandRoom(std::size_t count,
                                    std::string* error) const;
  bool Send(EngineCommand command, std::string* error);
  // Installs `tracks` together with their render order.
  bool CommitTracks(std::vector<Track> tracks, std::string* error);
  bool EditStep(std::size_t column, std::size_t line, const Step& step,
                std::string* error);
  bool InstallDevice(NodeIndex track, std::unique_ptr<Device> device,
                     NodeIndex* created, std::string* error);
  SoundPtr CacheSound(SoundPtr sound);
  void InsertIntoSong(std::size_t position, PatternId id);

  std::shared_ptr<EngineLink> link_;
  bool engine_created_{false};

  AppState state_;
  EngineState engine_state_;
  std::map<PatternId, Pattern> patterns_;
  PatternId next_pattern_id_{0};

  NodeIndexAllocator nodes_;
  std::map<NodeIndex, std::shared_ptr<Params>> device_params_;
  std::map<std::string, SoundPtr> sound_cache_;

  std::uint64_t reported_drops_{0};
  std::size_t disposed_devices_{0};
};

}  // namespace stepgrid
