#include <algorithm>
#include <atomic>
#include <cassert>
#include <cmath>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "TestSounds.h"
#include "core/App.h"
#include "core/Engine.h"

// Control thread / audio thread behaviour of App and Engine, driven the
// way a host drives them: edits on one side, Render() on the other.

using stepgrid::App;
using stepgrid::AppState;
using stepgrid::Effect;
using stepgrid::EffectKind;
using stepgrid::Engine;
using stepgrid::LoopRange;
using stepgrid::NodeIndex;
using stepgrid::Stereo;
using stepgrid::TrackKind;
using stepgrid::kMainOutput;

namespace {

constexpr std::size_t kFramesPerTick = 919;
constexpr std::size_t kFramesPerLine = kFramesPerTick * stepgrid::kTicksPerLine;

double energy(const std::vector<Stereo>& frames, const std::size_t begin,
              const std::size_t end)
{
    double sum = 0.0;
    for (std::size_t i = begin; i < end && i < frames.size(); ++i) {
        sum += static_cast<double>(frames[i][0]) * frames[i][0] +
               static_cast<double>(frames[i][1]) * frames[i][1];
    }
    return sum;
}

void render(Engine& engine, const std::size_t frames)
{
    std::vector<Stereo> buffer(frames);
    engine.Render(buffer.data(), buffer.size());
}

// Bus to main, one instrument into it playing a kick on lines 0, 4, 8
// and 12 of a 16 line pattern.
void setUpFourOnTheFloor(App& app, NodeIndex* instrument = nullptr)
{
    NodeIndex bus = kMainOutput;
    NodeIndex lead = kMainOutput;
    assert(app.SetBpm(120));
    assert(app.CreateTrack(TrackKind::kBus, kMainOutput, "master", &bus));
    assert(app.CreateTrack(TrackKind::kInstrument, bus, "kick", &lead));
    assert(app.LoadSound(0, MakeKick()));
    assert(app.SetPatternLength(16));
    for (std::size_t line = 0; line < 16; line += 4) {
        assert(app.SetKey(0, line, 'z'));
    }
    if (instrument != nullptr) {
        *instrument = lead;
    }
}

std::vector<Stereo> renderOneSecond()
{
    App app;
    auto engine = app.CreateEngine();
    setUpFourOnTheFloor(app);
    app.TogglePlay();

    std::vector<Stereo> output(44100);
    for (std::size_t done = 0; done < output.size(); done += 512) {
        const std::size_t block = std::min<std::size_t>(512, output.size() - done);
        engine->Render(output.data() + done, block);
        app.Update();
    }
    return output;
}

}  // namespace

int main()
{
    // Song position order and tempo.
    {
        AppState state;
        assert(state.NextPattern(0) == 0);

        state.song = {0, 1, 2, 3};
        assert(state.NextPattern(0) == 1);
        assert(state.NextPattern(3) == 0);

        state.loop_range = LoopRange{1, 2};
        assert(state.NextPattern(0) == 1);
        assert(state.NextPattern(1) == 2);
        assert(state.NextPattern(2) == 1);
        assert(state.NextPattern(4) == 1);

        // A range from a longer song is cut down to the last position.
        state.loop_range = LoopRange{5, 9};
        assert(state.NextPattern(2) == 3);
        assert(state.NextPattern(3) == 3);

        assert(state.FramesPerTick() == kFramesPerTick);
        state.bpm = 999;
        state.lines_per_beat = 32;
        assert(state.FramesPerTick() >= 1);
    }

    // A sequence renders the same every time, with notes exactly on
    // their tick and silence in between.
    {
        const auto first = renderOneSecond();
        const auto second = renderOneSecond();
        assert(std::memcmp(first.data(), second.data(),
                           first.size() * sizeof(Stereo)) == 0);

        const std::size_t secondNote = 4 * kFramesPerLine;
        assert(secondNote == 22056);
        assert(energy(first, 0, 4000) > 0.1);
        assert(energy(first, 5000, secondNote) == 0.0);
        assert(energy(first, secondNote, secondNote + 4000) > 0.1);
    }

    // Meters, transport position and the engine view.
    {
        App app;
        auto engine = app.CreateEngine();
        assert(engine != nullptr);
        assert(app.CreateEngine() == nullptr);

        NodeIndex lead = kMainOutput;
        setUpFourOnTheFloor(app, &lead);
        app.TogglePlay();
        render(*engine, 512);
        render(*engine, 512);
        assert(app.Update() == 0);
        assert(app.engine_state().playing);
        assert(app.engine_state().rendered_frames == 1024);
        assert(app.engine_state().rms[static_cast<std::size_t>(lead)][0] > 0.0F);
        assert(engine->current_tick() == 2);

        // Muting silences the output once the gain has settled.
        assert(app.ToggleMute(0));
        render(*engine, 2048);
        std::vector<Stereo> muted(512);
        engine->Render(muted.data(), muted.size());
        assert(energy(muted, 0, muted.size()) < 1e-6);

        // Stopping keeps the devices but releases their notes.
        app.TogglePlay();
        render(*engine, 512);
        app.Update();
        assert(!app.engine_state().playing);
    }

    // Looping plays positions 1 and 2 after the first pattern.
    {
        App app;
        auto engine = app.CreateEngine();
        assert(app.CreateTrack(TrackKind::kInstrument, kMainOutput, "lead"));
        assert(app.SetPatternLength(1));
        for (int i = 0; i < 3; ++i) {
            assert(app.CreatePattern());
        }
        assert(app.state().song.size() == 4);
        assert(app.SelectPattern(1));
        app.ToggleLoop();
        assert(app.ExtendLoop(2));
        assert(app.state().loop_range == LoopRange(1, 2));
        assert(app.SelectPattern(0));
        app.TogglePlay();

        const std::vector<std::size_t> expected{1, 2, 1, 2, 1};
        for (const std::size_t position : expected) {
            render(*engine, kFramesPerLine);
            assert(engine->current_pattern() == position);
            assert(engine->current_tick() == 0);
        }
    }

    // Deleting patterns while the engine is playing them.
    {
        App app;
        auto engine = app.CreateEngine();
        setUpFourOnTheFloor(app);
        assert(app.SetPatternLength(1));
        app.TogglePlay();

        std::atomic<bool> running{true};
        std::thread audio([&engine, &running] {
            std::vector<Stereo> buffer(256);
            while (running.load()) {
                engine->Render(buffer.data(), buffer.size());
            }
        });

        for (int i = 0; i < 200; ++i) {
            assert(app.ClonePattern());
            assert(app.SetKey(0, 0, 'x'));
            assert(app.DeletePattern());
            if (i % 3 == 0) {
                assert(app.CreatePattern());
            }
            app.Update();
        }
        running = false;
        audio.join();

        // The next tick moves off any position the last edit removed.
        render(*engine, kFramesPerTick + 1);
        assert(engine->current_pattern() < app.state().song.size());
        assert(app.state().selected_position < app.state().song.size());
    }

    // Step and song editing on the selected pattern.
    {
        App app;
        NodeIndex lead = kMainOutput;
        NodeIndex bus = kMainOutput;
        assert(app.CreateTrack(TrackKind::kInstrument, kMainOutput, "lead", &lead));
        assert(app.LoadSound(0, MakeKick()));
        assert(app.LoadSound(3, MakeKick("snare", 2000)));

        assert(app.SetStepEffect(0, 0, 1, Effect{EffectKind::kVelocity, 64}));
        assert(app.SetKey(0, 0, 'z'));
        assert(app.selected_pattern().step(0, 0).pitch == stepgrid::kRootPitch);
        assert(app.selected_pattern().step(0, 0).effect(EffectKind::kVelocity) == 64);

        assert(app.SetNoteOff(0, 2));
        assert(app.SetStepInstrument(0, 2, 3));
        assert(app.selected_pattern().step(0, 2).pitch == stepgrid::kNoteOff);
        assert(app.selected_pattern().step(0, 2).instrument == 3U);
        assert(app.state().patterns.at(0)->events.size() == 2);
        assert(app.state().patterns.at(0)->events[0].velocity == 64);
        assert(app.ClearStep(0, 2));
        assert(app.state().patterns.at(0)->events.size() == 1);

        assert(app.SetOctave(5));
        assert(app.SetKey(0, 1, 'z'));
        assert(app.selected_pattern().step(0, 1).pitch == 60);

        // Song {0} -> {0, 1} -> {0, 1, 1} -> {0, 1, 1, 2}.
        assert(app.ClonePattern());
        assert(app.state().selected_position == 1);
        assert(app.selected_pattern().step(0, 0).pitch == stepgrid::kRootPitch);
        assert(app.RepeatPattern());
        assert(app.state().selected_position == 2);
        assert(app.CreatePattern());
        assert((app.state().song == std::vector<stepgrid::PatternId>{0, 1, 1, 2}));
        assert(app.selected_pattern().num_tracks() == 1);
        assert(app.selected_pattern().step(0, 0).empty());
        assert(app.state().patterns.size() == 3);

        // Positions 1 and 2 share one pattern.
        assert(app.SelectPattern(1));
        assert(app.SetKey(0, 5, 'x'));
        assert(app.SelectPattern(2));
        assert(app.selected_pattern().step(0, 5).pitch == 62);

        assert(app.SelectPattern(1));
        app.ToggleLoop();
        assert(app.ExtendLoop(3));
        assert(app.state().loop_range == LoopRange(1, 3));

        assert(app.SelectPattern(2));
        assert(app.DeletePattern());
        assert((app.state().song == std::vector<stepgrid::PatternId>{0, 1, 2}));
        assert(app.state().patterns.count(1) == 1);
        assert(app.state().loop_range == LoopRange(1, 2));

        assert(app.DeletePattern());
        assert((app.state().song == std::vector<stepgrid::PatternId>{0, 1}));
        assert(app.state().patterns.count(2) == 0);
        assert(app.state().loop_range == LoopRange(1, 1));
        assert(app.state().selected_position == 1);

        app.ClearLoop();
        assert(!app.state().loop_range.has_value());
        app.ToggleLoop();
        assert(app.state().loop_range == LoopRange(1, 1));
        app.ToggleLoop();
        assert(!app.state().loop_range.has_value());

        // Rerouting into a new bus puts the bus last in the render order.
        assert(app.CreateTrack(TrackKind::kBus, kMainOutput, "master", &bus));
        assert(app.SetTrackOutput(lead, bus));
        assert(app.state().FindTrack(lead)->output == bus);
        assert(app.state().node_order.back().node == bus);
        assert(app.num_columns() == 1);
    }

    // Deleting the only position a loop covers clears the loop.
    {
        App app;
        assert(app.CreatePattern());
        assert(app.state().song.size() == 2);
        assert(app.SelectPattern(0));
        app.ToggleLoop();
        assert(app.state().loop_range == LoopRange(0, 0));
        assert(app.DeletePattern());
        assert(app.state().song.size() == 1);
        assert(!app.state().loop_range.has_value());

        // A loop further down the song shifts with it.
        assert(app.CreatePattern());
        assert(app.CreatePattern());
        assert(app.SelectPattern(2));
        app.ToggleLoop();
        assert(app.SelectPattern(0));
        assert(app.DeletePattern());
        assert(app.state().loop_range == LoopRange(1, 1));
    }

    // Configuration and editing errors leave the state unchanged.
    {
        App app;
        std::string error;
        assert(!app.SetBpm(19, &error));
        assert(!app.SetBpm(1000));
        assert(app.state().bpm == 120);
        assert(!app.SetLinesPerBeat(0));
        assert(!app.SetOctave(9, &error));
        assert(error == "invalid octave");

        NodeIndex bus = kMainOutput;
        NodeIndex other = kMainOutput;
        NodeIndex lead = kMainOutput;
        assert(app.CreateTrack(TrackKind::kBus, kMainOutput, "master", &bus));
        assert(app.CreateTrack(TrackKind::kBus, bus, "group", &other));
        assert(app.CreateTrack(TrackKind::kInstrument, other, "lead", &lead));
        assert(app.num_columns() == 1);

        assert(!app.CreateTrack(TrackKind::kInstrument, lead, "bad", nullptr, &error));
        assert(error == "invalid output track");
        assert(!app.SetTrackOutput(bus, other, &error));
        assert(error == "invalid output track");
        assert(app.state().tracks.front().output == kMainOutput);

        assert(!app.DeleteTrack(other, &error));
        assert(error == "track is used as output by 'lead'");

        assert(!app.SetVolume(lead, -61.0F));
        assert(app.StepVolume(lead, 100));
        assert(app.state().FindTrack(lead)->volume_db == stepgrid::kMaxVolumeDb);
        assert(app.StepVolume(lead, -1));
        assert(app.state().FindTrack(lead)->volume_db ==
               stepgrid::kMaxVolumeDb - stepgrid::kVolumeStepDb);

        assert(!app.SetKey(0, 0, 'q', &error));
        assert(error == "invalid key 'q'");
        assert(!app.SetKey(1, 0, 'z', &error));
        assert(error == "invalid pattern position");
        assert(!app.SetStepEffect(0, 0, 2, std::nullopt, &error));
        assert(error == "invalid effect slot");
        assert(app.selected_pattern().step(0, 0).empty());

        assert(!app.LoadSound(32, MakeKick(), &error));
        assert(error == "invalid instrument slot");
        assert(!app.LoadSound(0, nullptr, &error));
        assert(error == "empty sound");

        assert(!app.AddEffect(lead, "reverb", nullptr, &error));
        assert(error == "invalid effect name 'reverb'");
        const NodeIndex sampler = app.state().FindTrack(lead)->devices.front();
        assert(!app.RemoveEffect(lead, sampler, &error));
        assert(error == "cannot remove the track instrument");
        assert(!app.SetParam(sampler, "cutoff", 1.0F, &error));
        assert(error == "unknown parameter 'cutoff'");
        assert(app.SetParam(sampler, "release", 250.0F));
        assert(app.device_params(sampler)->Find("release")->value() == 250.0F);

        assert(!app.DeletePattern(&error));
        assert(error == "cannot delete the last pattern");
        assert(!app.SelectPattern(1, &error));
        assert(error == "invalid song position");
        assert(!app.SetPatternLength(0));
        assert(app.selected_pattern().length() == stepgrid::kDefaultPatternLength);
    }

    // Command queue and node capacity.
    {
        App app;
        auto engine = app.CreateEngine();
        const auto tone = MakeConstant("tone", 4410, 0.5F);
        std::string error;
        for (std::size_t i = 0; i < stepgrid::kCommandQueueCapacity; ++i) {
            assert(app.PreviewSound(tone));
        }
        assert(!app.PreviewSound(tone, &error));
        assert(error == "unable to send message to engine");
        render(*engine, 64);
        assert(app.PreviewSound(tone));

        for (NodeIndex i = 0; i < stepgrid::kMaxTracks; ++i) {
            assert(app.CreateTrack(TrackKind::kBus, kMainOutput, "bus"));
        }
        assert(!app.CreateTrack(TrackKind::kBus, kMainOutput, "bus", nullptr, &error));
        assert(error == "reached max. number of nodes");
        assert(app.DeleteTrack(31));

        NodeIndex lead = kMainOutput;
        assert(app.CreateTrack(TrackKind::kInstrument, kMainOutput, "lead", &lead));
        int effects = 0;
        while (app.AddDelay(lead, 16, nullptr, &error)) {
            ++effects;
            render(*engine, 64);
        }
        assert(effects == stepgrid::kMaxNodes - stepgrid::kMaxTracks - 1);
        assert(error == "reached max. number of nodes");
    }

    // Removed devices come back to the control thread to be freed.
    {
        App app;
        auto engine = app.CreateEngine();
        NodeIndex lead = kMainOutput;
        NodeIndex delay = kMainOutput;
        assert(app.CreateTrack(TrackKind::kInstrument, kMainOutput, "lead", &lead));
        assert(app.AddEffect(lead, "delay", &delay));
        assert(app.device_params(delay)->Find("feedback") != nullptr);
        render(*engine, 64);

        assert(app.RemoveEffect(lead, delay));
        assert(app.device_params(delay) == nullptr);
        render(*engine, 64);
        app.Update();
        assert(app.disposed_devices() == 1);

        assert(app.AddEffect(lead, "delay"));
        render(*engine, 64);
        assert(app.DeleteTrack(lead));
        assert(app.num_columns() == 0);
        render(*engine, 64);
        app.Update();
        assert(app.disposed_devices() == 3);
    }

    // Sounds nothing refers to any more are dropped from the cache.
    {
        App app;
        auto kick = MakeKick("kick.wav");
        assert(app.LoadSound(0, kick));
        assert(app.LoadSound(1, kick));
        kick.reset();
        app.Update();
        assert(app.cached_sounds() == 1);
        assert(app.FindCachedSound("kick.wav") != nullptr);

        assert(app.ClearSound(0));
        assert(app.ClearSound(1));
        // Older snapshots still hold the sound until they are replaced.
        assert(app.SetBpm(121));
        assert(app.SetBpm(122));
        app.Update();
        assert(app.cached_sounds() == 0);
        assert(app.FindCachedSound("kick.wav") == nullptr);
    }

    // A sound loaded under a name already cached replaces the cached one.
    {
        App app;
        assert(app.LoadSound(0, MakeConstant("x", 100, 0.5F)));
        assert(app.LoadSound(1, MakeConstant("x", 100, 0.9F)));
        assert(std::fabs(app.state().instruments[0]->frames[0][0] - 0.5F) < 1e-6F);
        assert(std::fabs(app.state().instruments[1]->frames[0][0] - 0.9F) < 1e-6F);
        assert(app.state().instruments[0] != app.state().instruments[1]);
        assert(app.FindCachedSound("x") == app.state().instruments[1]);
    }

    // Previews play on the main output and share the voice pool.
    {
        App app;
        auto engine = app.CreateEngine();
        assert(app.PreviewSound(MakeConstant("tone", 44100, 0.5F)));
        std::vector<Stereo> output(512);
        engine->Render(output.data(), output.size());
        assert(energy(output, 0, output.size()) > 0.1);
        assert(app.Update() == 0);

        App busy;
        auto busyEngine = busy.CreateEngine();
        const auto tone = MakeConstant("tone", 44100, 0.5F);
        for (std::size_t i = 0; i < stepgrid::kMaxVoices + 1; ++i) {
            assert(busy.PreviewSound(tone));
        }
        render(*busyEngine, 512);
        assert(busy.Update() == 1);
        assert(busy.Update() == 0);
        assert(busy.engine_state().dropped_events == 1);
    }

    std::cout << "stepgrid-engine-tests: OK" << std::endl;
    return 0;
}
