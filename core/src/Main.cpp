#include <algorithm>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <argparse/argparse.hpp>
#include <juce_events/juce_events.h>

#include "AudioHost.h"
#include "OfflineRender.h"
#include "SoundLoader.h"
#include "core/App.h"
#include "core/Engine.h"

namespace {

constexpr int kRenderBlockFrames = 512;
constexpr int kControlIntervalMs = 50;

// Fills one pattern column from a string such as "z...z...z...z...":
// note keys play in the current octave, 'a' is note-off and '.' or ' '
// leaves the line empty.
bool applySteps(stepgrid::App& app, const std::size_t column,
                const std::string& steps, std::string* outError)
{
    for (std::size_t line = 0; line < steps.size(); ++line) {
        const char key = steps[line];
        if (key == '.' || key == ' ') {
            continue;
        }
        if (!app.SetKey(column, line, key, outError)) {
            return false;
        }
    }
    return true;
}

}  // namespace

int main(int argc, char* argv[])
{
    argparse::ArgumentParser program("stepgrid", "0.1.0",
                                     argparse::default_arguments::all, true);
    program.add_description(
        "stepgrid: step sequencer playing sample instruments.");
    program.add_argument("-s", "--sound")
        .append()
        .help("sample file; each one gets its own instrument track and slot");
    program.add_argument("-p", "--steps")
        .append()
        .help("steps of the matching track, e.g. \"z...z...z...z...\"");
    program.add_argument("-b", "--bpm").default_value(120).scan<'i', int>();
    program.add_argument("--lpb")
        .help("lines per beat")
        .default_value(4)
        .scan<'i', int>();
    program.add_argument("--octave").default_value(4).scan<'i', int>();
    program.add_argument("-l", "--length")
        .help("pattern length in lines")
        .default_value(16)
        .scan<'i', int>();
    program.add_argument("--delay")
        .help("add a delay to the master bus")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-o", "--render")
        .help("render to this WAV file instead of playing live");
    program.add_argument("-t", "--seconds")
        .default_value(4.0)
        .scan<'g', double>();

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    const double seconds = program.get<double>("--seconds");
    if (seconds <= 0.0) {
        std::cerr << "[stepgrid] Invalid --seconds '" << seconds << "'."
                  << std::endl;
        return 1;
    }

    juce::ScopedJuceInitialiser_GUI juceInitialiser;

    stepgrid::App app;
    std::unique_ptr<stepgrid::Engine> engine = app.CreateEngine();
    std::string error;

    const auto fail = [&error](const std::string& what) {
        std::cerr << "[stepgrid] " << what << ": " << error << std::endl;
        return 1;
    };

    if (!app.SetBpm(program.get<int>("--bpm"), &error)) {
        return fail("Invalid --bpm");
    }
    if (!app.SetLinesPerBeat(program.get<int>("--lpb"), &error)) {
        return fail("Invalid --lpb");
    }
    if (!app.SetOctave(program.get<int>("--octave"), &error)) {
        return fail("Invalid --octave");
    }
    if (!app.SetPatternLength(
            static_cast<std::size_t>(std::max(program.get<int>("--length"), 0)),
            &error)) {
        return fail("Invalid --length");
    }

    stepgrid::NodeIndex master = stepgrid::kMainOutput;
    if (!app.CreateTrack(stepgrid::TrackKind::kBus, stepgrid::kMainOutput,
                         "master", &master, &error)) {
        return fail("Cannot create master bus");
    }
    if (program.get<bool>("--delay") &&
        !app.AddEffect(master, "delay", nullptr, &error)) {
        return fail("Cannot add delay");
    }

    std::vector<std::string> sounds;
    if (program.is_used("--sound")) {
        sounds = program.get<std::vector<std::string>>("--sound");
    }
    SoundLoader loader;
    for (std::size_t slot = 0; slot < sounds.size(); ++slot) {
        stepgrid::SoundPtr sound =
            app.FindCachedSound(SoundLoader::canonicalPath(sounds[slot]));
        if (sound == nullptr) {
            sound = loader.load(sounds[slot], &error);
        }
        if (sound == nullptr) {
            return fail("Cannot load '" + sounds[slot] + "'");
        }
        if (!app.CreateTrack(stepgrid::TrackKind::kInstrument, master,
                             juce::File(juce::String(sounds[slot]))
                                 .getFileNameWithoutExtension()
                                 .toStdString(),
                             nullptr, &error) ||
            !app.LoadSound(slot, std::move(sound), &error)) {
            return fail("Cannot set up track for '" + sounds[slot] + "'");
        }
    }

    std::vector<std::string> steps;
    if (program.is_used("--steps")) {
        steps = program.get<std::vector<std::string>>("--steps");
    }
    for (std::size_t column = 0; column < steps.size(); ++column) {
        if (!applySteps(app, column, steps[column], &error)) {
            return fail("Invalid --steps '" + steps[column] + "'");
        }
    }

    app.TogglePlay();

    if (program.is_used("--render")) {
        if (!renderToWavFile(app, *engine, program.get<std::string>("--render"),
                             seconds, kRenderBlockFrames, &error)) {
            return fail("Render failed");
        }
        return 0;
    }

    AudioHost host(std::move(engine));
    if (!host.start(&error)) {
        return fail("Cannot start audio");
    }

    const auto endTime = juce::Time::getMillisecondCounter() +
                         static_cast<juce::uint32>(seconds * 1000.0);
    int lastPattern = -1;
    while (juce::Time::getMillisecondCounter() < endTime) {
        juce::Thread::sleep(kControlIntervalMs);

        const auto dropped = app.Update();
        if (dropped > 0) {
            juce::Logger::writeToLog(
                "[stepgrid] Dropped " +
                juce::String(static_cast<juce::int64>(dropped)) +
                " note(s): no free voice.");
        }

        const auto& state = app.engine_state();
        if (static_cast<int>(state.current_pattern) != lastPattern) {
            lastPattern = static_cast<int>(state.current_pattern);
            juce::Logger::writeToLog("[stepgrid] Playing song position " +
                                     juce::String(lastPattern));
        }
    }

    host.shutdown();
    return 0;
}
