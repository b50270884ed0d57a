#include "OfflineRender.h"

#include <algorithm>
#include <memory>
#include <vector>

#include <juce_audio_formats/juce_audio_formats.h>

#include "core/App.h"
#include "core/Constants.h"
#include "core/Engine.h"

bool renderToWavFile(stepgrid::App& app,
                     stepgrid::Engine& engine,
                     const std::string& path,
                     const double seconds,
                     const int blockFrames,
                     std::string* outError)
{
    if (seconds <= 0.0 || blockFrames <= 0) {
        if (outError != nullptr) {
            *outError = "Invalid render length";
        }
        return false;
    }

    juce::File file{juce::String(path)};
    file.deleteFile();
    auto stream = std::unique_ptr<juce::FileOutputStream>(
        file.createOutputStream());
    if (stream == nullptr) {
        if (outError != nullptr) {
            *outError = "Cannot open output file";
        }
        return false;
    }

    juce::WavAudioFormat wavFormat;
    std::unique_ptr<juce::AudioFormatWriter> writer(
        wavFormat.createWriterFor(stream.get(), stepgrid::kSampleRate,
                                  /*numChannels*/ 2, /*bitsPerSample*/ 32,
                                  {}, 0));
    if (writer == nullptr) {
        if (outError != nullptr) {
            *outError = "Cannot create WAV writer";
        }
        return false;
    }
    // The writer owns the stream from here on.
    stream.release();

    const auto totalFrames =
        static_cast<juce::int64>(seconds * stepgrid::kSampleRate);
    std::vector<float> interleaved(static_cast<std::size_t>(blockFrames) * 2);
    juce::AudioBuffer<float> block(2, blockFrames);

    for (juce::int64 done = 0; done < totalFrames;) {
        const int frames = static_cast<int>(
            std::min<juce::int64>(blockFrames, totalFrames - done));
        engine.RenderInterleaved(interleaved.data(),
                                 static_cast<std::size_t>(frames));
        for (int i = 0; i < frames; ++i) {
            block.setSample(0, i, interleaved[static_cast<std::size_t>(i) * 2]);
            block.setSample(1, i,
                            interleaved[static_cast<std::size_t>(i) * 2 + 1]);
        }
        if (!writer->writeFromAudioSampleBuffer(block, 0, frames)) {
            if (outError != nullptr) {
                *outError = "Failed to write audio data";
            }
            return false;
        }

        const auto dropped = app.Update();
        if (dropped > 0) {
            juce::Logger::writeToLog("[stepgrid] Dropped " +
                                     juce::String(static_cast<juce::int64>(dropped)) +
                                     " note(s): no free voice.");
        }
        done += frames;
    }

    juce::Logger::writeToLog("[stepgrid] Rendered " +
                             juce::String(totalFrames) + " frames to " +
                             file.getFullPathName());
    return true;
}
