#include "SoundLoader.h"

#include <algorithm>
#include <utility>
#include <limits>
#include <memory>
#include <vector>

SoundLoader::SoundLoader()
{
    // WAV/AIFF/FLAC/Ogg, depending on the JUCE configuration.
    formatManager_.registerBasicFormats();
}

std::string SoundLoader::canonicalPath(const std::string& path)
{
    return juce::File::getCurrentWorkingDirectory()
        .getChildFile(juce::String(path))
        .getFullPathName()
        .toStdString();
}

stepgrid::SoundPtr SoundLoader::load(const std::string& path,
                                     std::string* outError)
{
    const juce::File file{juce::String(canonicalPath(path))};
    if (!file.existsAsFile()) {
        if (outError != nullptr) {
            *outError = "File does not exist";
        }
        return nullptr;
    }

    std::unique_ptr<juce::AudioFormatReader> reader(
        formatManager_.createReaderFor(file));
    if (reader == nullptr) {
        if (outError != nullptr) {
            *outError = "Unsupported audio format";
        }
        return nullptr;
    }

    const juce::int64 numSamples64 = reader->lengthInSamples;
    if (numSamples64 <= 0) {
        if (outError != nullptr) {
            *outError = "Empty audio file";
        }
        return nullptr;
    }

    const int numFrames = static_cast<int>(
        std::min<juce::int64>(numSamples64, std::numeric_limits<int>::max()));
    const int channels = static_cast<int>(reader->numChannels);

    juce::AudioBuffer<float> tempBuffer(std::max(2, channels), numFrames);
    tempBuffer.clear();
    if (!reader->read(&tempBuffer, 0, numFrames, 0, true, true)) {
        if (outError != nullptr) {
            *outError = "Failed to read audio data";
        }
        return nullptr;
    }

    // Mono files are duplicated on both channels; multi-channel files
    // use the first two channels only.
    const float* ch0 = tempBuffer.getReadPointer(0);
    const float* ch1 = channels > 1 ? tempBuffer.getReadPointer(1) : nullptr;

    std::vector<stepgrid::Stereo> frames(static_cast<std::size_t>(numFrames));
    for (int i = 0; i < numFrames; ++i) {
        const float l = ch0[i];
        const float r = ch1 != nullptr ? ch1[i] : l;
        frames[static_cast<std::size_t>(i)] = stepgrid::Stereo{{l, r}};
    }

    std::string error;
    auto sound = stepgrid::MakeSound(file.getFullPathName().toStdString(),
                                     std::move(frames), reader->sampleRate,
                                     &error);
    if (sound == nullptr) {
        if (outError != nullptr) {
            *outError = error;
        }
        return nullptr;
    }

    juce::Logger::writeToLog(
        "[stepgrid] Loaded " + file.getFileName() + " frames=" +
        juce::String(numFrames) + " rate=" + juce::String(reader->sampleRate) +
        " offset=" + juce::String(static_cast<juce::int64>(sound->offset)));
    return sound;
}
