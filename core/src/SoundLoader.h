#pragma once

#include <string>

#include <juce_audio_formats/juce_audio_formats.h>

#include "core/Sound.h"

// Decodes sample files into stepgrid::Sound buffers (stereo float at
// the file's own rate, leading silence measured).
class SoundLoader {
public:
    SoundLoader();

    SoundLoader(const SoundLoader&) = delete;
    SoundLoader& operator=(const SoundLoader&) = delete;

    // The returned Sound is named after the canonical path so that
    // callers can use the name as a cache key.
    [[nodiscard]] stepgrid::SoundPtr load(const std::string& path,
                                          std::string* outError = nullptr);

    // Canonical form of `path` as used for Sound names.
    [[nodiscard]] static std::string canonicalPath(const std::string& path);

private:
    juce::AudioFormatManager formatManager_;
};
