#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_audio_devices/juce_audio_devices.h>

#include "core/Frame.h"

namespace stepgrid {
class Engine;
}  // namespace stepgrid

// Plays a stepgrid::Engine on the default audio output.
//
// The engine always renders at stepgrid::kSampleRate; the host asks
// the device for that rate and only logs a warning when the device
// refuses, since no resampling happens here.
class AudioHost : public juce::AudioIODeviceCallback {
public:
    explicit AudioHost(std::unique_ptr<stepgrid::Engine> engine);
    ~AudioHost() override;

    // Opens the default output device (no inputs, stereo output) and
    // starts pulling audio from the engine.
    bool start(std::string* outError = nullptr);

    // Detaches the callback. Safe to call more than once.
    void shutdown();

    [[nodiscard]] double deviceSampleRate() const noexcept
    {
        return sampleRate_.load(std::memory_order_relaxed);
    }

    // juce::AudioIODeviceCallback
    void audioDeviceAboutToStart(juce::AudioIODevice* device) override;
    void audioDeviceStopped() override;
    void audioDeviceIOCallbackWithContext(
        const float* const* inputChannelData,
        int numInputChannels,
        float* const* outputChannelData,
        int numOutputChannels,
        int numSamples,
        const juce::AudioIODeviceCallbackContext& context) override;

private:
    juce::AudioDeviceManager deviceManager_;
    std::unique_ptr<stepgrid::Engine> engine_;

    // Engine output for one callback chunk, sized once.
    std::vector<stepgrid::Stereo> block_;

    std::atomic<double> sampleRate_{0.0};
    bool started_{false};
};
