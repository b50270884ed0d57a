#include "AudioHost.h"

#include <algorithm>
#include <utility>

#include "core/Constants.h"
#include "core/Engine.h"

AudioHost::AudioHost(std::unique_ptr<stepgrid::Engine> engine)
    : engine_(std::move(engine)),
      block_(stepgrid::kMaxBlockFrames)
{
}

AudioHost::~AudioHost()
{
    shutdown();
}

bool AudioHost::start(std::string* outError)
{
    if (engine_ == nullptr) {
        if (outError != nullptr) {
            *outError = "No engine to play";
        }
        return false;
    }
    if (started_) {
        return true;
    }

    // Initialise with no inputs and stereo outputs.
    juce::String audioError =
        deviceManager_.initialiseWithDefaultDevices(/*numInputChannels*/ 0,
                                                    /*numOutputChannels*/ 2);
    if (audioError.isNotEmpty()) {
        juce::Logger::writeToLog("[stepgrid] Failed to initialise audio: " +
                                 audioError);
        if (outError != nullptr) {
            *outError = audioError.toStdString();
        }
        return false;
    }

    juce::AudioDeviceManager::AudioDeviceSetup setup;
    deviceManager_.getAudioDeviceSetup(setup);
    if (setup.sampleRate != stepgrid::kSampleRate) {
        setup.sampleRate = stepgrid::kSampleRate;
        const juce::String setupError =
            deviceManager_.setAudioDeviceSetup(setup, /*treatAsChosenDevice*/ true);
        if (setupError.isNotEmpty()) {
            juce::Logger::writeToLog(
                "[stepgrid] Could not switch device to 44100 Hz: " +
                setupError);
        }
    }

    deviceManager_.addAudioCallback(this);
    started_ = true;
    juce::Logger::writeToLog("[stepgrid] Audio host started.");
    return true;
}

void AudioHost::shutdown()
{
    if (!started_) {
        return;
    }
    started_ = false;

    // No further callbacks reach the engine after this returns; the
    // device itself is closed by the AudioDeviceManager destructor.
    deviceManager_.removeAudioCallback(this);
    juce::Logger::writeToLog("[stepgrid] Audio host stopped.");
}

void AudioHost::audioDeviceAboutToStart(juce::AudioIODevice* device)
{
    const double sr =
        (device != nullptr) ? device->getCurrentSampleRate() : 0.0;
    sampleRate_.store(sr, std::memory_order_relaxed);

    if (sr != stepgrid::kSampleRate) {
        juce::Logger::writeToLog(
            juce::String("[stepgrid] Device runs at ") + juce::String(sr) +
            " Hz, the engine renders at 44100 Hz; playback speed will be off.");
    }
    if (device != nullptr) {
        juce::Logger::writeToLog(
            "[stepgrid] Output device: " + device->getName() +
            ", block size " +
            juce::String(device->getCurrentBufferSizeSamples()));
    }
}

void AudioHost::audioDeviceStopped()
{
    sampleRate_.store(0.0, std::memory_order_relaxed);
}

void AudioHost::audioDeviceIOCallbackWithContext(
    const float* const* inputChannelData,
    const int numInputChannels,
    float* const* outputChannelData,
    const int numOutputChannels,
    const int numSamples,
    const juce::AudioIODeviceCallbackContext& context)
{
    juce::ignoreUnused(inputChannelData, numInputChannels, context);

    int done = 0;
    while (done < numSamples) {
        const int chunk = std::min(numSamples - done,
                                   static_cast<int>(block_.size()));
        engine_->Render(block_.data(), static_cast<std::size_t>(chunk));

        for (int channel = 0; channel < numOutputChannels; ++channel) {
            float* out = outputChannelData[channel];
            if (out == nullptr) {
                continue;
            }
            out += done;
            if (numOutputChannels == 1) {
                // Mono device: fold both channels down.
                for (int i = 0; i < chunk; ++i) {
                    const auto& frame = block_[static_cast<std::size_t>(i)];
                    out[i] = 0.5F * (frame[0] + frame[1]);
                }
            } else if (channel < 2) {
                for (int i = 0; i < chunk; ++i) {
                    out[i] = block_[static_cast<std::size_t>(i)]
                                   [static_cast<std::size_t>(channel)];
                }
            } else {
                std::fill(out, out + chunk, 0.0F);
            }
        }

        done += chunk;
    }
}
