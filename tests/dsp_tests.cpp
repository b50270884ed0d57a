#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "core/Delay.h"
#include "core/Envelope.h"
#include "core/Frame.h"
#include "core/Param.h"
#include "core/Rms.h"
#include "core/Sound.h"

// Tests for the building blocks of the signal path: frames, meters,
// parameters, the ADSR envelope and the delay line.

using stepgrid::AudioContext;
using stepgrid::Delay;
using stepgrid::Envelope;
using stepgrid::ExpSmoothing;
using stepgrid::Param;
using stepgrid::Params;
using stepgrid::Rms;
using stepgrid::Stereo;

namespace {

bool near(const float a, const float b, const float tolerance = 1e-6F)
{
    return std::fabs(a - b) <= tolerance;
}

// Feeds samples until the envelope is idle or `limit` samples passed.
// Returns the number of samples it took.
std::size_t runUntilIdle(Envelope& envelope, const std::size_t limit)
{
    std::size_t n = 0;
    while (!envelope.idle() && n < limit) {
        envelope.Next();
        ++n;
    }
    return n;
}

}  // namespace

int main()
{
    // Frame arithmetic is pointwise.
    {
        const Stereo a{{1.0F, 2.0F}};
        const Stereo b{{0.5F, -1.0F}};
        assert(((a + b) == Stereo{{1.5F, 1.0F}}));
        assert(((a - b) == Stereo{{0.5F, 3.0F}}));
        assert(((a * b) == Stereo{{0.5F, -2.0F}}));
        assert(((a * 2.0F) == Stereo{{2.0F, 4.0F}}));
        assert(((a / 2.0F) == Stereo{{0.5F, 1.0F}}));
        assert(Stereo{} == Stereo(0.0F));
    }

    // RMS over a full window of a constant signal is the signal level.
    {
        Rms rms(64);
        for (int i = 0; i < 64; ++i) {
            rms.Add(Stereo{{0.5F, -0.25F}});
        }
        assert(near(rms.value()[0], 0.5F, 1e-5F));
        assert(near(rms.value()[1], 0.25F, 1e-5F));

        // Silence pushes the old frames out of the window.
        for (int i = 0; i < 64; ++i) {
            rms.Add(Stereo{});
        }
        assert(near(rms.value()[0], 0.0F, 1e-5F));

        rms.Add(Stereo(1.0F));
        rms.Reset();
        assert(rms.value() == Stereo{});
    }

    // A window that is not full yet averages over what it has seen.
    {
        Rms rms(8);
        for (int i = 0; i < 4; ++i) {
            rms.Add(Stereo(i % 2 == 0 ? 0.5F : -0.5F));
        }
        assert(near(rms.value()[0], 0.5F, 1e-5F));
        assert(near(rms.value()[1], 0.5F, 1e-5F));

        rms.Reset();
        rms.Add(Stereo(0.25F));
        assert(near(rms.value()[0], 0.25F, 1e-5F));
    }

    // Leading silence is measured against the 0.01 threshold.
    {
        std::vector<Stereo> frames(100);
        frames[37] = Stereo{{0.0F, -0.02F}};
        frames[10] = Stereo{{0.005F, 0.005F}};
        assert(stepgrid::FindLeadingSilence(frames) == 37);
        assert(stepgrid::FindLeadingSilence(std::vector<Stereo>(8)) == 0);

        auto sound = stepgrid::MakeSound("s", frames, 22050.0);
        assert(sound != nullptr);
        assert(sound->offset == 37);
        assert(sound->sample_rate == 22050.0);

        std::string error;
        assert(stepgrid::MakeSound("empty", {}, 44100.0, &error) == nullptr);
        assert(error == "empty sound");
        assert(stepgrid::MakeSound("rate", frames, 0.0, &error) == nullptr);
    }

    // Parameters reject out-of-range values and keep the old one.
    {
        Params params;
        Param& gain = params.Add({"gain", "dB", -60.0F, 6.0F, 0.0F});
        assert(gain.value() == 0.0F);
        assert(params.Set("gain", -12.0F));
        assert(gain.value() == -12.0F);

        std::string error;
        assert(!params.Set("gain", 7.0F, &error));
        assert(!error.empty());
        assert(gain.value() == -12.0F);
        assert(!params.Set("gain", std::nanf(""), &error));
        assert(!params.Set("missing", 0.0F, &error));
        assert(error == "unknown parameter 'missing'");
        assert(params.at(0) == &gain);
        assert(params.at(1) == nullptr);

        assert(near(stepgrid::DbToGain(0.0F), 1.0F));
        assert(near(stepgrid::DbToGain(-20.0F), 0.1F));
        assert(near(stepgrid::VelocityToGain(127), 1.0F));
        assert(near(stepgrid::VelocityToGain(0), 0.001F));
    }

    // Smoothing settles on the target within its time constant.
    {
        ExpSmoothing smoothing(0.0F, 100);
        smoothing.set_target(1.0F);
        const float first = smoothing.Next();
        assert(first > 0.0F && first < 1.0F);
        for (int i = 0; i < 200; ++i) {
            smoothing.Next();
        }
        assert(smoothing.current() == 1.0F);
    }

    // Envelope: gate on, sustain, gate off, back to idle.
    {
        const float attack = 0.01F;
        const float decay = 0.05F;
        const float sustain = 0.5F;
        const float release = 0.1F;
        Envelope envelope(stepgrid::kSampleRate);
        envelope.SetParameters(attack, decay, sustain, release);
        assert(envelope.idle());
        assert(envelope.Next() == 0.0F);

        envelope.NoteOn();
        assert(envelope.state() == Envelope::State::kAttack);

        float peak = 0.0F;
        const auto attackDecayBound = static_cast<std::size_t>(
            (attack + decay) * stepgrid::kSampleRate) + 4410;
        for (std::size_t i = 0; i < attackDecayBound; ++i) {
            peak = std::max(peak, envelope.Next());
        }
        assert(peak == 1.0F);
        assert(envelope.state() == Envelope::State::kSustain);
        assert(near(envelope.value(), sustain, 1e-3F));

        envelope.NoteOff();
        assert(envelope.state() == Envelope::State::kRelease);
        const auto releaseBound =
            static_cast<std::size_t>(release * stepgrid::kSampleRate) + 1;
        const std::size_t taken = runUntilIdle(envelope, releaseBound * 2);
        assert(taken <= releaseBound);
        assert(envelope.idle());
        assert(envelope.value() == 0.0F);
    }

    // Changing the sustain level while a note is held glides to the new
    // level instead of jumping.
    {
        Envelope envelope;
        envelope.SetParameters(0.001F, 0.01F, 1.0F, 0.1F);
        envelope.NoteOn();
        for (int i = 0; i < 5000; ++i) {
            envelope.Next();
        }
        assert(envelope.state() == Envelope::State::kSustain);
        assert(envelope.value() == 1.0F);

        envelope.SetParameters(0.001F, 0.01F, 0.5F, 0.1F);
        const float next = envelope.Next();
        assert(next > 0.5F && next < 1.0F);
        for (int i = 0; i < 2205; ++i) {
            envelope.Next();
        }
        assert(envelope.state() == Envelope::State::kSustain);
        assert(near(envelope.value(), 0.5F, 1e-3F));
        for (int i = 0; i < 2205; ++i) {
            envelope.Next();
        }
        assert(envelope.value() == 0.5F);
    }

    // A zero sustain ends the envelope right after the decay stage.
    {
        Envelope envelope;
        envelope.SetParameters(0.001F, 0.01F, 0.0F, 0.1F);
        envelope.NoteOn();
        const auto bound = static_cast<std::size_t>(
            0.011F * stepgrid::kSampleRate) + 4410;
        runUntilIdle(envelope, bound);
        assert(envelope.idle());
        assert(envelope.value() == 0.0F);
    }

    // Stop() fades out much faster than the configured release.
    {
        Envelope envelope;
        envelope.SetParameters(0.001F, 0.01F, 1.0F, 2.0F);
        envelope.NoteOn();
        for (int i = 0; i < 1000; ++i) {
            envelope.Next();
        }
        envelope.Stop();
        const auto bound = static_cast<std::size_t>(
            Envelope::kStopSeconds * stepgrid::kSampleRate) + 1;
        // A couple of samples of slack for float rounding.
        assert(runUntilIdle(envelope, bound * 2) <= bound + 4);
    }

    // Delay: a unit impulse comes back every delay length, scaled by
    // the feedback each time.
    {
        const std::size_t length = 100;
        Delay delay(length);
        assert(delay.delay_frames() == length);
        assert(delay.params()->Find("feedback")->value() ==
               Delay::kDefaultFeedback);

        std::string error;
        assert(!delay.params()->Set("feedback", 1.5F, &error));
        assert(delay.params()->Set("dry", 0.0F));
        assert(delay.params()->Set("wet", 1.0F));
        assert(delay.params()->Set("feedback", 0.5F));

        std::vector<Stereo> input(length * 5);
        std::vector<Stereo> output(input.size(), Stereo(9.0F));
        input[0] = Stereo(1.0F);

        const AudioContext context;
        delay.Render(context, input.data(), output.data(), input.size());

        for (std::size_t i = 0; i < output.size(); ++i) {
            float expected = 0.0F;
            if (i > 0 && i % length == 0) {
                expected = std::pow(0.5F, static_cast<float>(i / length - 1));
            }
            assert(near(output[i][0], expected));
            assert(near(output[i][1], expected));
        }
    }

    // Dry signal passes straight through and in-place processing works.
    {
        Delay delay(4);
        std::vector<Stereo> buffer{Stereo(1.0F), Stereo(0.0F), Stereo(0.0F),
                                   Stereo(0.0F), Stereo(0.0F)};
        delay.Render(AudioContext{}, buffer.data(), buffer.data(), buffer.size());
        assert(near(buffer[0][0], Delay::kDefaultDry));
        assert(near(buffer[4][0], Delay::kDefaultWet));
    }

    std::cout << "stepgrid-dsp-tests: OK" << std::endl;
    return 0;
}
