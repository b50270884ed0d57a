#pragma once

#include <string>

namespace stepgrid {
class App;
class Engine;
}  // namespace stepgrid

// Renders `seconds` of audio from `engine` in blocks of `blockFrames`
// frames and writes it as a 32-bit float stereo WAV file. The App gets
// one control cycle per block, as it would with a live device.
bool renderToWavFile(stepgrid::App& app,
                     stepgrid::Engine& engine,
                     const std::string& path,
                     double seconds,
                     int blockFrames,
                     std::string* outError = nullptr);
