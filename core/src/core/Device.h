#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "core/AppState.h"
#include "core/Event.h"
#include "core/Frame.h"
#include "core/Param.h"
#include "core/Sound.h"

namespace stepgrid {

// What a device sees of the engine while rendering one sub-block.
struct AudioContext {
  const AppState* state{nullptr};
  // Incremented every time the engine dispatches a tick, so devices can
  // tell notes of the same step (a chord) from later ones.
  std::uint64_t tick_serial{0};

  [[nodiscard]] const SoundPtr& sound(std::size_t slot) const;
};

// Audio processor owned by exactly one node of the engine. Instruments
// add into `output` and ignore `input`; effects read `input` and
// overwrite `output` (the two may be the same buffer).
class Device {
 public:
  explicit Device(std::string name);
  virtual ~Device() = default;

  Device(const Device&) = delete;
  Device& operator=(const Device&) = delete;
  Device(Device&&) = delete;
  Device& operator=(Device&&) = delete;

  // Returns false when the event had to be dropped (no free voice).
  virtual bool SendEvent(const AudioContext& context, const Event& event) noexcept;
  virtual void Render(const AudioContext& context, const Stereo* input,
                      Stereo* output, std::size_t frames) noexcept = 0;
  // Releases every sounding note, used when the transport stops.
  virtual void ReleaseAll() noexcept;

  [[nodiscard]] const std::string& name() const { return name_; }
  [[nodiscard]] const std::shared_ptr<Params>& params() const
  {
    return params_;
  }

 protected:
  std::shared_ptr<Params> params_;

 private:
  std::string name_;
};

}  // namespace stepgrid
