#include "core/Device.h"

#include <utility>

namespace stepgrid {

namespace {

const SoundPtr kNoSound;

}  // namespace

const SoundPtr& AudioContext::sound(const std::size_t slot) const
{
  if (state == nullptr || slot >= state->instruments.size()) {
    return kNoSound;
  }
  return state->instruments[slot];
}

Device::Device(std::string name)
    : params_(std::make_shared<Params>()), name_(std::move(name)) {}

bool Device::SendEvent(const AudioContext& context, const Event& event) noexcept
{
  (void)context;
  (void)event;
  return true;
}

void Device::ReleaseAll() noexcept {}

}  // namespace stepgrid
