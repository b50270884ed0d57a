#pragma once

#include <memory>

#include "core/AppState.h"
#include "core/Constants.h"
#include "core/Device.h"
#include "core/Sound.h"
#include "core/SpscQueue.h"
#include "core/TripleBuffer.h"

namespace stepgrid {

enum class EngineCommandType {
  kNone = 0,
  kCreateDevice,
  kDeleteDevice,
  kPreviewSound,
};

// Structural change that cannot travel through the state snapshot.
struct EngineCommand {
  EngineCommandType type{EngineCommandType::kNone};
  NodeIndex node{kMainOutput};
  std::unique_ptr<Device> device;
  SoundPtr sound;
};

using CommandQueue = SpscQueue<EngineCommand, kCommandQueueCapacity>;
// Room for every device node, so handing a device back never fails.
using DisposalQueue = SpscQueue<std::unique_ptr<Device>, kMaxNodes>;

// Everything the control thread and the audio thread share.
struct EngineLink {
  TripleBuffer<AppState> app_state;
  TripleBuffer<EngineState> engine_state;
  CommandQueue commands;
  DisposalQueue disposals;
};

}  // namespace stepgrid
