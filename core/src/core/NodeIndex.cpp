#include "core/NodeIndex.h"

namespace stepgrid {

std::optional<NodeIndex> NodeIndexAllocator::Reserve(const NodeRange range,
                                                     std::string* error)
{
  const NodeIndex begin = range == NodeRange::kTrack ? 0 : kMaxTracks;
  const NodeIndex end = range == NodeRange::kTrack ? kMaxTracks : kMaxNodes;

  for (NodeIndex index = begin; index < end; ++index) {
    if (!used_.test(static_cast<std::size_t>(index))) {
      used_.set(static_cast<std::size_t>(index));
      return index;
    }
  }

  if (error != nullptr) {
    *error = "reached max. number of nodes";
  }
  return std::nullopt;
}

bool NodeIndexAllocator::Release(const NodeIndex index)
{
  if (!reserved(index)) {
    return false;
  }
  used_.reset(static_cast<std::size_t>(index));
  return true;
}

bool NodeIndexAllocator::reserved(const NodeIndex index) const
{
  return index >= 0 && index < kMaxNodes &&
         used_.test(static_cast<std::size_t>(index));
}

NodeRange NodeIndexAllocator::RangeOf(const NodeIndex index)
{
  return index < kMaxTracks ? NodeRange::kTrack : NodeRange::kDevice;
}

}  // namespace stepgrid
