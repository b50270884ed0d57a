#pragma once

#include <bitset>
#include <optional>
#include <string>

#include "core/Constants.h"

namespace stepgrid {

enum class NodeRange {
  kTrack = 0,
  kDevice,
};

// Hands out compact, stable node indices. Track and device nodes come
// from disjoint ranges and stay reserved until released.
class NodeIndexAllocator {
 public:
  NodeIndexAllocator() = default;

  // Lowest free index in `range`, or nullopt when the range is full.
  [[nodiscard]] std::optional<NodeIndex> Reserve(NodeRange range,
                                                 std::string* error = nullptr);
  bool Release(NodeIndex index);

  [[nodiscard]] bool reserved(NodeIndex index) const;
  [[nodiscard]] std::size_t count() const { return used_.count(); }

  [[nodiscard]] static NodeRange RangeOf(NodeIndex index);

 private:
  std::bitset<kMaxNodes> used_;
};

}  // namespace stepgrid
