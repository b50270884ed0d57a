#include "core/Routing.h"

#include <cstddef>
#include <utility>

namespace stepgrid {

namespace {

enum class Mark {
  kNone = 0,
  kVisiting,
  kDone,
};

void AppendDeviceEntries(const Track& track, std::vector<NodeEntry>* order)
{
  const int track_buffer = track.node;
  std::size_t first_effect = 0;

  if (track.kind == TrackKind::kInstrument && !track.devices.empty()) {
    order->push_back(
        NodeEntry{track.devices.front(), BufferPair{track_buffer, track_buffer}});
    first_effect = 1;
  }

  const std::size_t num_effects = track.devices.size() - first_effect;
  if (num_effects == 1) {
    order->push_back(NodeEntry{track.devices[first_effect],
                               BufferPair{track_buffer, track_buffer}});
    return;
  }

  int input = track_buffer;
  for (std::size_t i = 0; i < num_effects; ++i) {
    const bool last = (i + 1 == num_effects);
    const int output =
        last ? track_buffer : (i % 2 == 0 ? kScratchBufferA : kScratchBufferB);
    order->push_back(
        NodeEntry{track.devices[first_effect + i], BufferPair{input, output}});
    input = output;
  }
}

bool Visit(const std::vector<Track>& tracks, const std::size_t index,
           std::vector<Mark>& marks, std::vector<NodeEntry>* order)
{
  if (marks[index] == Mark::kDone) {
    return true;
  }
  if (marks[index] == Mark::kVisiting) {
    return false;
  }
  marks[index] = Mark::kVisiting;

  const Track& track = tracks[index];
  for (std::size_t i = 0; i < tracks.size(); ++i) {
    if (i != index && tracks[i].output == track.node) {
      if (!Visit(tracks, i, marks, order)) {
        return false;
      }
    }
  }

  AppendDeviceEntries(track, order);
  order->push_back(NodeEntry{track.node, std::nullopt});
  marks[index] = Mark::kDone;
  return true;
}

bool OutputExists(const std::vector<Track>& tracks, const Track& track)
{
  for (const auto& other : tracks) {
    if (&other != &track && other.node == track.output) {
      return true;
    }
  }
  return false;
}

}  // namespace

bool ComputeNodeOrder(const std::vector<Track>& tracks,
                      std::vector<NodeEntry>* order, std::string* error)
{
  std::vector<NodeEntry> result;
  std::vector<Mark> marks(tracks.size(), Mark::kNone);

  // Start from the tracks that leave the graph (main output or a bus
  // that no longer exists) and pull in their inputs first.
  for (std::size_t i = 0; i < tracks.size(); ++i) {
    const Track& track = tracks[i];
    if (track.output != kMainOutput && OutputExists(tracks, track)) {
      continue;
    }
    if (!Visit(tracks, i, marks, &result)) {
      break;
    }
  }

  for (const auto mark : marks) {
    if (mark != Mark::kDone) {
      if (error != nullptr) {
        *error = "invalid output track";
      }
      return false;
    }
  }

  if (order != nullptr) {
    *order = std::move(result);
  }
  return true;
}

}  // namespace stepgrid
