#pragma once

#include <string>

#include "household/v1.hpp"
#include "snapshot.hpp"

namespace household::model {

household::v1::PlaybackState ToProto(PlaybackState state);

household::v1::TopologySnapshot ToProto(const TopologySnapshot& snapshot);

// Protobuf JSON rendering of a snapshot. Throws InvalidState if the
// conversion fails.
std::string ToJson(const TopologySnapshot& snapshot, bool pretty = false);

} // namespace household::model
