#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "device.hpp"
#include "group.hpp"
#include "internal/util/time.hpp"

namespace household::model {

/*
  Immutable, versioned view of the household.

  Published as shared_ptr<const TopologySnapshot>; never mutated after
  publication, so readers need no locking. Device::last_seen in a snapshot is
  the time of the device's last reachability change, not of the last probe
  response.
*/
struct TopologySnapshot {
  uint64_t            version{0};
  util::WallTimePoint published_at{};

  std::map<std::string, Group>       groups;
  std::map<std::string, Device>      devices;
  std::map<std::string, PlayerState> players;

  // Group containing device_id, or nullptr.
  const Group* GroupOf(const std::string& device_id) const {
    for (const auto& [id, group] : groups) {
      if (group.HasMember(device_id)) return &group;
    }
    return nullptr;
  }

  bool SameContent(const TopologySnapshot& other) const {
    return groups == other.groups && devices == other.devices && players == other.players;
  }
};

using SnapshotPtr = std::shared_ptr<const TopologySnapshot>;

} // namespace household::model
