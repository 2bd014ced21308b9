#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

#include "event_category.hpp"
#include "group.hpp"
#include "internal/util/time.hpp"

namespace household::model {

/*
  Ordering key for event payloads. Payloads carry no device clock, so the
  sink stamps receive time; the subscription's SEQ header breaks ties.
*/
struct EventStamp {
  util::TimePoint received_at{};
  uint64_t        sequence{0};

  bool operator==(const EventStamp&) const = default;

  bool operator<(const EventStamp& other) const {
    return std::tie(received_at, sequence) < std::tie(other.received_at, other.sequence);
  }
};

/*
  Track fields reported by one transport event. Firmware sends any subset
  (a duration tick alone, metadata without a URI), so each field is merged
  on its own.
*/
struct TrackChange {
  std::optional<std::string> uri;
  std::optional<std::string> title;
  std::optional<std::string> artist;
  std::optional<std::string> album;
  std::optional<int64_t>     duration_ms;

  bool Empty() const {
    return !uri && !title && !artist && !album && !duration_ms;
  }
};

// Absent optionals mean "unchanged".
struct TransportStateChanged {
  std::string                    device_id;
  EventStamp                     stamp;
  std::optional<PlaybackState>   state;
  TrackChange                    track;
  // shuffle / repeat / repeat_one only; crossfade is reported separately.
  std::optional<PlayModes>       play_modes;
  std::optional<bool>            crossfade;
  std::optional<PlaybackActions> actions;
};

struct VolumeChanged {
  std::string         device_id;
  EventStamp          stamp;
  std::optional<int>  volume;
  std::optional<bool> muted;
  std::optional<bool> fixed_volume;
};

struct GroupVolumeChanged {
  std::string         device_id;
  EventStamp          stamp;
  std::optional<int>  volume;
  std::optional<bool> muted;
};

struct ClaimedMember {
  std::string id;
  std::string name;
};

/*
  One group as declared by a topology payload. members includes the
  coordinator.
*/
struct GroupClaim {
  std::string                group_id;
  std::string                coordinator_id;
  std::vector<ClaimedMember> members;
};

struct GroupTopologyChanged {
  std::string             device_id;
  EventStamp              stamp;
  std::vector<GroupClaim> groups;
};

struct UnknownEvent {
  std::string   device_id;
  EventStamp    stamp;
  EventCategory category{EventCategory::kZoneGroupTopology};
  std::string   reason;
};

using EventDelta = std::variant<TransportStateChanged, VolumeChanged, GroupVolumeChanged, GroupTopologyChanged, UnknownEvent>;

inline const std::string& DeviceOf(const EventDelta& delta) {
  return std::visit([](const auto& d) -> const std::string& { return d.device_id; }, delta);
}

} // namespace household::model
