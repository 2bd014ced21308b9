#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/event_delta.hpp"

namespace household::events {

/*
  Turns one UPnP property-set body into typed deltas.

  ZoneGroupTopology    ZoneGroupState       -> GroupTopologyChanged
  AVTransport          LastChange           -> TransportStateChanged
  RenderingControl     LastChange           -> VolumeChanged
  GroupRenderingControl GroupVolume/GroupMute -> GroupVolumeChanged

  Namespace prefixes are ignored. A body that cannot be parsed yields a
  single UnknownEvent; a body without any recognised variable yields no
  deltas. Decode never throws.
*/
class EventDecoder {
 public:
  std::vector<model::EventDelta> Decode(model::EventCategory category, const std::string& device_id, const model::EventStamp& stamp,
                                        const std::string& body) const;
};

// PLAYING, PAUSED_PLAYBACK, STOPPED, TRANSITIONING, NO_MEDIA_PRESENT.
std::optional<model::PlaybackState> ParseTransportState(std::string_view value);

// NORMAL, REPEAT_ALL, REPEAT_ONE, SHUFFLE_NOREPEAT, SHUFFLE, SHUFFLE_REPEAT_ONE.
std::optional<model::PlayModes> ParsePlayMode(std::string_view value);

// Comma-separated CurrentTransportActions, e.g. "Set, Stop, Pause, Play, Next, Previous".
model::PlaybackActions ParseTransportActions(std::string_view value);

// "H:MM:SS" or "H:MM:SS.fff"; nullopt for NOT_IMPLEMENTED and garbage.
std::optional<int64_t> ParseTrackDuration(std::string_view value);

} // namespace household::events
