#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/time.hpp"

namespace household::model {

enum class PlaybackState : std::uint8_t {
  kIdle      = 0,
  kBuffering = 1,
  kPlaying   = 2,
  kPaused    = 3,
  kStopped   = 4,
};

constexpr std::string_view PlaybackStateName(PlaybackState state) {
  switch (state) {
    case PlaybackState::kIdle:
      return "idle";
    case PlaybackState::kBuffering:
      return "buffering";
    case PlaybackState::kPlaying:
      return "playing";
    case PlaybackState::kPaused:
      return "paused";
    case PlaybackState::kStopped:
      return "stopped";
  }
  return "unknown";
}

struct Track {
  std::string uri;
  std::string title;
  std::string artist;
  std::string album;
  int64_t     duration_ms{0};

  bool operator==(const Track&) const = default;
};

struct PlayModes {
  bool shuffle{false};
  bool repeat{false};
  bool repeat_one{false};
  bool crossfade{false};

  bool operator==(const PlayModes&) const = default;
};

// Transport actions the coordinator currently accepts.
struct PlaybackActions {
  bool can_play{false};
  bool can_pause{false};
  bool can_stop{false};
  bool can_skip_forward{false};
  bool can_skip_backward{false};

  bool operator==(const PlaybackActions&) const = default;
};

struct Playback {
  PlaybackState   state{PlaybackState::kIdle};
  Track           track;
  PlayModes       play_modes;
  PlaybackActions actions;

  bool operator==(const Playback&) const = default;
};

/*
  A set of players in synchrony. The id is the coordinator's device id, the
  coordinator is always member_ids.front().
*/
struct Group {
  std::string              id;
  std::string              coordinator_id;
  std::vector<std::string> member_ids;
  std::string              name;

  Playback             playback;
  std::optional<int>   volume;
  std::optional<bool>  muted;
  util::TimePoint      updated_at{};

  bool HasMember(std::string_view device_id) const {
    for (const auto& member : member_ids) {
      if (member == device_id) return true;
    }
    return false;
  }

  bool operator==(const Group&) const = default;
};

/*
  Event-derived per-player state.
*/
struct PlayerState {
  std::string         name;
  std::optional<int>  volume;
  std::optional<bool> muted;
  std::optional<bool> fixed_volume;
  bool                subscription_degraded{false};

  bool operator==(const PlayerState&) const = default;
};

} // namespace household::model
