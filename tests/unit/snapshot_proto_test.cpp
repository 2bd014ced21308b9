#include "internal/model/snapshot_proto.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using household::model::PlaybackState;
using household::model::TopologySnapshot;

TopologySnapshot Household() {
  TopologySnapshot snapshot;
  snapshot.version      = 7;
  snapshot.published_at = household::util::WallNow();

  for (const std::string id : {"RINCON_A", "RINCON_B"}) {
    auto& device = snapshot.devices[id];
    device.id    = id;
    device.host  = "192.168.1.20";
    device.model = "Sonos One";
  }
  snapshot.devices["RINCON_B"].reachable = false;

  auto& group                      = snapshot.groups["RINCON_A"];
  group.id                         = "RINCON_A";
  group.coordinator_id             = "RINCON_A";
  group.member_ids                 = {"RINCON_A", "RINCON_B"};
  group.name                       = "Living Room";
  group.playback.state             = PlaybackState::kPlaying;
  group.playback.track.title       = "Song";
  group.playback.track.duration_ms = 205000;
  group.playback.play_modes.repeat = true;
  group.playback.actions.can_pause = true;
  group.volume                     = 30;

  snapshot.players["RINCON_A"].name                  = "Living Room";
  snapshot.players["RINCON_A"].volume                = 0;
  snapshot.players["RINCON_B"].name                  = "Kitchen";
  snapshot.players["RINCON_B"].subscription_degraded = true;
  return snapshot;
}

void TestProtoMirrorsSnapshot() {
  const auto proto = household::model::ToProto(Household());

  assert(proto.version() == 7);
  assert(proto.published_at().seconds() > 0);
  assert(proto.groups_size() == 1);

  const auto& group = proto.groups(0);
  assert(group.coordinator_id() == "RINCON_A");
  assert(group.member_ids_size() == 2);
  assert(group.member_ids(0) == "RINCON_A");
  assert(group.playback().state() == household::v1::PLAYBACK_STATE_PLAYING);
  assert(group.playback().track().duration_ms() == 205000);
  assert(group.playback().play_modes().repeat());
  assert(group.playback().actions().can_pause());
  assert(!group.playback().actions().can_play());
  assert(group.has_volume() && group.volume() == 30);
  assert(!group.has_muted());

  assert(proto.devices_size() == 2);
  assert(!proto.devices(1).reachable());

  assert(proto.players_size() == 2);
  // Zero volume is still reported.
  assert(proto.players(0).has_volume() && proto.players(0).volume() == 0);
  assert(!proto.players(0).has_muted());
  assert(proto.players(1).subscription_degraded());
}

void TestPlaybackStates() {
  assert(household::model::ToProto(PlaybackState::kIdle) == household::v1::PLAYBACK_STATE_IDLE);
  assert(household::model::ToProto(PlaybackState::kBuffering) == household::v1::PLAYBACK_STATE_BUFFERING);
  assert(household::model::ToProto(PlaybackState::kPaused) == household::v1::PLAYBACK_STATE_PAUSED);
  assert(household::model::ToProto(PlaybackState::kStopped) == household::v1::PLAYBACK_STATE_STOPPED);
}

void TestJsonUsesProtoFieldNames() {
  const auto json = household::model::ToJson(Household());
  assert(json.find("\"coordinator_id\":\"RINCON_A\"") != std::string::npos);
  assert(json.find("\"version\":\"7\"") != std::string::npos);
  assert(json.find("\"PLAYBACK_STATE_PLAYING\"") != std::string::npos);
  assert(json.find("\"subscription_degraded\":true") != std::string::npos);
  assert(json.find('\n') == std::string::npos);

  const auto pretty = household::model::ToJson(Household(), true);
  assert(pretty.find('\n') != std::string::npos);
}

} // namespace

int main() {
  TestProtoMirrorsSnapshot();
  TestPlaybackStates();
  TestJsonUsesProtoFieldNames();

  std::cout << "household_unit_snapshot_proto: pass\n";
  return 0;
}
