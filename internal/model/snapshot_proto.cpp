#include "snapshot_proto.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace household::model {

household::v1::PlaybackState ToProto(PlaybackState state) {
  switch (state) {
    case PlaybackState::kIdle:
      return household::v1::PLAYBACK_STATE_IDLE;
    case PlaybackState::kBuffering:
      return household::v1::PLAYBACK_STATE_BUFFERING;
    case PlaybackState::kPlaying:
      return household::v1::PLAYBACK_STATE_PLAYING;
    case PlaybackState::kPaused:
      return household::v1::PLAYBACK_STATE_PAUSED;
    case PlaybackState::kStopped:
      return household::v1::PLAYBACK_STATE_STOPPED;
  }
  return household::v1::PLAYBACK_STATE_UNSPECIFIED;
}

household::v1::TopologySnapshot ToProto(const TopologySnapshot& snapshot) {
  household::v1::TopologySnapshot out;
  out.set_version(snapshot.version);
  *out.mutable_published_at() = util::ToProto(snapshot.published_at);

  for (const auto& [id, group] : snapshot.groups) {
    auto* g = out.add_groups();
    g->set_id(group.id);
    g->set_coordinator_id(group.coordinator_id);
    for (const auto& member : group.member_ids) g->add_member_ids(member);
    g->set_name(group.name);

    auto* playback = g->mutable_playback();
    playback->set_state(ToProto(group.playback.state));

    const auto& track = group.playback.track;
    auto*       t     = playback->mutable_track();
    t->set_uri(track.uri);
    t->set_title(track.title);
    t->set_artist(track.artist);
    t->set_album(track.album);
    t->set_duration_ms(track.duration_ms);

    const auto& modes = group.playback.play_modes;
    auto*       m     = playback->mutable_play_modes();
    m->set_shuffle(modes.shuffle);
    m->set_repeat(modes.repeat);
    m->set_repeat_one(modes.repeat_one);
    m->set_crossfade(modes.crossfade);

    const auto& actions = group.playback.actions;
    auto*       a       = playback->mutable_actions();
    a->set_can_play(actions.can_play);
    a->set_can_pause(actions.can_pause);
    a->set_can_stop(actions.can_stop);
    a->set_can_skip_forward(actions.can_skip_forward);
    a->set_can_skip_backward(actions.can_skip_backward);

    if (group.volume) g->set_volume(*group.volume);
    if (group.muted) g->set_muted(*group.muted);
  }

  for (const auto& [id, device] : snapshot.devices) {
    auto* d = out.add_devices();
    d->set_id(device.id);
    d->set_host(device.host);
    d->set_port(device.port);
    d->set_location(device.location);
    d->set_household_id(device.household_id);
    d->set_model(device.model);
    d->set_boot_seq(device.boot_seq);
    d->set_reachable(device.reachable);
  }

  for (const auto& [id, player] : snapshot.players) {
    auto* p = out.add_players();
    p->set_device_id(id);
    p->set_name(player.name);
    if (player.volume) p->set_volume(*player.volume);
    if (player.muted) p->set_muted(*player.muted);
    if (player.fixed_volume) p->set_fixed_volume(*player.fixed_volume);
    p->set_subscription_degraded(player.subscription_degraded);
  }
  return out;
}

std::string ToJson(const TopologySnapshot& snapshot, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = pretty;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToProto(snapshot), &json, options);
  if (!status.ok()) {
    throw util::InvalidState("snapshot to JSON failed: " + std::string(status.message()));
  }
  return json;
}

} // namespace household::model
