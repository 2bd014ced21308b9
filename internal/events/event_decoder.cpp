#include "event_decoder.hpp"

#include <cctype>
#include <charconv>
#include <map>

#include "internal/util/errors.hpp"
#include "internal/util/xml.hpp"

namespace household::events {

using Tree = util::XmlElement;

using model::EventCategory;
using model::EventDelta;
using util::FindAttribute;
using util::FindChild;
using util::LocalName;
using util::ParseXml;

namespace {

std::string_view Trim(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) value.remove_prefix(1);
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) value.remove_suffix(1);
  return value;
}

int ParseInt(std::string_view text, std::string_view what) {
  text      = Trim(text);
  int value = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || end != text.data() + text.size()) {
    throw util::DecodeError("invalid " + std::string(what) + ": '" + std::string(text) + "'");
  }
  return value;
}

bool ParseFlag(std::string_view text) {
  text = Trim(text);
  return text == "1" || text == "true" || text == "True";
}

// ------------------------------------------------------------
// Property sets and LastChange documents
// ------------------------------------------------------------

using Variables = std::map<std::string, std::string, std::less<>>;

Variables ReadPropertySet(const std::string& body) {
  const auto  doc = ParseXml(body);
  const Tree* set = FindChild(doc, "propertyset");
  if (set == nullptr) {
    throw util::DecodeError("body is not a propertyset");
  }

  Variables variables;
  for (const auto& property : set->children) {
    if (LocalName(property.name) != "property") continue;
    for (const auto& value : property.children) {
      variables[std::string(LocalName(value.name))] = value.text;
    }
  }
  return variables;
}

// The InstanceID 0 element of a LastChange Event document.
Tree ReadInstance(const std::string& last_change) {
  const auto  doc   = ParseXml(last_change);
  const Tree* event = FindChild(doc, "Event");
  if (event == nullptr) {
    throw util::DecodeError("LastChange without Event");
  }

  const Tree* first = nullptr;
  for (const auto& instance : event->children) {
    if (LocalName(instance.name) != "InstanceID") continue;
    if (first == nullptr) first = &instance;
    if (Trim(FindAttribute(instance, "val").value_or("0")) == "0") return instance;
  }
  if (first == nullptr) {
    throw util::DecodeError("LastChange without InstanceID");
  }
  return *first;
}

std::optional<std::string> Value(const Tree& instance, std::string_view local) {
  const Tree* node = FindChild(instance, local);
  if (node == nullptr) return std::nullopt;
  return FindAttribute(*node, "val");
}

// A parsed item describes the whole track; absent elements clear the field.
void ReadDidl(const std::string& didl, model::TrackChange& track) {
  const auto  doc  = ParseXml(didl);
  const Tree* root = FindChild(doc, "DIDL-Lite");
  if (root == nullptr) return;
  const Tree* item = FindChild(*root, "item");
  if (item == nullptr) return;

  const Tree* title   = FindChild(*item, "title");
  const Tree* creator = FindChild(*item, "creator");
  const Tree* album   = FindChild(*item, "album");
  track.title         = title != nullptr ? title->text : std::string();
  track.artist        = creator != nullptr ? creator->text : std::string();
  track.album         = album != nullptr ? album->text : std::string();
}

// ------------------------------------------------------------
// Categories
// ------------------------------------------------------------

std::vector<EventDelta> DecodeTopology(const std::string& device_id, const model::EventStamp& stamp, const Variables& variables) {
  auto it = variables.find("ZoneGroupState");
  if (it == variables.end()) return {};

  const auto  doc    = ParseXml(it->second);
  const Tree* groups = nullptr;
  if (const Tree* state = FindChild(doc, "ZoneGroupState")) {
    groups = FindChild(*state, "ZoneGroups");
  } else {
    groups = FindChild(doc, "ZoneGroups");
  }
  if (groups == nullptr) {
    throw util::DecodeError("ZoneGroupState without ZoneGroups");
  }

  model::GroupTopologyChanged delta{device_id, stamp, {}};
  for (const auto& group : groups->children) {
    if (LocalName(group.name) != "ZoneGroup") continue;

    model::GroupClaim claim;
    claim.coordinator_id = FindAttribute(group, "Coordinator").value_or("");
    if (claim.coordinator_id.empty()) {
      throw util::DecodeError("ZoneGroup without Coordinator");
    }
    claim.group_id = FindAttribute(group, "ID").value_or(claim.coordinator_id);

    bool coordinator_listed = false;
    for (const auto& member : group.children) {
      if (LocalName(member.name) != "ZoneGroupMember") continue;

      const auto uuid = FindAttribute(member, "UUID").value_or("");
      if (uuid.empty()) continue;
      // Bonded surrounds and subs report as invisible members.
      if (uuid != claim.coordinator_id && ParseFlag(FindAttribute(member, "Invisible").value_or("0"))) continue;

      model::ClaimedMember claimed{uuid, FindAttribute(member, "ZoneName").value_or("")};
      if (uuid == claim.coordinator_id) {
        coordinator_listed = true;
        claim.members.insert(claim.members.begin(), std::move(claimed));
      } else {
        claim.members.push_back(std::move(claimed));
      }
    }
    if (!coordinator_listed) {
      claim.members.insert(claim.members.begin(), model::ClaimedMember{claim.coordinator_id, ""});
    }

    delta.groups.push_back(std::move(claim));
  }
  return {std::move(delta)};
}

std::vector<EventDelta> DecodeTransport(const std::string& device_id, const model::EventStamp& stamp, const Variables& variables) {
  auto it = variables.find("LastChange");
  if (it == variables.end()) return {};

  const auto instance = ReadInstance(it->second);

  model::TransportStateChanged delta;
  delta.device_id = device_id;
  delta.stamp     = stamp;
  bool seen       = false;

  if (auto value = Value(instance, "TransportState")) {
    delta.state = ParseTransportState(*value);
    seen        = true;
  }

  // Unusable values (NOT_IMPLEMENTED, empty metadata) leave the field unchanged.
  if (auto value = Value(instance, "CurrentTrackURI")) {
    const auto uri = Trim(*value);
    if (uri != "NOT_IMPLEMENTED") delta.track.uri = std::string(uri);
  }
  if (auto value = Value(instance, "CurrentTrackMetaData")) {
    const auto didl = Trim(*value);
    if (!didl.empty() && didl != "NOT_IMPLEMENTED") ReadDidl(std::string(didl), delta.track);
  }
  if (auto value = Value(instance, "CurrentTrackDuration")) {
    delta.track.duration_ms = ParseTrackDuration(*value);
  }
  if (!delta.track.Empty()) seen = true;

  if (auto value = Value(instance, "CurrentTransportActions")) {
    delta.actions = ParseTransportActions(*value);
    seen          = true;
  }

  if (auto value = Value(instance, "CurrentPlayMode")) {
    delta.play_modes = ParsePlayMode(*value);
    seen             = true;
  }
  if (auto value = Value(instance, "CurrentCrossfadeMode")) {
    delta.crossfade = ParseFlag(*value);
    seen            = true;
  }

  if (!seen) return {};
  return {std::move(delta)};
}

std::vector<EventDelta> DecodeRendering(const std::string& device_id, const model::EventStamp& stamp, const Variables& variables) {
  auto it = variables.find("LastChange");
  if (it == variables.end()) return {};

  const auto instance = ReadInstance(it->second);

  model::VolumeChanged delta{device_id, stamp, std::nullopt, std::nullopt, std::nullopt};
  for (const auto& node : instance.children) {
    const auto local = LocalName(node.name);
    const auto value = FindAttribute(node, "val");
    if (!value) continue;

    if (local == "Volume" || local == "Mute") {
      if (FindAttribute(node, "channel").value_or("Master") != "Master") continue;
      if (local == "Volume") {
        delta.volume = ParseInt(*value, "Volume");
      } else {
        delta.muted = ParseFlag(*value);
      }
    } else if (local == "OutputFixed") {
      delta.fixed_volume = ParseFlag(*value);
    }
  }

  if (!delta.volume && !delta.muted && !delta.fixed_volume) return {};
  return {std::move(delta)};
}

std::vector<EventDelta> DecodeGroupRendering(const std::string& device_id, const model::EventStamp& stamp, const Variables& variables) {
  model::GroupVolumeChanged delta{device_id, stamp, std::nullopt, std::nullopt};

  if (auto it = variables.find("GroupVolume"); it != variables.end()) {
    delta.volume = ParseInt(it->second, "GroupVolume");
  }
  if (auto it = variables.find("GroupMute"); it != variables.end()) {
    delta.muted = ParseFlag(it->second);
  }

  if (!delta.volume && !delta.muted) return {};
  return {std::move(delta)};
}

} // namespace

// ------------------------------------------------------------
// Value parsers
// ------------------------------------------------------------

std::optional<model::PlaybackState> ParseTransportState(std::string_view value) {
  value = Trim(value);
  if (value == "PLAYING") return model::PlaybackState::kPlaying;
  if (value == "PAUSED_PLAYBACK") return model::PlaybackState::kPaused;
  if (value == "STOPPED") return model::PlaybackState::kStopped;
  if (value == "TRANSITIONING") return model::PlaybackState::kBuffering;
  if (value == "NO_MEDIA_PRESENT") return model::PlaybackState::kIdle;
  return std::nullopt;
}

std::optional<model::PlayModes> ParsePlayMode(std::string_view value) {
  value = Trim(value);
  model::PlayModes modes;
  if (value == "NORMAL") return modes;
  if (value == "REPEAT_ALL") {
    modes.repeat = true;
    return modes;
  }
  if (value == "REPEAT_ONE") {
    modes.repeat_one = true;
    return modes;
  }
  if (value == "SHUFFLE_NOREPEAT") {
    modes.shuffle = true;
    return modes;
  }
  if (value == "SHUFFLE") {
    modes.shuffle = true;
    modes.repeat  = true;
    return modes;
  }
  if (value == "SHUFFLE_REPEAT_ONE") {
    modes.shuffle    = true;
    modes.repeat_one = true;
    return modes;
  }
  return std::nullopt;
}

model::PlaybackActions ParseTransportActions(std::string_view value) {
  model::PlaybackActions actions;
  while (!value.empty()) {
    const auto comma  = value.find(',');
    const auto action = Trim(value.substr(0, comma));
    if (action == "Play") actions.can_play = true;
    if (action == "Pause") actions.can_pause = true;
    if (action == "Stop") actions.can_stop = true;
    if (action == "Next") actions.can_skip_forward = true;
    if (action == "Previous") actions.can_skip_backward = true;
    if (comma == std::string_view::npos) break;
    value.remove_prefix(comma + 1);
  }
  return actions;
}

std::optional<int64_t> ParseTrackDuration(std::string_view value) {
  value = Trim(value);
  if (auto dot = value.find('.'); dot != std::string_view::npos) value = value.substr(0, dot);

  int64_t parts[3] = {0, 0, 0};
  int     count    = 0;
  while (true) {
    const auto colon = value.find(':');
    const auto field = value.substr(0, colon);
    if (count == 3 || field.empty()) return std::nullopt;

    auto [end, ec] = std::from_chars(field.data(), field.data() + field.size(), parts[count]);
    if (ec != std::errc() || end != field.data() + field.size()) return std::nullopt;
    ++count;

    if (colon == std::string_view::npos) break;
    value.remove_prefix(colon + 1);
  }
  if (count != 3) return std::nullopt;

  return ((parts[0] * 60 + parts[1]) * 60 + parts[2]) * 1000;
}

// ------------------------------------------------------------
// EventDecoder
// ------------------------------------------------------------

std::vector<EventDelta> EventDecoder::Decode(EventCategory category, const std::string& device_id, const model::EventStamp& stamp,
                                             const std::string& body) const {
  try {
    const auto variables = ReadPropertySet(body);
    switch (category) {
      case EventCategory::kZoneGroupTopology:
        return DecodeTopology(device_id, stamp, variables);
      case EventCategory::kAVTransport:
        return DecodeTransport(device_id, stamp, variables);
      case EventCategory::kRenderingControl:
        return DecodeRendering(device_id, stamp, variables);
      case EventCategory::kGroupRenderingControl:
        return DecodeGroupRendering(device_id, stamp, variables);
    }
    return {};
  } catch (const util::DecodeError& e) {
    return {model::UnknownEvent{device_id, stamp, category, e.what()}};
  }
}

} // namespace household::events
