#include "topology_coordinator.hpp"

#include <variant>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace household::topology {

using observability::IntField;
using observability::StringField;

CoordinatorOptions CoordinatorOptions::FromConfig(const household::runtime::config::TopologyConfig& config) {
  CoordinatorOptions options;
  options.coordinator_grace = util::FromProto(config.coordinator_grace());
  options.conflict_window   = util::FromProto(config.conflict_window());
  return options;
}

TopologyCoordinator::TopologyCoordinator(CoordinatorOptions options, std::shared_ptr<runtime::Scheduler> scheduler,
                                         std::shared_ptr<SnapshotPublisher> publisher)
    : options_(options),
      scheduler_(std::move(scheduler)),
      publisher_(std::move(publisher)),
      current_(std::make_shared<const model::TopologySnapshot>()) {
}

model::SnapshotPtr TopologyCoordinator::Snapshot() const {
  std::lock_guard lock(snapshot_mutex_);
  return current_;
}

bool TopologyCoordinator::IsReferencedByLiveGroup(const std::string& device_id) const {
  const auto  snapshot = Snapshot();
  const auto* group    = snapshot->GroupOf(device_id);
  if (group == nullptr) return false;

  for (const auto& member : group->member_ids) {
    auto it = snapshot->devices.find(member);
    if (it != snapshot->devices.end() && it->second.reachable) return true;
  }
  return false;
}

// ------------------------------------------------------------
// Event deltas
// ------------------------------------------------------------

void TopologyCoordinator::Apply(const std::vector<model::EventDelta>& deltas) {
  std::lock_guard lock(mutex_);

  for (const auto& delta : deltas) {
    const auto& device_id = model::DeviceOf(delta);
    if (devices_.count(device_id) == 0) {
      HOUSEHOLD_LOG_DEBUG("Ignoring delta for unknown device", {StringField("device", device_id)});
      continue;
    }
    std::visit([this](const auto& typed) { ApplyOne(typed); }, delta);
  }
  Rebuild();
}

void TopologyCoordinator::ApplyOne(const model::TransportStateChanged& delta) {
  auto& player = players_[delta.device_id];
  player.state.Merge(delta.state, delta.stamp);
  player.track.Merge(delta.track, delta.stamp);
  player.play_modes.Merge(delta.play_modes, delta.stamp);
  player.crossfade.Merge(delta.crossfade, delta.stamp);
  player.actions.Merge(delta.actions, delta.stamp);
}

void TopologyCoordinator::ApplyOne(const model::VolumeChanged& delta) {
  auto& player = players_[delta.device_id];
  player.volume.Merge(delta.volume, delta.stamp);
  player.muted.Merge(delta.muted, delta.stamp);
  player.fixed_volume.Merge(delta.fixed_volume, delta.stamp);
}

void TopologyCoordinator::ApplyOne(const model::GroupVolumeChanged& delta) {
  auto& player = players_[delta.device_id];
  player.group_volume.Merge(delta.volume, delta.stamp);
  player.group_muted.Merge(delta.muted, delta.stamp);
}

void TopologyCoordinator::ApplyOne(const model::GroupTopologyChanged& delta) {
  // Every group in the payload contributes zone names.
  for (const auto& group : delta.groups) {
    for (const auto& member : group.members) {
      if (member.name.empty()) continue;
      auto& record = names_[member.id];
      if (record.name.empty() || !(delta.stamp < record.stamp)) {
        record.name  = member.name;
        record.stamp = delta.stamp;
      }
    }
  }

  // Only the reporter's own group counts toward membership.
  auto existing = claims_.find(delta.device_id);
  if (existing != claims_.end() && delta.stamp < existing->second.stamp) {
    HOUSEHOLD_LOG_DEBUG("Ignoring out-of-order topology claim", {StringField("device", delta.device_id)});
    return;
  }

  ClaimRecord record{delta.stamp, std::nullopt};
  for (const auto& group : delta.groups) {
    for (const auto& member : group.members) {
      if (member.id == delta.device_id) {
        record.group = group;
        break;
      }
    }
    if (record.group) break;
  }
  claims_[delta.device_id] = std::move(record);
}

void TopologyCoordinator::ApplyOne(const model::UnknownEvent&) {
}

// ------------------------------------------------------------
// Discovery and subscription inputs
// ------------------------------------------------------------

void TopologyCoordinator::OnDeviceReachable(const model::Device& device) {
  std::lock_guard lock(mutex_);

  auto copy      = device;
  copy.reachable = true;
  devices_[device.id] = std::move(copy);
  players_.try_emplace(device.id);
  dissolved_.erase(device.id);
  CancelGrace(device.id);

  Rebuild();
}

void TopologyCoordinator::OnDeviceUnreachable(const std::string& device_id) {
  std::lock_guard lock(mutex_);

  auto it = devices_.find(device_id);
  if (it == devices_.end() || !it->second.reachable) return;
  it->second.reachable = false;

  const auto snapshot = Snapshot();
  auto       led      = snapshot->groups.find(device_id);
  if (led != snapshot->groups.end() && led->second.member_ids.size() > 1 && grace_timers_.count(device_id) == 0) {
    HOUSEHOLD_LOG_INFO("Coordinator unreachable; holding group", {StringField("device", device_id),
                                                                 IntField("grace_ms", options_.coordinator_grace.count())});
    grace_timers_[device_id] = scheduler_->ScheduleAfter(options_.coordinator_grace, [this, device_id] { OnGraceExpired(device_id); });
  }

  Rebuild();
}

void TopologyCoordinator::OnDeviceRemoved(const std::string& device_id) {
  std::lock_guard lock(mutex_);

  devices_.erase(device_id);
  claims_.erase(device_id);
  names_.erase(device_id);
  players_.erase(device_id);
  dissolved_.erase(device_id);
  conflict_since_.erase(device_id);
  conflict_reported_.erase(device_id);
  CancelGrace(device_id);

  Rebuild();
}

void TopologyCoordinator::OnSubscriptionDegraded(const std::string& device_id, bool degraded) {
  std::lock_guard lock(mutex_);

  auto it = players_.find(device_id);
  if (it == players_.end() || devices_.count(device_id) == 0) return;
  it->second.degraded = degraded;

  Rebuild();
}

void TopologyCoordinator::OnGraceExpired(const std::string& device_id) {
  std::lock_guard lock(mutex_);

  grace_timers_.erase(device_id);
  auto it = devices_.find(device_id);
  if (it == devices_.end() || it->second.reachable) return;

  dissolved_.insert(device_id);
  for (auto& [reporter, record] : claims_) {
    if (record.group && record.group->coordinator_id == device_id) record.group.reset();
  }
  HOUSEHOLD_LOG_INFO("Coordinator grace expired; dissolving group", {StringField("device", device_id)});

  Rebuild();
}

void TopologyCoordinator::CancelGrace(const std::string& device_id) {
  auto it = grace_timers_.find(device_id);
  if (it == grace_timers_.end()) return;
  scheduler_->Cancel(it->second);
  grace_timers_.erase(it);
}

void TopologyCoordinator::Shutdown() {
  std::lock_guard lock(mutex_);

  for (const auto& [device_id, timer] : grace_timers_) {
    scheduler_->Cancel(timer);
  }
  grace_timers_.clear();

  if (conflict_timer_ != runtime::Scheduler::kNoTask) {
    scheduler_->Cancel(conflict_timer_);
    conflict_timer_ = runtime::Scheduler::kNoTask;
  }
}

// ------------------------------------------------------------
// Snapshot construction
// ------------------------------------------------------------

model::Group TopologyCoordinator::BuildGroup(const ResolvedGroup& resolved) const {
  model::Group group;
  group.id             = resolved.coordinator_id;
  group.coordinator_id = resolved.coordinator_id;
  group.member_ids     = resolved.member_ids;

  if (auto name = names_.find(resolved.coordinator_id); name != names_.end()) {
    group.name = name->second.name;
  }

  if (auto it = players_.find(resolved.coordinator_id); it != players_.end()) {
    const auto& player     = it->second;
    group.playback.state   = player.state.value.value_or(model::PlaybackState::kIdle);
    group.playback.track   = player.track.Value();
    auto modes             = player.play_modes.value.value_or(model::PlayModes{});
    modes.crossfade        = player.crossfade.value.value_or(false);
    group.playback.play_modes = modes;
    group.playback.actions    = player.actions.value.value_or(model::PlaybackActions{});
    group.volume           = player.group_volume.value;
    group.muted            = player.group_muted.value;
  }
  return group;
}

model::PlayerState TopologyCoordinator::BuildPlayer(const std::string& device_id) const {
  model::PlayerState state;
  if (auto name = names_.find(device_id); name != names_.end()) {
    state.name = name->second.name;
  }
  if (auto it = players_.find(device_id); it != players_.end()) {
    state.volume                = it->second.volume.value;
    state.muted                 = it->second.muted.value;
    state.fixed_volume          = it->second.fixed_volume.value;
    state.subscription_degraded = it->second.degraded;
  }
  return state;
}

void TopologyCoordinator::Rebuild() {
  std::set<std::string> ids;
  for (const auto& [id, device] : devices_) ids.insert(id);

  const auto resolution = GroupResolver::Resolve(ids, claims_, dissolved_);
  TrackConflicts(resolution.conflicted);

  const auto previous = Snapshot();
  const auto now      = scheduler_->Now();

  auto next     = std::make_shared<model::TopologySnapshot>();
  next->devices = devices_;
  for (const auto& id : ids) {
    next->players.emplace(id, BuildPlayer(id));
  }

  for (const auto& [coordinator, resolved] : resolution.groups) {
    auto group = BuildGroup(resolved);
    auto prior = previous->groups.find(coordinator);
    if (prior != previous->groups.end()) {
      group.updated_at = prior->second.updated_at;
      if (!(group == prior->second)) group.updated_at = now;
    } else {
      group.updated_at = now;
    }
    next->groups.emplace(coordinator, std::move(group));
  }

  if (next->SameContent(*previous)) return;

  try {
    GroupResolver::Validate(*next);
  } catch (const util::TopologyInconsistency& e) {
    HOUSEHOLD_LOG_ERROR("Refusing to publish inconsistent topology", {StringField("error", e.what())});
    return;
  }

  next->version      = previous->version + 1;
  next->published_at = util::WallNow();

  model::SnapshotPtr published = std::move(next);
  {
    std::lock_guard lock(snapshot_mutex_);
    current_ = published;
  }
  ++snapshots_published_;

  HOUSEHOLD_LOG_DEBUG("Topology snapshot published", {IntField("version", static_cast<std::int64_t>(published->version)),
                                                      IntField("groups", static_cast<std::int64_t>(published->groups.size())),
                                                      IntField("devices", static_cast<std::int64_t>(published->devices.size()))});
  publisher_->Publish(previous, published);
}

// ------------------------------------------------------------
// Conflicts
// ------------------------------------------------------------

void TopologyCoordinator::TrackConflicts(const std::set<std::string>& conflicted) {
  const auto now = scheduler_->Now();

  for (auto it = conflict_since_.begin(); it != conflict_since_.end();) {
    if (conflicted.count(it->first) == 0) {
      conflict_reported_.erase(it->first);
      it = conflict_since_.erase(it);
    } else {
      ++it;
    }
  }

  bool pending = false;
  for (const auto& id : conflicted) {
    auto [it, inserted] = conflict_since_.emplace(id, now);
    if (conflict_reported_.count(id) != 0) continue;

    if (!inserted && now - it->second >= options_.conflict_window) {
      conflict_reported_.insert(id);
      HOUSEHOLD_LOG_WARN("TopologyInconsistency: conflicting group claims persist; newest claim wins",
                         {StringField("device", id), IntField("window_ms", options_.conflict_window.count())});
    } else {
      pending = true;
    }
  }

  if (pending && conflict_timer_ == runtime::Scheduler::kNoTask) {
    conflict_timer_ = scheduler_->ScheduleAfter(options_.conflict_window, [this] { OnConflictCheckDue(); });
  }
}

void TopologyCoordinator::OnConflictCheckDue() {
  std::lock_guard lock(mutex_);
  conflict_timer_ = runtime::Scheduler::kNoTask;
  Rebuild();
}

} // namespace household::topology
