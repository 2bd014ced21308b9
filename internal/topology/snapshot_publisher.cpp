#include "snapshot_publisher.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace household::topology {

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kLane = "snapshots";

} // namespace

std::string_view ChangeTypeName(ChangeType type) {
  switch (type) {
    case ChangeType::kGroupAdded:
      return "group_added";
    case ChangeType::kGroupRemoved:
      return "group_removed";
    case ChangeType::kGroupUpdated:
      return "group_updated";
    case ChangeType::kPlayerUpdated:
      return "player_updated";
  }
  return "unknown";
}

bool ChangeFilter::Matches(const ChangeEvent& event) const {
  if (!types.empty() && types.count(event.type) == 0) return false;
  if (!object_ids.empty() && object_ids.count(event.object_id) == 0) return false;
  return true;
}

std::vector<ChangeEvent> DiffSnapshots(const model::TopologySnapshot& previous, const model::TopologySnapshot& next) {
  std::vector<ChangeEvent> events;

  for (const auto& [id, group] : next.groups) {
    auto it = previous.groups.find(id);
    if (it == previous.groups.end()) {
      events.push_back(ChangeEvent{ChangeType::kGroupAdded, id});
    } else if (!(it->second == group)) {
      events.push_back(ChangeEvent{ChangeType::kGroupUpdated, id});
    }
  }
  for (const auto& [id, group] : previous.groups) {
    if (next.groups.count(id) == 0) events.push_back(ChangeEvent{ChangeType::kGroupRemoved, id});
  }

  std::set<std::string> players;
  for (const auto& [id, device] : next.devices) {
    auto it = previous.devices.find(id);
    if (it == previous.devices.end() || !(it->second == device)) players.insert(id);
  }
  for (const auto& [id, device] : previous.devices) {
    if (next.devices.count(id) == 0) players.insert(id);
  }
  for (const auto& [id, player] : next.players) {
    auto it = previous.players.find(id);
    if (it == previous.players.end() || !(it->second == player)) players.insert(id);
  }
  for (const auto& id : players) {
    events.push_back(ChangeEvent{ChangeType::kPlayerUpdated, id});
  }
  return events;
}

SnapshotPublisher::SnapshotPublisher(std::shared_ptr<runtime::Scheduler> scheduler) : lane_(std::move(scheduler)) {
}

SnapshotPublisher::ListenerId SnapshotPublisher::Subscribe(Callback callback, ChangeFilter filter) {
  std::lock_guard lock(mutex_);
  const auto      id = next_id_++;
  listeners_.emplace(id, Listener{std::make_shared<const Callback>(std::move(callback)), std::move(filter)});
  return id;
}

bool SnapshotPublisher::Unsubscribe(ListenerId id) {
  std::lock_guard lock(mutex_);
  return listeners_.erase(id) > 0;
}

std::size_t SnapshotPublisher::ListenerCount() const {
  std::lock_guard lock(mutex_);
  return listeners_.size();
}

void SnapshotPublisher::Publish(const model::SnapshotPtr& previous, const model::SnapshotPtr& next) {
  auto events = DiffSnapshots(*previous, *next);
  if (events.empty()) return;

  lane_.Submit(kLane, [this, snapshot = next, events = std::move(events)] { Deliver(snapshot, events); });
}

void SnapshotPublisher::Deliver(const model::SnapshotPtr& snapshot, const std::vector<ChangeEvent>& events) {
  std::vector<std::pair<ListenerId, Listener>> listeners;
  {
    std::lock_guard lock(mutex_);
    listeners.assign(listeners_.begin(), listeners_.end());
  }

  for (const auto& [id, listener] : listeners) {
    TopologyChange change{snapshot, {}};
    for (const auto& event : events) {
      if (listener.filter.Matches(event)) change.events.push_back(event);
    }
    if (change.events.empty()) continue;

    // Unsubscribed while this version was queued.
    {
      std::lock_guard lock(mutex_);
      if (listeners_.count(id) == 0) continue;
    }

    try {
      (*listener.callback)(change);
    } catch (const std::exception& e) {
      HOUSEHOLD_LOG_WARN("Change listener failed", {IntField("listener", static_cast<std::int64_t>(id)),
                                                    IntField("version", static_cast<std::int64_t>(snapshot->version)),
                                                    StringField("error", e.what())});
    }
  }
}

} // namespace household::topology
