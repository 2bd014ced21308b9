#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/snapshot.hpp"
#include "internal/runtime/keyed_serial_executor.hpp"

namespace household::topology {

enum class ChangeType : std::uint8_t {
  kGroupAdded    = 0,
  kGroupRemoved  = 1,
  kGroupUpdated  = 2,
  kPlayerUpdated = 3,
};

std::string_view ChangeTypeName(ChangeType type);

struct ChangeEvent {
  ChangeType  type{ChangeType::kGroupUpdated};
  // Group id or device id.
  std::string object_id;

  bool operator==(const ChangeEvent&) const = default;
};

struct TopologyChange {
  model::SnapshotPtr       snapshot;
  std::vector<ChangeEvent> events;
};

// Empty sets match everything.
struct ChangeFilter {
  std::set<ChangeType>  types;
  std::set<std::string> object_ids;

  bool Matches(const ChangeEvent& event) const;
};

// Differences between two consecutive snapshots, groups first.
std::vector<ChangeEvent> DiffSnapshots(const model::TopologySnapshot& previous, const model::TopologySnapshot& next);

/*
  Fans published snapshots out to listeners.

  Publish() only enqueues; delivery runs on one serial lane so listeners see
  versions in order and never concurrently. A listener only hears about a
  version when at least one of its events passes the filter, and receives
  just those events.
*/
class SnapshotPublisher {
 public:
  using ListenerId = std::uint64_t;
  using Callback   = std::function<void(const TopologyChange& change)>;

  explicit SnapshotPublisher(std::shared_ptr<runtime::Scheduler> scheduler);

  ListenerId Subscribe(Callback callback, ChangeFilter filter = {});
  bool       Unsubscribe(ListenerId id);

  void Publish(const model::SnapshotPtr& previous, const model::SnapshotPtr& next);

  std::size_t ListenerCount() const;

 private:
  struct Listener {
    std::shared_ptr<const Callback> callback;
    ChangeFilter                    filter;
  };

  void Deliver(const model::SnapshotPtr& snapshot, const std::vector<ChangeEvent>& events);

  runtime::KeyedSerialExecutor lane_;

  mutable std::mutex             mutex_;
  ListenerId                     next_id_{1};
  std::map<ListenerId, Listener> listeners_;
};

} // namespace household::topology
