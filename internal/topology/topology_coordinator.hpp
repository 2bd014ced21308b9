#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "group_resolver.hpp"
#include "internal/discovery/discovery_scanner.hpp"
#include "internal/model/event_delta.hpp"
#include "internal/model/snapshot.hpp"
#include "internal/runtime/scheduler.hpp"
#include "snapshot_publisher.hpp"

namespace household::runtime::config {
class TopologyConfig;
}

namespace household::topology {

struct CoordinatorOptions {
  util::Millis coordinator_grace{10000};
  util::Millis conflict_window{30000};

  static CoordinatorOptions FromConfig(const household::runtime::config::TopologyConfig& config);
};

/*
  Single writer of the household topology.

  Every input (a decoded notification cycle, a discovery transition, a
  degraded flag) is folded into the coordinator's tables under mutex_ and
  followed by one rebuild. A rebuild publishes a new snapshot version only
  when content changed, which makes re-applying a delta a no-op.
*/
class TopologyCoordinator : public discovery::DiscoveryListener {
 public:
  TopologyCoordinator(CoordinatorOptions options, std::shared_ptr<runtime::Scheduler> scheduler,
                      std::shared_ptr<SnapshotPublisher> publisher);

  TopologyCoordinator(const TopologyCoordinator&)            = delete;
  TopologyCoordinator& operator=(const TopologyCoordinator&) = delete;

  void Apply(const std::vector<model::EventDelta>& deltas);

  void OnDeviceReachable(const model::Device& device) override;
  void OnDeviceUnreachable(const std::string& device_id) override;
  void OnDeviceRemoved(const std::string& device_id) override;

  void OnSubscriptionDegraded(const std::string& device_id, bool degraded);

  model::SnapshotPtr Snapshot() const;

  // True while device_id belongs to a group with a reachable member.
  bool IsReferencedByLiveGroup(const std::string& device_id) const;

  // Cancels grace timers.
  void Shutdown();

  std::uint64_t SnapshotsPublished() const {
    return snapshots_published_;
  }

 private:
  template <class T>
  struct Stamped {
    std::optional<T>  value;
    model::EventStamp stamp;

    // Field-wise merge; older updates are ignored.
    void Merge(const std::optional<T>& update, const model::EventStamp& at) {
      if (!update || (value && at < stamp)) return;
      value = update;
      stamp = at;
    }
  };

  struct TrackRecord {
    Stamped<std::string> uri;
    Stamped<std::string> title;
    Stamped<std::string> artist;
    Stamped<std::string> album;
    Stamped<int64_t>     duration_ms;

    void Merge(const model::TrackChange& update, const model::EventStamp& at) {
      uri.Merge(update.uri, at);
      title.Merge(update.title, at);
      artist.Merge(update.artist, at);
      album.Merge(update.album, at);
      duration_ms.Merge(update.duration_ms, at);
    }

    model::Track Value() const {
      return {uri.value.value_or(""), title.value.value_or(""), artist.value.value_or(""), album.value.value_or(""),
              duration_ms.value.value_or(0)};
    }
  };

  struct PlayerRecord {
    Stamped<model::PlaybackState>   state;
    TrackRecord                     track;
    Stamped<model::PlayModes>       play_modes;
    Stamped<bool>                   crossfade;
    Stamped<model::PlaybackActions> actions;
    Stamped<int>                    volume;
    Stamped<bool>                   muted;
    Stamped<bool>                   fixed_volume;
    Stamped<int>                    group_volume;
    Stamped<bool>                   group_muted;
    bool                            degraded{false};
  };

  struct NameRecord {
    std::string       name;
    model::EventStamp stamp;
  };

  void ApplyOne(const model::TransportStateChanged& delta);
  void ApplyOne(const model::VolumeChanged& delta);
  void ApplyOne(const model::GroupVolumeChanged& delta);
  void ApplyOne(const model::GroupTopologyChanged& delta);
  void ApplyOne(const model::UnknownEvent& delta);

  void OnGraceExpired(const std::string& device_id);
  void CancelGrace(const std::string& device_id);
  void Rebuild();
  void TrackConflicts(const std::set<std::string>& conflicted);
  void OnConflictCheckDue();

  model::Group       BuildGroup(const ResolvedGroup& resolved) const;
  model::PlayerState BuildPlayer(const std::string& device_id) const;

  CoordinatorOptions                  options_;
  std::shared_ptr<runtime::Scheduler> scheduler_;
  std::shared_ptr<SnapshotPublisher>  publisher_;

  mutable std::mutex                                mutex_;
  std::map<std::string, model::Device>              devices_;
  std::map<std::string, ClaimRecord>                claims_;
  std::map<std::string, NameRecord>                 names_;
  std::map<std::string, PlayerRecord>               players_;
  // Coordinators whose grace expired; claims naming them are ignored until
  // they are reachable again.
  std::set<std::string>                             dissolved_;
  std::map<std::string, runtime::Scheduler::TaskId> grace_timers_;
  std::map<std::string, util::TimePoint>            conflict_since_;
  std::set<std::string>                             conflict_reported_;
  runtime::Scheduler::TaskId                        conflict_timer_{runtime::Scheduler::kNoTask};

  mutable std::mutex snapshot_mutex_;
  model::SnapshotPtr current_;

  std::atomic<std::uint64_t> snapshots_published_{0};
};

} // namespace household::topology
