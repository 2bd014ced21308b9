#include "internal/topology/topology_coordinator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "tests/support/manual_scheduler.hpp"

namespace {

using household::model::ClaimedMember;
using household::model::Device;
using household::model::EventStamp;
using household::model::GroupClaim;
using household::model::GroupTopologyChanged;
using household::model::GroupVolumeChanged;
using household::model::PlaybackState;
using household::model::PlayModes;
using household::model::PlaybackActions;
using household::model::TrackChange;
using household::model::TransportStateChanged;
using household::model::VolumeChanged;
using household::test_support::ManualScheduler;
using household::topology::ChangeEvent;
using household::topology::ChangeType;
using household::topology::CoordinatorOptions;
using household::topology::SnapshotPublisher;
using household::topology::TopologyChange;
using household::topology::TopologyCoordinator;
using std::chrono::seconds;

using Ids = std::vector<std::string>;

EventStamp At(int secs, std::uint64_t sequence = 0) {
  return EventStamp{household::util::TimePoint{} + seconds(secs), sequence};
}

Device MakeDevice(const std::string& id) {
  Device device;
  device.id   = id;
  device.host = "192.168.1." + std::to_string(20 + id.back() - 'A');
  return device;
}

GroupTopologyChanged Topology(const std::string& reporter, int secs, const std::vector<std::pair<std::string, Ids>>& groups) {
  GroupTopologyChanged delta{reporter, At(secs), {}};
  for (const auto& [coordinator, members] : groups) {
    GroupClaim claim{coordinator + ":1", coordinator, {}};
    for (const auto& id : members) claim.members.push_back(ClaimedMember{id, "Room " + id});
    delta.groups.push_back(std::move(claim));
  }
  return delta;
}

struct Fixture {
  Fixture() {
    CoordinatorOptions options;
    options.coordinator_grace = seconds(10);
    options.conflict_window   = seconds(30);
    coordinator               = std::make_unique<TopologyCoordinator>(options, scheduler, publisher);
    publisher->Subscribe([this](const TopologyChange& change) { changes.push_back(change); });
  }

  void Discover(const Ids& ids) {
    for (const auto& id : ids) coordinator->OnDeviceReachable(MakeDevice(id));
  }

  // Every listed device reports the same grouping.
  void Group(int secs, const std::string& coordinator_id, const Ids& members) {
    std::vector<household::model::EventDelta> deltas;
    for (const auto& reporter : members) deltas.emplace_back(Topology(reporter, secs, {{coordinator_id, members}}));
    coordinator->Apply(deltas);
  }

  Ids MembersOf(const std::string& group_id) const {
    auto snapshot = coordinator->Snapshot();
    auto it       = snapshot->groups.find(group_id);
    return it == snapshot->groups.end() ? Ids{} : it->second.member_ids;
  }

  std::uint64_t Version() const {
    return coordinator->Snapshot()->version;
  }

  std::shared_ptr<ManualScheduler>     scheduler = std::make_shared<ManualScheduler>();
  std::shared_ptr<SnapshotPublisher>   publisher = std::make_shared<SnapshotPublisher>(scheduler);
  std::unique_ptr<TopologyCoordinator> coordinator;
  std::vector<TopologyChange>          changes;
};

void TestDiscoveredDevicesStartAsSingletons() {
  Fixture f;
  assert(f.Version() == 0);
  assert(f.coordinator->Snapshot()->groups.empty());

  f.Discover({"A", "B"});
  auto snapshot = f.coordinator->Snapshot();
  assert(snapshot->version == 2);
  assert(snapshot->groups.size() == 2);
  assert((f.MembersOf("A") == Ids{"A"}));
  assert(snapshot->devices.at("B").reachable);
  assert(snapshot->players.count("B") == 1);

  // Same device again changes nothing.
  f.coordinator->OnDeviceReachable(MakeDevice("A"));
  assert(f.Version() == 2);
  assert(f.coordinator->SnapshotsPublished() == 2);
}

void TestTopologyEventFormsGroupAndIsIdempotent() {
  Fixture f;
  f.Discover({"A", "B", "C"});

  f.Group(10, "A", {"A", "B"});
  const auto version = f.Version();
  auto       snapshot = f.coordinator->Snapshot();
  assert(snapshot->groups.size() == 2);
  assert((f.MembersOf("A") == Ids{"A", "B"}));
  assert(snapshot->groups.at("A").name == "Room A");
  assert(snapshot->players.at("B").name == "Room B");
  assert(snapshot->GroupOf("B")->id == "A");

  f.Group(10, "A", {"A", "B"});
  assert(f.Version() == version);

  // An older payload cannot undo the grouping.
  f.coordinator->Apply({Topology("A", 5, {{"A", {"A"}}}), Topology("B", 5, {{"B", {"B"}}})});
  assert((f.MembersOf("A") == Ids{"A", "B"}));
  assert(f.Version() == version);
}

void TestPlaybackFieldsMergeByStamp() {
  Fixture f;
  f.Discover({"A", "B"});
  f.Group(1, "A", {"A", "B"});

  TransportStateChanged playing{"A", At(20), PlaybackState::kPlaying, {}, PlayModes{true, false, false, false}, true, std::nullopt};
  f.coordinator->Apply({playing});

  // Older state is ignored, but the track it carries was never set.
  TrackChange track;
  track.uri   = "x-sonos-http:track1.mp3";
  track.title = "First";
  TransportStateChanged older{"A", At(10), PlaybackState::kPaused, track, std::nullopt, std::nullopt, std::nullopt};
  f.coordinator->Apply({older});

  auto group = f.coordinator->Snapshot()->groups.at("A");
  assert(group.playback.state == PlaybackState::kPlaying);
  assert(group.playback.track.title == "First");
  assert(group.playback.play_modes.shuffle);
  assert(group.playback.play_modes.crossfade);

  // Same receive time, higher sequence wins.
  f.coordinator->Apply({TransportStateChanged{"A", At(20, 1), PlaybackState::kStopped, {}, std::nullopt, std::nullopt, std::nullopt}});
  assert(f.coordinator->Snapshot()->groups.at("A").playback.state == PlaybackState::kStopped);

  // Members' transport events do not drive the group.
  f.coordinator->Apply({TransportStateChanged{"B", At(30), PlaybackState::kPlaying, {}, std::nullopt, std::nullopt, std::nullopt}});
  assert(f.coordinator->Snapshot()->groups.at("A").playback.state == PlaybackState::kStopped);
}

TransportStateChanged TrackEvent(const std::string& device_id, int secs, TrackChange track) {
  TransportStateChanged delta;
  delta.device_id = device_id;
  delta.stamp     = At(secs);
  delta.track     = std::move(track);
  return delta;
}

void TestPartialTrackEventsKeepOtherTrackFields() {
  Fixture f;
  f.Discover({"A"});

  TrackChange full;
  full.uri         = "x-sonos-http:track1.mp3";
  full.title       = "First";
  full.artist      = "The Band";
  full.album       = "Live";
  full.duration_ms = 205000;
  f.coordinator->Apply({TrackEvent("A", 10, full)});

  TrackChange tick;
  tick.duration_ms = 206000;
  f.coordinator->Apply({TrackEvent("A", 11, tick)});

  auto track = f.coordinator->Snapshot()->groups.at("A").playback.track;
  assert(track.uri == "x-sonos-http:track1.mp3");
  assert(track.title == "First");
  assert(track.artist == "The Band");
  assert(track.album == "Live");
  assert(track.duration_ms == 206000);

  // Metadata alone replaces the descriptive fields, not the URI or duration.
  TrackChange metadata;
  metadata.title  = "Second";
  metadata.artist = "";
  metadata.album  = "";
  f.coordinator->Apply({TrackEvent("A", 12, metadata)});

  track = f.coordinator->Snapshot()->groups.at("A").playback.track;
  assert(track.uri == "x-sonos-http:track1.mp3");
  assert(track.title == "Second");
  assert(track.artist.empty());
  assert(track.duration_ms == 206000);

  // An older duration cannot overwrite a newer one.
  TrackChange stale;
  stale.duration_ms = 1000;
  const auto version = f.Version();
  f.coordinator->Apply({TrackEvent("A", 9, stale)});
  assert(f.coordinator->Snapshot()->groups.at("A").playback.track.duration_ms == 206000);
  assert(f.Version() == version);
}

void TestTransportActionsReachGroup() {
  Fixture f;
  f.Discover({"A"});
  assert(!f.coordinator->Snapshot()->groups.at("A").playback.actions.can_play);

  TransportStateChanged delta;
  delta.device_id = "A";
  delta.stamp     = At(5);
  delta.actions   = PlaybackActions{true, true, true, true, false};
  f.coordinator->Apply({delta});

  const auto actions = f.coordinator->Snapshot()->groups.at("A").playback.actions;
  assert(actions.can_play && actions.can_pause && actions.can_stop && actions.can_skip_forward);
  assert(!actions.can_skip_backward);
}

void TestVolumes() {
  Fixture f;
  f.Discover({"A", "B"});
  f.Group(1, "A", {"A", "B"});

  f.coordinator->Apply({VolumeChanged{"B", At(5), 35, false, std::nullopt}, GroupVolumeChanged{"A", At(5), 40, true}});

  auto snapshot = f.coordinator->Snapshot();
  assert(snapshot->players.at("B").volume == 35);
  assert(snapshot->players.at("B").muted == false);
  assert(!snapshot->players.at("B").fixed_volume);
  assert(snapshot->groups.at("A").volume == 40);
  assert(snapshot->groups.at("A").muted == true);
}

void TestDeltasForUnknownDevicesAreIgnored() {
  Fixture f;
  f.Discover({"A"});
  f.coordinator->Apply({VolumeChanged{"Z", At(5), 10, std::nullopt, std::nullopt}});
  assert(f.Version() == 1);
  assert(f.coordinator->Snapshot()->players.count("Z") == 0);
}

void TestCoordinatorGraceThenDissolve() {
  Fixture f;
  f.Discover({"A", "B"});
  f.Group(1, "A", {"A", "B"});

  f.coordinator->OnDeviceUnreachable("A");
  assert((f.MembersOf("A") == Ids{"A", "B"}));
  assert(!f.coordinator->Snapshot()->devices.at("A").reachable);
  assert(f.coordinator->IsReferencedByLiveGroup("A"));

  f.scheduler->Advance(seconds(9));
  assert((f.MembersOf("A") == Ids{"A", "B"}));

  f.scheduler->Advance(seconds(1));
  assert((f.MembersOf("B") == Ids{"B"}));
  assert((f.MembersOf("A") == Ids{"A"}));
  assert(!f.coordinator->IsReferencedByLiveGroup("A"));

  // Claims naming the dissolved coordinator count again only once it returns.
  f.Group(1, "A", {"B"});
  assert((f.MembersOf("B") == Ids{"B"}));
}

void TestCoordinatorReturnsWithinGrace() {
  Fixture f;
  f.Discover({"A", "B"});
  f.Group(1, "A", {"A", "B"});

  f.coordinator->OnDeviceUnreachable("A");
  f.scheduler->Advance(seconds(5));
  f.coordinator->OnDeviceReachable(MakeDevice("A"));
  assert(f.scheduler->PendingTimers() == 0);

  f.scheduler->Advance(seconds(30));
  assert((f.MembersOf("A") == Ids{"A", "B"}));
  assert(f.coordinator->Snapshot()->devices.at("A").reachable);
}

void TestDegradedFlagAndRemoval() {
  Fixture f;
  f.Discover({"A", "B"});

  f.coordinator->OnSubscriptionDegraded("B", true);
  assert(f.coordinator->Snapshot()->players.at("B").subscription_degraded);
  assert(f.Version() == 3);
  f.coordinator->OnSubscriptionDegraded("B", true);
  assert(f.Version() == 3);

  f.coordinator->OnDeviceRemoved("B");
  auto snapshot = f.coordinator->Snapshot();
  assert(snapshot->devices.count("B") == 0);
  assert(snapshot->players.count("B") == 0);
  assert(snapshot->groups.count("B") == 0);
}

void TestListenersSeeVersionsInOrder() {
  Fixture f;
  f.Discover({"A", "B"});
  f.Group(1, "A", {"A", "B"});
  assert(f.changes.empty());

  f.scheduler->RunPending();
  assert(f.changes.size() == 3);
  for (std::size_t i = 0; i < f.changes.size(); ++i) {
    assert(f.changes[i].snapshot->version == i + 1);
  }
  assert((f.changes[0].events == std::vector<ChangeEvent>{{ChangeType::kGroupAdded, "A"}, {ChangeType::kPlayerUpdated, "A"}}));

  const auto& grouped = f.changes[2].events;
  assert(grouped.front() == (ChangeEvent{ChangeType::kGroupUpdated, "A"}));
  assert(grouped[1] == (ChangeEvent{ChangeType::kGroupRemoved, "B"}));
}

void TestPersistentConflictIsRechecked() {
  Fixture f;
  f.Discover({"A", "B", "C"});

  f.coordinator->Apply({Topology("A", 10, {{"A", {"A", "B"}}}), Topology("C", 20, {{"C", {"C", "B"}}})});
  assert((f.MembersOf("C") == Ids{"C", "B"}));
  assert(f.scheduler->PendingTimers() == 1);

  f.scheduler->Advance(seconds(30));
  assert(f.scheduler->PendingTimers() == 0);
  assert((f.MembersOf("C") == Ids{"C", "B"}));

  f.coordinator->Shutdown();
}

} // namespace

int main() {
  TestDiscoveredDevicesStartAsSingletons();
  TestTopologyEventFormsGroupAndIsIdempotent();
  TestPlaybackFieldsMergeByStamp();
  TestPartialTrackEventsKeepOtherTrackFields();
  TestTransportActionsReachGroup();
  TestVolumes();
  TestDeltasForUnknownDevicesAreIgnored();
  TestCoordinatorGraceThenDissolve();
  TestCoordinatorReturnsWithinGrace();
  TestDegradedFlagAndRemoval();
  TestListenersSeeVersionsInOrder();
  TestPersistentConflictIsRechecked();

  std::cout << "household_unit_topology_coordinator: pass\n";
  return 0;
}
