#include "internal/topology/group_resolver.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using household::model::ClaimedMember;
using household::model::EventStamp;
using household::model::GroupClaim;
using household::topology::ClaimRecord;
using household::topology::GroupResolver;
using household::topology::ResolvedGroup;

using Claims = std::map<std::string, ClaimRecord>;
using Ids    = std::vector<std::string>;

EventStamp At(int seconds, std::uint64_t sequence = 0) {
  return EventStamp{household::util::TimePoint{} + std::chrono::seconds(seconds), sequence};
}

ClaimRecord Claim(int seconds, const std::string& coordinator, const Ids& members) {
  GroupClaim group;
  group.group_id       = coordinator + ":1";
  group.coordinator_id = coordinator;
  for (const auto& id : members) group.members.push_back(ClaimedMember{id, ""});
  return ClaimRecord{At(seconds), group};
}

const std::set<std::string> kDevices = {"A", "B", "C"};

void TestNoClaimsGivesSingletons() {
  auto result = GroupResolver::Resolve(kDevices, {}, {});
  assert(result.groups.size() == 3);
  assert((result.groups.at("B") == ResolvedGroup{"B", {"B"}}));
  assert(result.conflicted.empty());
}

void TestAgreeingClaimsFormOneGroup() {
  Claims claims;
  claims["A"] = Claim(10, "A", {"A", "C", "B"});
  claims["B"] = Claim(10, "A", {"A", "C", "B"});

  auto result = GroupResolver::Resolve(kDevices, claims, {});
  assert(result.groups.size() == 1);
  // Member order follows the coordinator's own claim.
  assert((result.groups.at("A").member_ids == Ids{"A", "C", "B"}));
  assert(result.conflicted.empty());
}

void TestMemberClaimOlderThanCoordinatorIsStale() {
  Claims claims;
  claims["A"] = Claim(20, "A", {"A"});
  claims["B"] = Claim(10, "A", {"A", "B"});

  auto result = GroupResolver::Resolve(kDevices, claims, {});
  assert((result.groups.at("A").member_ids == Ids{"A"}));
  assert((result.groups.at("B").member_ids == Ids{"B"}));
  assert(result.conflicted.empty());
}

void TestNewestClaimWins() {
  Claims claims;
  claims["A"] = Claim(10, "A", {"A", "B"});
  claims["C"] = Claim(20, "C", {"C", "B"});

  auto result = GroupResolver::Resolve(kDevices, claims, {});
  assert((result.groups.at("C").member_ids == Ids{"C", "B"}));
  assert((result.groups.at("A").member_ids == Ids{"A"}));
  assert(result.conflicted.count("B") == 1);
}

void TestTieGoesToCoordinatorsOwnClaim() {
  Claims claims;
  claims["A"] = Claim(10, "A", {"A", "C"});
  // B reports that C leads B and C at the same instant; C's own claim says otherwise.
  claims["B"] = Claim(10, "C", {"C", "B"});
  claims["C"] = Claim(10, "A", {"A", "C"});

  auto result = GroupResolver::Resolve(kDevices, claims, {});
  assert((result.groups.at("A").member_ids == Ids{"A", "C"}));
  assert((result.groups.at("B").member_ids == Ids{"B"}));
}

void TestCoordinatorThatJoinedElsewhereLeadsNothing() {
  Claims claims;
  claims["B"] = Claim(10, "B", {"B", "C"});
  claims["A"] = Claim(20, "A", {"A", "B"});

  auto result = GroupResolver::Resolve(kDevices, claims, {});
  assert((result.groups.at("A").member_ids == Ids{"A", "B"}));
  assert(result.groups.count("B") == 0);
  assert((result.groups.at("C").member_ids == Ids{"C"}));
}

void TestExcludedAndUnknownCoordinatorsAreIgnored() {
  Claims claims;
  claims["A"] = Claim(10, "A", {"A", "B"});
  claims["C"] = Claim(10, "Z", {"Z", "C"});

  auto result = GroupResolver::Resolve(kDevices, claims, {"A"});
  assert(result.groups.size() == 3);
  assert((result.groups.at("C").member_ids == Ids{"C"}));
}

void TestClaimsWithoutGroupDoNotCount() {
  Claims claims;
  claims["A"] = ClaimRecord{At(10), std::nullopt};

  auto result = GroupResolver::Resolve(kDevices, claims, {});
  assert(result.groups.size() == 3);
}

void TestValidate() {
  household::model::TopologySnapshot snapshot;
  snapshot.devices["A"].id = "A";
  snapshot.devices["B"].id = "B";

  household::model::Group group;
  group.id             = "A";
  group.coordinator_id = "A";
  group.member_ids     = {"A", "B"};
  snapshot.groups["A"] = group;
  GroupResolver::Validate(snapshot);

  auto expect_throw = [](const household::model::TopologySnapshot& bad) {
    bool threw = false;
    try {
      GroupResolver::Validate(bad);
    } catch (const household::util::TopologyInconsistency&) {
      threw = true;
    }
    assert(threw);
  };

  auto duplicate           = group;
  duplicate.id             = "B";
  duplicate.coordinator_id = "B";
  duplicate.member_ids     = {"B"};
  auto twice               = snapshot;
  twice.groups["B"]        = duplicate;
  expect_throw(twice);

  auto orphan = snapshot;
  orphan.devices["C"].id = "C";
  expect_throw(orphan);

  auto misordered = snapshot;
  misordered.groups["A"].member_ids = {"B", "A"};
  expect_throw(misordered);

  auto dangling = snapshot;
  dangling.groups["A"].member_ids = {"A", "B", "Z"};
  expect_throw(dangling);
}

} // namespace

int main() {
  TestNoClaimsGivesSingletons();
  TestAgreeingClaimsFormOneGroup();
  TestMemberClaimOlderThanCoordinatorIsStale();
  TestNewestClaimWins();
  TestTieGoesToCoordinatorsOwnClaim();
  TestCoordinatorThatJoinedElsewhereLeadsNothing();
  TestExcludedAndUnknownCoordinatorsAreIgnored();
  TestClaimsWithoutGroupDoNotCount();
  TestValidate();

  std::cout << "household_unit_group_resolver: pass\n";
  return 0;
}
