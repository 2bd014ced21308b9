#include "group_resolver.hpp"

#include <algorithm>
#include <limits>

#include "internal/util/errors.hpp"

namespace household::topology {

namespace {

struct LiveClaim {
  const std::string* reporter;
  const ClaimRecord* record;

  const model::GroupClaim& group() const {
    return *record->group;
  }
  bool ByCoordinator() const {
    return *reporter == record->group->coordinator_id;
  }
};

// True when a takes precedence over b.
bool Supersedes(const LiveClaim& a, const LiveClaim& b) {
  if (b.record->stamp < a.record->stamp) return true;
  if (a.record->stamp < b.record->stamp) return false;
  if (a.ByCoordinator() != b.ByCoordinator()) return a.ByCoordinator();
  return *a.reporter < *b.reporter;
}

std::size_t RankIn(const model::GroupClaim& claim, const std::string& id) {
  for (std::size_t i = 0; i < claim.members.size(); ++i) {
    if (claim.members[i].id == id) return i;
  }
  return std::numeric_limits<std::size_t>::max();
}

} // namespace

Resolution GroupResolver::Resolve(const std::set<std::string>& devices, const std::map<std::string, ClaimRecord>& claims,
                                  const std::set<std::string>& excluded_coordinators) {
  std::vector<LiveClaim> live;
  live.reserve(claims.size());

  for (const auto& [reporter, record] : claims) {
    if (!record.group || devices.count(reporter) == 0) continue;

    const auto& coordinator = record.group->coordinator_id;
    if (coordinator.empty() || devices.count(coordinator) == 0 || excluded_coordinators.count(coordinator) != 0) continue;

    if (reporter != coordinator) {
      auto own = claims.find(coordinator);
      if (own != claims.end() && record.stamp < own->second.stamp) continue;
    }
    live.push_back(LiveClaim{&reporter, &record});
  }

  std::map<std::string, const LiveClaim*>      chosen;
  std::map<std::string, std::set<std::string>> named_coordinators;

  for (const auto& claim : live) {
    const auto& coordinator = claim.group().coordinator_id;

    auto consider = [&](const std::string& id) {
      if (devices.count(id) == 0) return;
      named_coordinators[id].insert(coordinator);
      auto& slot = chosen[id];
      if (slot == nullptr || Supersedes(claim, *slot)) slot = &claim;
    };

    consider(coordinator);
    for (const auto& member : claim.group().members) {
      if (member.id != coordinator) consider(member.id);
    }
  }

  auto coordinator_of = [&](const std::string& id) -> const std::string& {
    auto it = chosen.find(id);
    return it == chosen.end() ? id : it->second->group().coordinator_id;
  };

  Resolution result;
  for (const auto& id : devices) {
    const auto& named  = coordinator_of(id);
    const auto& leader = (named == id || coordinator_of(named) == named) ? named : id;

    auto& group          = result.groups[leader];
    group.coordinator_id = leader;
    if (id != leader) group.member_ids.push_back(id);
  }

  for (auto& [coordinator, group] : result.groups) {
    auto own = chosen.find(coordinator);
    if (own != chosen.end()) {
      const auto& claim = own->second->group();
      std::stable_sort(group.member_ids.begin(), group.member_ids.end(),
                       [&](const std::string& a, const std::string& b) { return RankIn(claim, a) < RankIn(claim, b); });
    }
    group.member_ids.insert(group.member_ids.begin(), coordinator);
  }

  for (const auto& [id, coordinators] : named_coordinators) {
    if (coordinators.size() > 1) result.conflicted.insert(id);
  }
  return result;
}

void GroupResolver::Validate(const model::TopologySnapshot& snapshot) {
  std::map<std::string, std::string> owner;

  for (const auto& [id, group] : snapshot.groups) {
    if (group.member_ids.empty()) {
      throw util::TopologyInconsistency("group " + id + " has no members");
    }
    if (group.coordinator_id != id || group.member_ids.front() != id) {
      throw util::TopologyInconsistency("group " + id + " does not lead with its coordinator");
    }
    for (const auto& member : group.member_ids) {
      if (snapshot.devices.count(member) == 0) {
        throw util::TopologyInconsistency("group " + id + " references unknown device " + member);
      }
      auto [it, inserted] = owner.emplace(member, id);
      if (!inserted) {
        throw util::TopologyInconsistency("device " + member + " is in groups " + it->second + " and " + id);
      }
    }
  }

  for (const auto& [id, device] : snapshot.devices) {
    if (owner.count(id) == 0) {
      throw util::TopologyInconsistency("device " + id + " is in no group");
    }
  }
}

} // namespace household::topology
