#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/model/event_delta.hpp"
#include "internal/model/snapshot.hpp"

namespace household::topology {

/*
  A reporter's newest topology payload. group is the group that payload
  places the reporter in; nullopt when the payload does not mention it.
*/
struct ClaimRecord {
  model::EventStamp               stamp;
  std::optional<model::GroupClaim> group;
};

struct ResolvedGroup {
  std::string              coordinator_id;
  std::vector<std::string> member_ids;

  bool operator==(const ResolvedGroup&) const = default;
};

struct Resolution {
  // Keyed by coordinator id.
  std::map<std::string, ResolvedGroup> groups;
  // Devices named with different coordinators by live claims.
  std::set<std::string> conflicted;
};

/*
  Derives groups from per-device claims.

  Claims are ordered by EventStamp, newest wins; on an exact tie the
  coordinator's own claim wins. A claim by a member for coordinator C is
  stale when C's own claim is newer. Each device joins the group of the
  newest live claim that mentions it; a coordinator whose own newest claim
  puts it elsewhere leads nothing, and devices left without a live claim
  become singleton groups. Claims naming an excluded or unknown coordinator
  are ignored.
*/
class GroupResolver {
 public:
  static Resolution Resolve(const std::set<std::string>& devices, const std::map<std::string, ClaimRecord>& claims,
                            const std::set<std::string>& excluded_coordinators);

  // Throws util::TopologyInconsistency unless every device of the snapshot
  // is in exactly one group and every group leads with its coordinator.
  static void Validate(const model::TopologySnapshot& snapshot);
};

} // namespace household::topology
