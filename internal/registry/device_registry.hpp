#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/device.hpp"

namespace household::registry {

struct UpsertResult {
  bool is_new{false};
  bool became_reachable{false};
  bool location_changed{false};
  bool rebooted{false};

  // Subscriptions and topology must be (re)established.
  bool NeedsAttention() const {
    return is_new || became_reachable || location_changed || rebooted;
  }
};

/*
  Owns Device records.

  Writers serialize on write_mutex_, copy the current map, modify the copy
  and publish it; readers grab the published map and never see a
  half-written record.
*/
class DeviceRegistry {
 public:
  using DeviceMap        = std::map<std::string, model::Device>;
  using ReferenceChecker = std::function<bool(const std::string& device_id)>;

  DeviceRegistry();

  UpsertResult Upsert(const model::Device& device, util::TimePoint now);

  // Returns true when the device flipped from reachable to unreachable.
  bool MarkUnreachable(const std::string& id);

  // Returns false when the device is unknown or still referenced by a live group.
  bool Remove(const std::string& id);

  std::vector<model::Device>   List() const;
  std::optional<model::Device> Get(const std::string& id) const;
  std::size_t                  Size() const;

  // Consulted by Remove(); set by the composition root.
  void SetReferenceChecker(ReferenceChecker checker);

 private:
  std::shared_ptr<const DeviceMap> Load() const;
  void                             Publish(std::shared_ptr<const DeviceMap> next);

  mutable std::mutex               read_mutex_;
  std::shared_ptr<const DeviceMap> devices_;

  std::mutex       write_mutex_;
  ReferenceChecker reference_checker_;
};

} // namespace household::registry
