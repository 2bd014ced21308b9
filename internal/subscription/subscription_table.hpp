#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <unordered_map>

#include "internal/model/event_category.hpp"

namespace household::subscription {

struct SubscriptionKey {
  std::string          device_id;
  model::EventCategory category{model::EventCategory::kZoneGroupTopology};

  bool operator==(const SubscriptionKey&) const = default;
  bool operator<(const SubscriptionKey& other) const {
    return std::tie(device_id, category) < std::tie(other.device_id, other.category);
  }
};

/*
  Maps subscription ids back to (device, category).

  Superseded ids stay resolvable until the device is removed so a final
  notification sent under an old id is still applied. Only the newest
  kRetainedPerKey ids are kept per key.
*/
class SubscriptionTable {
 public:
  static constexpr std::size_t kRetainedPerKey = 4;

  void Insert(const std::string& sid, const SubscriptionKey& key);

  std::optional<SubscriptionKey> Resolve(const std::string& sid) const;

  void RemoveDevice(const std::string& device_id);

  void Clear();

  std::size_t Size() const;

 private:
  mutable std::mutex mutex_;

  std::unordered_map<std::string, SubscriptionKey>   by_sid_;
  std::map<SubscriptionKey, std::deque<std::string>> by_key_;
};

} // namespace household::subscription
