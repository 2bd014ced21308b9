#include "subscription_table.hpp"

#include <algorithm>

namespace household::subscription {

void SubscriptionTable::Insert(const std::string& sid, const SubscriptionKey& key) {
  std::lock_guard lock(mutex_);

  if (auto existing = by_sid_.find(sid); existing != by_sid_.end()) {
    if (existing->second == key) return;

    auto old_key = by_key_.find(existing->second);
    if (old_key != by_key_.end()) {
      auto& sids = old_key->second;
      sids.erase(std::remove(sids.begin(), sids.end(), sid), sids.end());
      if (sids.empty()) by_key_.erase(old_key);
    }
  }

  by_sid_[sid] = key;
  auto& sids   = by_key_[key];
  sids.push_back(sid);

  while (sids.size() > kRetainedPerKey) {
    by_sid_.erase(sids.front());
    sids.pop_front();
  }
}

std::optional<SubscriptionKey> SubscriptionTable::Resolve(const std::string& sid) const {
  std::lock_guard lock(mutex_);

  auto it = by_sid_.find(sid);
  if (it == by_sid_.end()) return std::nullopt;
  return it->second;
}

void SubscriptionTable::RemoveDevice(const std::string& device_id) {
  std::lock_guard lock(mutex_);

  for (auto it = by_key_.begin(); it != by_key_.end();) {
    if (it->first.device_id != device_id) {
      ++it;
      continue;
    }

    for (const auto& sid : it->second) {
      by_sid_.erase(sid);
    }
    it = by_key_.erase(it);
  }
}

void SubscriptionTable::Clear() {
  std::lock_guard lock(mutex_);
  by_sid_.clear();
  by_key_.clear();
}

std::size_t SubscriptionTable::Size() const {
  std::lock_guard lock(mutex_);
  return by_sid_.size();
}

} // namespace household::subscription
