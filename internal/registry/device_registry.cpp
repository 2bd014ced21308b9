#include "device_registry.hpp"

namespace household::registry {

DeviceRegistry::DeviceRegistry() : devices_(std::make_shared<const DeviceMap>()) {
}

std::shared_ptr<const DeviceRegistry::DeviceMap> DeviceRegistry::Load() const {
  std::lock_guard lock(read_mutex_);
  return devices_;
}

void DeviceRegistry::Publish(std::shared_ptr<const DeviceMap> next) {
  std::lock_guard lock(read_mutex_);
  devices_ = std::move(next);
}

UpsertResult DeviceRegistry::Upsert(const model::Device& device, util::TimePoint now) {
  std::lock_guard lock(write_mutex_);

  auto next = std::make_shared<DeviceMap>(*Load());

  UpsertResult result;
  auto         it = next->find(device.id);
  if (it == next->end()) {
    result.is_new = true;
  } else {
    result.became_reachable = !it->second.reachable;
    result.location_changed = !it->second.SameLocation(device);
    result.rebooted         = device.boot_seq != 0 && it->second.boot_seq != 0 && device.boot_seq > it->second.boot_seq;
  }

  model::Device stored = device;
  stored.reachable     = true;
  stored.last_seen     = now;
  if (!result.is_new) {
    const auto& previous = it->second;
    if (stored.household_id.empty()) stored.household_id = previous.household_id;
    if (stored.model.empty()) stored.model = previous.model;
    if (stored.location.empty()) stored.location = previous.location;
    if (stored.boot_seq == 0) stored.boot_seq = previous.boot_seq;
  }
  (*next)[device.id] = std::move(stored);

  Publish(std::move(next));
  return result;
}

bool DeviceRegistry::MarkUnreachable(const std::string& id) {
  std::lock_guard lock(write_mutex_);

  auto current = Load();
  auto it      = current->find(id);
  if (it == current->end() || !it->second.reachable) return false;

  auto next             = std::make_shared<DeviceMap>(*current);
  (*next)[id].reachable = false;
  Publish(std::move(next));
  return true;
}

bool DeviceRegistry::Remove(const std::string& id) {
  std::lock_guard lock(write_mutex_);

  auto current = Load();
  if (current->find(id) == current->end()) return false;
  if (reference_checker_ && reference_checker_(id)) return false;

  auto next = std::make_shared<DeviceMap>(*current);
  next->erase(id);
  Publish(std::move(next));
  return true;
}

std::vector<model::Device> DeviceRegistry::List() const {
  auto                       current = Load();
  std::vector<model::Device> out;
  out.reserve(current->size());
  for (const auto& [id, device] : *current) {
    out.push_back(device);
  }
  return out;
}

std::optional<model::Device> DeviceRegistry::Get(const std::string& id) const {
  auto current = Load();
  auto it      = current->find(id);
  if (it == current->end()) return std::nullopt;
  return it->second;
}

std::size_t DeviceRegistry::Size() const {
  return Load()->size();
}

void DeviceRegistry::SetReferenceChecker(ReferenceChecker checker) {
  std::lock_guard lock(write_mutex_);
  reference_checker_ = std::move(checker);
}

} // namespace household::registry
