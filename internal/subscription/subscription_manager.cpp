#include "subscription_manager.hpp"

#include <algorithm>
#include <exception>
#include <tuple>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace household::subscription {

using model::SubscriptionState;
using observability::IntField;
using observability::StringField;

namespace {

std::string_view CategoryOf(const SubscriptionKey& key) {
  return model::CategoryName(key.category);
}

} // namespace

// ------------------------------------------------------------
// Options
// ------------------------------------------------------------

SubscriptionOptions SubscriptionOptions::FromConfig(const household::runtime::config::SubscriptionConfig& config,
                                                    std::string callback_url) {
  SubscriptionOptions options;
  options.requested_timeout = util::FromProto(config.requested_timeout());
  options.renewal_margin    = util::FromProto(config.renewal_margin());
  options.max_attempts      = config.max_attempts();
  options.initial_backoff   = util::FromProto(config.initial_backoff());
  options.max_backoff       = util::FromProto(config.max_backoff());
  options.callback_url      = std::move(callback_url);

  if (config.categories_size() > 0) {
    options.categories.clear();
    for (const auto& name : config.categories()) {
      auto category = model::ParseCategory(name);
      if (!category) {
        throw util::InvalidConfig("unknown event category: " + name);
      }
      options.categories.push_back(*category);
    }
  }
  return options;
}

util::Millis SubscriptionOptions::BackoffFor(std::uint32_t attempt) const {
  auto delay = initial_backoff;
  for (std::uint32_t i = 1; i < attempt && delay < max_backoff; ++i) {
    delay *= 2;
  }
  return std::min(delay, max_backoff);
}

util::Millis SubscriptionOptions::RenewalLead(util::Millis granted) const {
  // Devices occasionally grant less than the margin; renew at the midpoint.
  if (granted <= renewal_margin) return granted / 2;
  return std::max(renewal_margin, granted / 2);
}

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------

SubscriptionManager::SubscriptionManager(SubscriptionOptions options, std::shared_ptr<EventingTransport> transport,
                                         std::shared_ptr<runtime::Scheduler> scheduler)
    : options_(std::move(options)), transport_(std::move(transport)), scheduler_(std::move(scheduler)) {
}

void SubscriptionManager::SetDegradedCallback(DegradedCallback callback) {
  std::lock_guard lock(mutex_);
  degraded_callback_ = std::move(callback);
}

// ------------------------------------------------------------
// Discovery inputs
// ------------------------------------------------------------

void SubscriptionManager::OnDeviceReachable(const model::Device& device) {
  Notices notices;
  {
    std::lock_guard lock(mutex_);
    if (shut_down_) return;

    for (auto category : options_.categories) {
      SubscriptionKey key{device.id, category};
      auto [it, inserted] = entries_.try_emplace(key);
      auto& entry         = it->second;
      if (inserted) entry.key = key;

      const bool moved = !inserted && (!entry.device.SameLocation(device) || entry.device.boot_seq != device.boot_seq);
      entry.device     = device;

      if (entry.degraded) {
        entry.attempts = 0;
        SetDegraded(entry, false, notices);
      }

      switch (entry.state) {
        case SubscriptionState::kSubscribing:
          if (entry.in_flight) break;
          CancelTimers(entry);
          Dispatch(entry, Operation::kSubscribe);
          break;
        case SubscriptionState::kActive:
        case SubscriptionState::kRenewing:
          if (!moved) break;
          HOUSEHOLD_LOG_INFO("Device moved or rebooted; resubscribing", {StringField("device", device.id), StringField("category", CategoryOf(key))});
          Begin(entry);
          break;
        case SubscriptionState::kUnsubscribed:
        case SubscriptionState::kExpired:
          Begin(entry);
          break;
      }
    }
  }
  Notify(notices);
}

void SubscriptionManager::OnDeviceUnreachable(const std::string& device_id) {
  std::lock_guard lock(mutex_);

  for (auto& [key, entry] : entries_) {
    if (key.device_id != device_id) continue;

    CancelTimers(entry);
    ++entry.generation;
    entry.attempts = 0;
    if (entry.state != SubscriptionState::kUnsubscribed) {
      Transition(entry, SubscriptionState::kUnsubscribed);
    }
  }
}

void SubscriptionManager::OnDeviceRemoved(const std::string& device_id) {
  {
    std::lock_guard lock(mutex_);

    for (auto it = entries_.begin(); it != entries_.end();) {
      if (it->first.device_id != device_id) {
        ++it;
        continue;
      }
      CancelTimers(it->second);
      it = entries_.erase(it);
    }
  }
  table_.RemoveDevice(device_id);
  HOUSEHOLD_LOG_DEBUG("Subscriptions dropped for removed device", {StringField("device", device_id)});
}

std::optional<SubscriptionKey> SubscriptionManager::Resolve(const std::string& sid) const {
  return table_.Resolve(sid);
}

// ------------------------------------------------------------
// State machine
// ------------------------------------------------------------

void SubscriptionManager::Transition(Entry& entry, SubscriptionState to) {
  if (!model::CanTransition(entry.state, to)) {
    throw util::InvalidState("subscription " + entry.key.device_id + "/" + std::string(CategoryOf(entry.key)) + ": " +
                             std::string(model::StateName(entry.state)) + " -> " + std::string(model::StateName(to)));
  }
  entry.state = to;
}

void SubscriptionManager::CancelTimers(Entry& entry) {
  for (auto* timer : {&entry.renew_timer, &entry.expiry_timer, &entry.retry_timer}) {
    if (*timer != runtime::Scheduler::kNoTask) {
      scheduler_->Cancel(*timer);
      *timer = runtime::Scheduler::kNoTask;
    }
  }
}

void SubscriptionManager::Begin(Entry& entry) {
  CancelTimers(entry);
  if (entry.state != SubscriptionState::kUnsubscribed && entry.state != SubscriptionState::kSubscribing) {
    Transition(entry, SubscriptionState::kUnsubscribed);
  }
  Transition(entry, SubscriptionState::kSubscribing);
  ++entry.generation;

  // An outstanding request from an earlier generation redispatches on completion.
  if (!entry.in_flight) {
    Dispatch(entry, Operation::kSubscribe);
  }
}

void SubscriptionManager::Dispatch(Entry& entry, Operation op) {
  entry.in_flight = true;
  scheduler_->Post([this, key = entry.key, generation = entry.generation, op, device = entry.device, sid = entry.sid] {
    Execute(key, generation, op, device, sid);
  });
}

void SubscriptionManager::ScheduleTimers(Entry& entry, util::Millis granted) {
  CancelTimers(entry);

  const auto lead       = options_.RenewalLead(granted);
  const auto generation = entry.generation;
  entry.renew_timer     = scheduler_->ScheduleAfter(granted - lead, [this, key = entry.key, generation] { OnRenewDue(key, generation); });
  entry.expiry_timer    = scheduler_->ScheduleAfter(granted, [this, key = entry.key, generation] { OnExpiryDue(key, generation); });
}

void SubscriptionManager::SetDegraded(Entry& entry, bool degraded, Notices& notices) {
  if (entry.degraded == degraded) return;

  const bool before = DeviceDegraded(entry.key.device_id);
  entry.degraded    = degraded;
  const bool after  = DeviceDegraded(entry.key.device_id);
  if (before != after) {
    notices.push_back(DegradedChange{entry.key.device_id, after});
  }
}

bool SubscriptionManager::DeviceDegraded(const std::string& device_id) const {
  for (const auto& [key, entry] : entries_) {
    if (key.device_id == device_id && entry.degraded) return true;
  }
  return false;
}

// ------------------------------------------------------------
// Requests and completions
// ------------------------------------------------------------

void SubscriptionManager::Execute(SubscriptionKey key, std::uint64_t generation, Operation op, model::Device device, std::string sid) {
  SubscriptionGrant grant;
  try {
    if (op == Operation::kSubscribe) {
      grant = transport_->Subscribe(device, key.category, options_.callback_url, options_.requested_timeout);
    } else {
      grant = transport_->Renew(device, key.category, sid, options_.requested_timeout);
    }
  } catch (const std::exception& e) {
    OnFailed(key, generation, op, e.what());
    return;
  }
  OnGranted(key, generation, op, device, grant);
}

void SubscriptionManager::OnGranted(const SubscriptionKey& key, std::uint64_t generation, Operation op, const model::Device& device,
                                    const SubscriptionGrant& grant) {
  Notices notices;
  bool    orphan = false;
  {
    std::lock_guard lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
      orphan = true;
    } else if (it->second.generation != generation) {
      auto& entry     = it->second;
      entry.in_flight = false;
      orphan          = true;
      if (entry.state == SubscriptionState::kSubscribing && entry.retry_timer == runtime::Scheduler::kNoTask) {
        Dispatch(entry, Operation::kSubscribe);
      }
    } else {
      auto&      entry   = it->second;
      const auto granted = grant.timeout.count() > 0 ? grant.timeout : options_.requested_timeout;

      entry.in_flight  = false;
      entry.sid        = grant.sid.empty() ? entry.sid : grant.sid;
      entry.expires_at = scheduler_->Now() + granted;
      entry.attempts   = 0;
      Transition(entry, SubscriptionState::kActive);
      table_.Insert(entry.sid, key);
      SetDegraded(entry, false, notices);
      ScheduleTimers(entry, granted);

      HOUSEHOLD_LOG_DEBUG(op == Operation::kSubscribe ? "Subscription active" : "Subscription renewed",
                          {StringField("device", key.device_id), StringField("category", CategoryOf(key)), StringField("sid", entry.sid),
                           IntField("timeout_ms", granted.count())});
    }
  }

  if (orphan) {
    ReleaseOrphan(device, key.category, grant.sid);
  }
  Notify(notices);
}

void SubscriptionManager::OnFailed(const SubscriptionKey& key, std::uint64_t generation, Operation op, const std::string& error) {
  Notices notices;
  {
    std::lock_guard lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) return;

    auto& entry     = it->second;
    entry.in_flight = false;

    if (entry.generation != generation) {
      if (entry.state == SubscriptionState::kSubscribing && entry.retry_timer == runtime::Scheduler::kNoTask) {
        Dispatch(entry, Operation::kSubscribe);
      }
      return;
    }

    ++subscribe_failures_;

    if (op == Operation::kRenew) {
      HOUSEHOLD_LOG_WARN("Renewal failed; resubscribing",
                         {StringField("device", key.device_id), StringField("category", CategoryOf(key)), StringField("error", error)});
      Transition(entry, SubscriptionState::kExpired);
      Begin(entry);
    } else {
      ++entry.attempts;
      const auto delay = options_.BackoffFor(entry.attempts);

      if (entry.attempts >= options_.max_attempts && !entry.degraded) {
        HOUSEHOLD_LOG_WARN("Subscription degraded", {StringField("device", key.device_id), StringField("category", CategoryOf(key)),
                                                     IntField("attempts", entry.attempts), StringField("error", error)});
        SetDegraded(entry, true, notices);
      } else {
        HOUSEHOLD_LOG_WARN("Subscribe failed", {StringField("device", key.device_id), StringField("category", CategoryOf(key)),
                                                IntField("attempt", entry.attempts), IntField("retry_ms", delay.count()),
                                                StringField("error", error)});
      }

      entry.retry_timer = scheduler_->ScheduleAfter(delay, [this, key, generation] { OnRetryDue(key, generation); });
    }
  }
  Notify(notices);
}

void SubscriptionManager::OnRetryDue(const SubscriptionKey& key, std::uint64_t generation) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(key);
  if (it == entries_.end() || it->second.generation != generation) return;

  auto& entry       = it->second;
  entry.retry_timer = runtime::Scheduler::kNoTask;
  if (entry.state != SubscriptionState::kSubscribing || entry.in_flight) return;
  Dispatch(entry, Operation::kSubscribe);
}

void SubscriptionManager::OnRenewDue(const SubscriptionKey& key, std::uint64_t generation) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(key);
  if (it == entries_.end() || it->second.generation != generation) return;

  auto& entry       = it->second;
  entry.renew_timer = runtime::Scheduler::kNoTask;
  if (entry.state != SubscriptionState::kActive || entry.in_flight) return;

  Transition(entry, SubscriptionState::kRenewing);
  Dispatch(entry, Operation::kRenew);
}

void SubscriptionManager::OnExpiryDue(const SubscriptionKey& key, std::uint64_t generation) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(key);
  if (it == entries_.end() || it->second.generation != generation) return;

  auto& entry        = it->second;
  entry.expiry_timer = runtime::Scheduler::kNoTask;
  if (!model::HoldsSubscription(entry.state)) return;

  HOUSEHOLD_LOG_WARN("Subscription expired before renewal completed", {StringField("device", key.device_id), StringField("category", CategoryOf(key))});
  Transition(entry, SubscriptionState::kExpired);
  Begin(entry);
}

void SubscriptionManager::ReleaseOrphan(const model::Device& device, model::EventCategory category, const std::string& sid) {
  if (sid.empty()) return;

  try {
    transport_->Unsubscribe(device, category, sid);
    HOUSEHOLD_LOG_DEBUG("Released stale subscription", {StringField("device", device.id), StringField("sid", sid)});
  } catch (const std::exception& e) {
    HOUSEHOLD_LOG_DEBUG("Stale subscription release failed", {StringField("device", device.id), StringField("sid", sid), StringField("error", e.what())});
  }
}

void SubscriptionManager::Notify(const Notices& notices) {
  if (notices.empty()) return;

  DegradedCallback callback;
  {
    std::lock_guard lock(mutex_);
    callback = degraded_callback_;
  }
  if (!callback) return;

  for (const auto& notice : notices) {
    callback(notice.device_id, notice.degraded);
  }
}

// ------------------------------------------------------------
// Teardown and inspection
// ------------------------------------------------------------

void SubscriptionManager::Shutdown() {
  std::vector<std::tuple<model::Device, model::EventCategory, std::string>> held;
  {
    std::lock_guard lock(mutex_);
    if (shut_down_) return;
    shut_down_ = true;

    for (auto& [key, entry] : entries_) {
      CancelTimers(entry);
      if (model::HoldsSubscription(entry.state) && !entry.sid.empty()) {
        held.emplace_back(entry.device, key.category, entry.sid);
      }
    }
    entries_.clear();
  }
  table_.Clear();

  std::size_t failures = 0;
  for (const auto& [device, category, sid] : held) {
    try {
      transport_->Unsubscribe(device, category, sid);
    } catch (const std::exception& e) {
      ++failures;
      HOUSEHOLD_LOG_WARN("Unsubscribe failed during shutdown", {StringField("device", device.id), StringField("category", model::CategoryName(category)),
                                                                StringField("error", e.what())});
    }
  }

  HOUSEHOLD_LOG_INFO("Subscriptions shut down", {IntField("released", static_cast<std::int64_t>(held.size() - failures)),
                                                 IntField("failed", static_cast<std::int64_t>(failures))});
}

SubscriptionInfo SubscriptionManager::Describe(const Entry& entry) {
  SubscriptionInfo info;
  info.device_id  = entry.key.device_id;
  info.category   = entry.key.category;
  info.state      = entry.state;
  info.sid        = entry.sid;
  info.expires_at = entry.expires_at;
  info.in_flight  = entry.in_flight;
  info.attempts   = entry.attempts;
  info.degraded   = entry.degraded;
  return info;
}

std::optional<SubscriptionInfo> SubscriptionManager::Get(const std::string& device_id, model::EventCategory category) const {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(SubscriptionKey{device_id, category});
  if (it == entries_.end()) return std::nullopt;
  return Describe(it->second);
}

std::vector<SubscriptionInfo> SubscriptionManager::List() const {
  std::lock_guard               lock(mutex_);
  std::vector<SubscriptionInfo> out;
  out.reserve(entries_.size());
  for (const auto& [key, entry] : entries_) {
    out.push_back(Describe(entry));
  }
  return out;
}

std::uint64_t SubscriptionManager::DegradedCount() const {
  std::lock_guard lock(mutex_);
  return static_cast<std::uint64_t>(std::count_if(entries_.begin(), entries_.end(), [](const auto& item) { return item.second.degraded; }));
}

} // namespace household::subscription
