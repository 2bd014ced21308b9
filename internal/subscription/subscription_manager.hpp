#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "eventing_transport.hpp"
#include "internal/discovery/discovery_scanner.hpp"
#include "internal/model/subscription_state.hpp"
#include "internal/runtime/scheduler.hpp"
#include "subscription_table.hpp"

namespace household::runtime::config {
class SubscriptionConfig;
}

namespace household::subscription {

struct SubscriptionOptions {
  util::Millis                      requested_timeout{1800000};
  util::Millis                      renewal_margin{60000};
  std::uint32_t                     max_attempts{3};
  util::Millis                      initial_backoff{1000};
  util::Millis                      max_backoff{60000};
  std::vector<model::EventCategory> categories{model::kAllCategories.begin(), model::kAllCategories.end()};
  std::string                       callback_url;

  static SubscriptionOptions FromConfig(const household::runtime::config::SubscriptionConfig& config, std::string callback_url);

  // min(initial * 2^(attempt-1), max)
  util::Millis BackoffFor(std::uint32_t attempt) const;

  // How long before expiry a granted subscription is renewed.
  util::Millis RenewalLead(util::Millis granted) const;
};

struct SubscriptionInfo {
  std::string              device_id;
  model::EventCategory     category{model::EventCategory::kZoneGroupTopology};
  model::SubscriptionState state{model::SubscriptionState::kUnsubscribed};
  std::string              sid;
  util::TimePoint          expires_at{};
  bool                     in_flight{false};
  std::uint32_t            attempts{0};
  bool                     degraded{false};
};

/*
  Owns one subscription per (device, category).

  All state lives under mutex_; network calls run on scheduler tasks outside
  the lock. Each entry carries a generation that is bumped whenever the
  entry is reset, so a completion or timer from an earlier generation is
  ignored. At most one request per entry is in flight: a reset while a
  request is outstanding waits for that request to complete before the next
  one is sent.
*/
class SubscriptionManager : public discovery::DiscoveryListener {
 public:
  using DegradedCallback = std::function<void(const std::string& device_id, bool degraded)>;

  SubscriptionManager(SubscriptionOptions options, std::shared_ptr<EventingTransport> transport,
                      std::shared_ptr<runtime::Scheduler> scheduler);

  SubscriptionManager(const SubscriptionManager&)            = delete;
  SubscriptionManager& operator=(const SubscriptionManager&) = delete;

  // Invoked outside the manager's lock when a device's aggregate degraded
  // flag flips.
  void SetDegradedCallback(DegradedCallback callback);

  void OnDeviceReachable(const model::Device& device) override;
  void OnDeviceUnreachable(const std::string& device_id) override;
  void OnDeviceRemoved(const std::string& device_id) override;

  std::optional<SubscriptionKey> Resolve(const std::string& sid) const;

  // Cancels every timer and unsubscribes ACTIVE / RENEWING entries. Blocks
  // on the transport; individual failures are logged and skipped.
  void Shutdown();

  std::optional<SubscriptionInfo> Get(const std::string& device_id, model::EventCategory category) const;
  std::vector<SubscriptionInfo>   List() const;

  std::uint64_t SubscribeFailures() const {
    return subscribe_failures_;
  }
  std::uint64_t DegradedCount() const;

 private:
  enum class Operation {
    kSubscribe,
    kRenew,
  };

  struct Entry {
    SubscriptionKey          key;
    model::Device            device;
    model::SubscriptionState state{model::SubscriptionState::kUnsubscribed};
    std::string              sid;
    util::TimePoint          expires_at{};
    bool                     in_flight{false};
    std::uint32_t            attempts{0};
    bool                     degraded{false};
    std::uint64_t            generation{0};

    runtime::Scheduler::TaskId renew_timer{runtime::Scheduler::kNoTask};
    runtime::Scheduler::TaskId expiry_timer{runtime::Scheduler::kNoTask};
    runtime::Scheduler::TaskId retry_timer{runtime::Scheduler::kNoTask};
  };

  struct DegradedChange {
    std::string device_id;
    bool        degraded;
  };

  using Notices = std::vector<DegradedChange>;

  void Transition(Entry& entry, model::SubscriptionState to);
  void CancelTimers(Entry& entry);
  void Begin(Entry& entry);
  void Dispatch(Entry& entry, Operation op);
  void ScheduleTimers(Entry& entry, util::Millis granted);
  void SetDegraded(Entry& entry, bool degraded, Notices& notices);
  bool DeviceDegraded(const std::string& device_id) const;

  void Execute(SubscriptionKey key, std::uint64_t generation, Operation op, model::Device device, std::string sid);
  void OnGranted(const SubscriptionKey& key, std::uint64_t generation, Operation op, const model::Device& device,
                 const SubscriptionGrant& grant);
  void OnFailed(const SubscriptionKey& key, std::uint64_t generation, Operation op, const std::string& error);
  void OnRetryDue(const SubscriptionKey& key, std::uint64_t generation);
  void OnRenewDue(const SubscriptionKey& key, std::uint64_t generation);
  void OnExpiryDue(const SubscriptionKey& key, std::uint64_t generation);

  void ReleaseOrphan(const model::Device& device, model::EventCategory category, const std::string& sid);
  void Notify(const Notices& notices);

  static SubscriptionInfo Describe(const Entry& entry);

  SubscriptionOptions                 options_;
  std::shared_ptr<EventingTransport>  transport_;
  std::shared_ptr<runtime::Scheduler> scheduler_;
  SubscriptionTable                   table_;

  mutable std::mutex               mutex_;
  std::map<SubscriptionKey, Entry> entries_;
  bool                             shut_down_{false};
  DegradedCallback                 degraded_callback_;

  std::atomic<std::uint64_t> subscribe_failures_{0};
};

} // namespace household::subscription
