#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include "config/config.pb.h"
#include "internal/factory.hpp"
#include "internal/model/snapshot.hpp"
#include "internal/topology/snapshot_publisher.hpp"
#include "internal/transport/action_transport.hpp"

namespace household::client {

struct ClientStats {
  std::uint64_t notifications_accepted{0};
  std::uint64_t notifications_dropped{0};
  std::uint64_t decode_errors{0};
  std::uint64_t snapshots_published{0};
  std::uint64_t subscribe_failures{0};
  std::uint64_t degraded_subscriptions{0};
  std::uint64_t probes_sent{0};
  std::uint64_t probe_failures{0};
  std::uint64_t devices_known{0};
};

/*
  Entry point for applications.

  The constructor assembles the runtime and binds the callback socket;
  nothing runs until Start(). Reads (GetSnapshot, Stats) never block on
  network activity. Only SendCommand and SendGroupCommand report errors to
  the caller, as util::CommandError.
*/
class HouseholdClient {
 public:
  using ListenerId     = topology::SnapshotPublisher::ListenerId;
  using ChangeCallback = topology::SnapshotPublisher::Callback;

  explicit HouseholdClient(household::runtime::config::RuntimeConfig config, factory::RuntimeOverrides overrides = {});
  ~HouseholdClient();

  HouseholdClient(const HouseholdClient&)            = delete;
  HouseholdClient& operator=(const HouseholdClient&) = delete;

  // Starts the worker pool and the callback listener. Throws
  // util::InvalidState after Shutdown().
  void Start();

  // One probe plus response window; returns the number of discovery
  // messages handled. Both discovery calls throw util::InvalidState unless
  // the client is started.
  std::size_t DiscoverOnce();
  void        StartBackgroundDiscovery();

  model::SnapshotPtr GetSnapshot() const;

  ListenerId SubscribeToChanges(ChangeCallback callback, topology::ChangeFilter filter = {});
  bool       Unsubscribe(ListenerId id);

  transport::ActionResult SendCommand(const std::string& device_id, const std::string& action, const transport::ActionArgs& args = {});

  // Routes to the group's coordinator.
  transport::ActionResult SendGroupCommand(const std::string& group_id, const std::string& action,
                                           const transport::ActionArgs& args = {});

  ClientStats Stats() const;

  std::string CallbackUrl() const;

  // Idempotent. Every teardown step runs even when an earlier one fails.
  void Shutdown();

 private:
  void RequireStarted(const char* operation);

  household::runtime::config::RuntimeConfig config_;
  factory::RuntimeDependencies              deps_;

  std::mutex lifecycle_mutex_;
  bool       started_{false};
  bool       shut_down_{false};
};

} // namespace household::client
