#include "client/cpp/household_client.h"

#include <exception>
#include <functional>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace household::client {

using observability::IntField;
using observability::StringField;
using util::CommandError;

namespace {

void RunStep(const char* step, const std::function<void()>& fn) {
  try {
    fn();
  } catch (const std::exception& e) {
    HOUSEHOLD_LOG_ERROR("Shutdown step failed", {StringField("step", step), StringField("error", e.what())});
  }
}

} // namespace

HouseholdClient::HouseholdClient(household::runtime::config::RuntimeConfig config, factory::RuntimeOverrides overrides)
    : config_(std::move(config)), deps_(factory::BuildRuntime(config_, std::move(overrides))) {
}

HouseholdClient::~HouseholdClient() {
  try {
    Shutdown();
  } catch (const std::exception& e) {
    HOUSEHOLD_LOG_ERROR("Client teardown failed", {StringField("error", e.what())});
  }
}

void HouseholdClient::Start() {
  std::lock_guard lock(lifecycle_mutex_);
  if (shut_down_) throw util::InvalidState("client has been shut down");
  if (started_) return;

  if (deps_.worker_pool) deps_.worker_pool->Start();

  auto sink = deps_.sink;
  deps_.listener->Start([sink](events::Notification notification) { return sink->Deliver(std::move(notification)); });
  started_ = true;

  HOUSEHOLD_LOG_INFO("Household client started", {StringField("callback_url", deps_.listener->CallbackUrl())});
}

void HouseholdClient::RequireStarted(const char* operation) {
  std::lock_guard lock(lifecycle_mutex_);
  if (shut_down_) throw util::InvalidState(std::string(operation) + ": client has been shut down");
  if (!started_) throw util::InvalidState(std::string(operation) + ": client is not started");
}

std::size_t HouseholdClient::DiscoverOnce() {
  RequireStarted("DiscoverOnce");
  return deps_.scanner->ScanOnce();
}

void HouseholdClient::StartBackgroundDiscovery() {
  RequireStarted("StartBackgroundDiscovery");
  deps_.scanner->Start();
}

model::SnapshotPtr HouseholdClient::GetSnapshot() const {
  return deps_.coordinator->Snapshot();
}

HouseholdClient::ListenerId HouseholdClient::SubscribeToChanges(ChangeCallback callback, topology::ChangeFilter filter) {
  return deps_.publisher->Subscribe(std::move(callback), std::move(filter));
}

bool HouseholdClient::Unsubscribe(ListenerId id) {
  return deps_.publisher->Unsubscribe(id);
}

transport::ActionResult HouseholdClient::SendCommand(const std::string& device_id, const std::string& action,
                                                     const transport::ActionArgs& args) {
  auto device = deps_.registry->Get(device_id);
  if (!device) {
    throw CommandError(CommandError::Reason::kUnknownDevice, "unknown device " + device_id);
  }
  if (!device->reachable) {
    throw CommandError(CommandError::Reason::kDeviceUnreachable, "device " + device_id + " is unreachable");
  }

  try {
    return deps_.actions->SendAction(*device, action, args);
  } catch (const transport::TransportError& e) {
    HOUSEHOLD_LOG_WARN("Command failed", {StringField("device", device_id), StringField("action", action), StringField("error", e.what())});
    throw CommandError(CommandError::Reason::kTransportFailure, e.what());
  }
}

transport::ActionResult HouseholdClient::SendGroupCommand(const std::string& group_id, const std::string& action,
                                                          const transport::ActionArgs& args) {
  const auto snapshot = GetSnapshot();
  auto       it       = snapshot->groups.find(group_id);
  if (it == snapshot->groups.end()) {
    throw CommandError(CommandError::Reason::kUnknownDevice, "unknown group " + group_id);
  }
  return SendCommand(it->second.coordinator_id, action, args);
}

ClientStats HouseholdClient::Stats() const {
  ClientStats stats;
  stats.notifications_accepted = deps_.sink->Accepted();
  stats.notifications_dropped  = deps_.sink->Dropped();
  stats.decode_errors          = deps_.sink->DecodeErrors();
  stats.snapshots_published    = deps_.coordinator->SnapshotsPublished();
  stats.subscribe_failures     = deps_.subscriptions->SubscribeFailures();
  stats.degraded_subscriptions = deps_.subscriptions->DegradedCount();
  stats.probes_sent            = deps_.scanner->ProbesSent();
  stats.probe_failures         = deps_.scanner->ProbeFailures();
  stats.devices_known          = deps_.registry->Size();
  return stats;
}

std::string HouseholdClient::CallbackUrl() const {
  return deps_.listener->CallbackUrl();
}

void HouseholdClient::Shutdown() {
  std::lock_guard lock(lifecycle_mutex_);
  if (shut_down_) return;
  shut_down_ = true;

  RunStep("discovery", [this] { deps_.scanner->Stop(); });
  RunStep("subscriptions", [this] { deps_.subscriptions->Shutdown(); });
  RunStep("topology", [this] { deps_.coordinator->Shutdown(); });
  RunStep("listener", [this] { deps_.listener->Stop(); });
  if (deps_.worker_pool) {
    RunStep("workers", [this] { deps_.worker_pool->Stop(); });
  }

  const auto stats = Stats();
  HOUSEHOLD_LOG_INFO("Household client stopped", {IntField("notifications", static_cast<std::int64_t>(stats.notifications_accepted)),
                                                  IntField("snapshots", static_cast<std::int64_t>(stats.snapshots_published))});
}

} // namespace household::client
