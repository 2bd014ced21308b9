#include "factory.hpp"

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/discovery/udp_discovery_socket.hpp"
#include "internal/observability/logging.hpp"
#include "internal/subscription/http_eventing_transport.hpp"
#include "internal/transport/soap_action_transport.hpp"
#include "internal/util/time.hpp"

namespace household::factory {

using observability::IntField;
using observability::StringField;

RuntimeDependencies BuildRuntime(const household::runtime::config::RuntimeConfig& config, RuntimeOverrides overrides) {
  household::config::ConfigLoader::Validate(config);

  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Execution
  // ------------------------------------------------------------------
  if (overrides.scheduler) {
    deps.scheduler = std::move(overrides.scheduler);
  } else {
    deps.worker_pool = std::make_shared<runtime::AsioScheduler>(config.workers().threads());
    deps.scheduler   = deps.worker_pool;
  }
  deps.lanes = std::make_shared<runtime::KeyedSerialExecutor>(deps.scheduler);

  // ------------------------------------------------------------------
  // Topology
  // ------------------------------------------------------------------
  deps.publisher   = std::make_shared<topology::SnapshotPublisher>(deps.scheduler);
  deps.coordinator = std::make_shared<topology::TopologyCoordinator>(topology::CoordinatorOptions::FromConfig(config.topology()),
                                                                     deps.scheduler, deps.publisher);
  std::weak_ptr<topology::TopologyCoordinator> coordinator = deps.coordinator;

  deps.registry = std::make_shared<registry::DeviceRegistry>();
  deps.registry->SetReferenceChecker([coordinator](const std::string& device_id) {
    auto target = coordinator.lock();
    return target && target->IsReferencedByLiveGroup(device_id);
  });

  // ------------------------------------------------------------------
  // Eventing
  // ------------------------------------------------------------------
  deps.listener = std::make_unique<events::HttpEventListener>(events::ListenerOptions::FromConfig(config.callback()));

  auto eventing = overrides.eventing_transport;
  if (!eventing) {
    eventing = std::make_shared<subscription::HttpEventingTransport>(util::FromProto(config.subscriptions().request_timeout()));
  }
  deps.subscriptions = std::make_shared<subscription::SubscriptionManager>(
      subscription::SubscriptionOptions::FromConfig(config.subscriptions(), deps.listener->CallbackUrl()), std::move(eventing),
      deps.scheduler);
  deps.subscriptions->SetDegradedCallback([coordinator](const std::string& device_id, bool degraded) {
    if (auto target = coordinator.lock()) target->OnSubscriptionDegraded(device_id, degraded);
  });

  std::weak_ptr<subscription::SubscriptionManager> subscriptions = deps.subscriptions;
  deps.sink = std::make_shared<events::EventSink>(
      [subscriptions](const std::string& sid) -> std::optional<subscription::SubscriptionKey> {
        auto manager = subscriptions.lock();
        if (!manager) return std::nullopt;
        return manager->Resolve(sid);
      },
      [coordinator](std::vector<model::EventDelta> deltas) {
        if (auto target = coordinator.lock()) target->Apply(deltas);
      },
      deps.lanes, deps.scheduler);

  // ------------------------------------------------------------------
  // Discovery
  // ------------------------------------------------------------------
  const auto& discovery = config.discovery();

  auto socket = overrides.discovery_socket;
  if (!socket) {
    socket = std::make_shared<discovery::UdpDiscoverySocket>(discovery.multicast_address(),
                                                             static_cast<std::uint16_t>(discovery.multicast_port()),
                                                             discovery.interface_address());
  }
  deps.scanner = std::make_shared<discovery::DiscoveryScanner>(discovery::ScannerOptions::FromConfig(discovery), std::move(socket),
                                                               deps.registry, deps.scheduler);

  // Topology learns about a device before its first notification can arrive.
  deps.scanner->AddListener(deps.coordinator);
  deps.scanner->AddListener(deps.subscriptions);
  deps.scanner->AddListener(deps.sink);

  // ------------------------------------------------------------------
  // Control
  // ------------------------------------------------------------------
  deps.actions = overrides.action_transport;
  if (!deps.actions) {
    deps.actions = std::make_shared<transport::SoapActionTransport>(util::FromProto(config.transport().action_timeout()));
  }

  HOUSEHOLD_LOG_INFO("Runtime assembled", {StringField("callback_url", deps.listener->CallbackUrl()),
                                           IntField("categories", config.subscriptions().categories_size())});
  return deps;
}

} // namespace household::factory
