#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/discovery/discovery_scanner.hpp"
#include "internal/discovery/discovery_socket.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/events/http_event_listener.hpp"
#include "internal/registry/device_registry.hpp"
#include "internal/runtime/asio_scheduler.hpp"
#include "internal/runtime/keyed_serial_executor.hpp"
#include "internal/subscription/eventing_transport.hpp"
#include "internal/subscription/subscription_manager.hpp"
#include "internal/topology/snapshot_publisher.hpp"
#include "internal/topology/topology_coordinator.hpp"
#include "internal/transport/action_transport.hpp"

namespace household::factory {

/*
  Collaborators to use instead of the real network-facing ones. Anything
  left null is built from config.
*/
struct RuntimeOverrides {
  std::shared_ptr<runtime::Scheduler>              scheduler;
  std::shared_ptr<discovery::DiscoverySocket>      discovery_socket;
  std::shared_ptr<subscription::EventingTransport> eventing_transport;
  std::shared_ptr<transport::ActionTransport>      action_transport;
};

/*
  RuntimeDependencies

  Owns every long-lived component of one client. Nothing is started here;
  the owner starts and stops the pieces in order.
*/
struct RuntimeDependencies {
  // Null when the scheduler was overridden.
  std::shared_ptr<runtime::AsioScheduler> worker_pool;
  std::shared_ptr<runtime::Scheduler>     scheduler;

  std::shared_ptr<runtime::KeyedSerialExecutor>      lanes;
  std::shared_ptr<registry::DeviceRegistry>          registry;
  std::shared_ptr<discovery::DiscoveryScanner>       scanner;
  std::shared_ptr<subscription::SubscriptionManager> subscriptions;
  std::shared_ptr<events::EventSink>                 sink;
  std::unique_ptr<events::HttpEventListener>         listener;
  std::shared_ptr<topology::SnapshotPublisher>       publisher;
  std::shared_ptr<topology::TopologyCoordinator>     coordinator;
  std::shared_ptr<transport::ActionTransport>        actions;
};

/*
  BuildRuntime

  Composition root. The only place that knows the concrete transports and
  how components feed each other.

  Throws InvalidConfig for a config that fails validation and
  DiscoveryError / InvalidState when a socket cannot be bound.
*/
RuntimeDependencies BuildRuntime(const household::runtime::config::RuntimeConfig& config, RuntimeOverrides overrides = {});

} // namespace household::factory
