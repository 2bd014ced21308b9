#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "event_decoder.hpp"
#include "internal/discovery/discovery_scanner.hpp"
#include "internal/runtime/keyed_serial_executor.hpp"
#include "internal/subscription/subscription_table.hpp"

namespace household::events {

struct Notification {
  std::string   sid;
  std::uint64_t sequence{0};
  std::string   body;
};

enum class DeliveryResult {
  kAccepted,
  kUnknownSubscription,
};

/*
  Demultiplexes inbound notifications.

  Deliver() only resolves and stamps; decoding and applying happen on the
  device's serial lane, so a slow device never holds up the caller or other
  devices. Work still queued for a removed device is discarded.
*/
class EventSink : public discovery::DiscoveryListener {
 public:
  using Resolver      = std::function<std::optional<subscription::SubscriptionKey>(const std::string& sid)>;
  using DeltaConsumer = std::function<void(std::vector<model::EventDelta> deltas)>;

  EventSink(Resolver resolver, DeltaConsumer consumer, std::shared_ptr<runtime::KeyedSerialExecutor> lanes,
            std::shared_ptr<runtime::Scheduler> clock);

  DeliveryResult Deliver(Notification notification);

  void OnDeviceReachable(const model::Device&) override {
  }
  void OnDeviceUnreachable(const std::string&) override {
  }
  void OnDeviceRemoved(const std::string& device_id) override;

  std::uint64_t Accepted() const {
    return accepted_;
  }
  std::uint64_t Dropped() const {
    return dropped_;
  }
  std::uint64_t DecodeErrors() const {
    return decode_errors_;
  }

 private:
  void Process(const subscription::SubscriptionKey& key, const model::EventStamp& stamp, const std::string& body);

  Resolver                                      resolver_;
  DeltaConsumer                                 consumer_;
  std::shared_ptr<runtime::KeyedSerialExecutor> lanes_;
  std::shared_ptr<runtime::Scheduler>           clock_;
  EventDecoder                                  decoder_;

  std::atomic<std::uint64_t> accepted_{0};
  std::atomic<std::uint64_t> dropped_{0};
  std::atomic<std::uint64_t> decode_errors_{0};
};

} // namespace household::events
