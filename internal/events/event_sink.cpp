#include "event_sink.hpp"

#include <variant>

#include "internal/observability/logging.hpp"

namespace household::events {

using observability::IntField;
using observability::StringField;

EventSink::EventSink(Resolver resolver, DeltaConsumer consumer, std::shared_ptr<runtime::KeyedSerialExecutor> lanes,
                     std::shared_ptr<runtime::Scheduler> clock)
    : resolver_(std::move(resolver)), consumer_(std::move(consumer)), lanes_(std::move(lanes)), clock_(std::move(clock)) {
}

DeliveryResult EventSink::Deliver(Notification notification) {
  auto key = resolver_(notification.sid);
  if (!key) {
    ++dropped_;
    HOUSEHOLD_LOG_WARN("Dropping notification for unknown subscription",
                       {StringField("sid", notification.sid), IntField("seq", static_cast<std::int64_t>(notification.sequence))});
    return DeliveryResult::kUnknownSubscription;
  }

  const model::EventStamp stamp{clock_->Now(), notification.sequence};
  ++accepted_;

  lanes_->Submit(key->device_id, [this, key = *key, stamp, body = std::move(notification.body)] { Process(key, stamp, body); });
  return DeliveryResult::kAccepted;
}

void EventSink::OnDeviceRemoved(const std::string& device_id) {
  lanes_->Discard(device_id);
}

void EventSink::Process(const subscription::SubscriptionKey& key, const model::EventStamp& stamp, const std::string& body) {
  auto deltas = decoder_.Decode(key.category, key.device_id, stamp, body);

  for (const auto& delta : deltas) {
    if (const auto* unknown = std::get_if<model::UnknownEvent>(&delta)) {
      ++decode_errors_;
      HOUSEHOLD_LOG_WARN("Undecodable event payload", {StringField("device", key.device_id), StringField("category", model::CategoryName(key.category)),
                                                       StringField("reason", unknown->reason)});
    }
  }

  if (!deltas.empty()) {
    consumer_(std::move(deltas));
  }
}

} // namespace household::events
