#pragma once

#include <cstdint>
#include <string_view>

namespace household::model {

enum class SubscriptionState : std::uint8_t {
  kUnsubscribed = 0,
  kSubscribing  = 1,
  kActive       = 2,
  kRenewing     = 3,
  kExpired      = 4,
};

constexpr std::string_view StateName(SubscriptionState state) {
  switch (state) {
    case SubscriptionState::kUnsubscribed:
      return "UNSUBSCRIBED";
    case SubscriptionState::kSubscribing:
      return "SUBSCRIBING";
    case SubscriptionState::kActive:
      return "ACTIVE";
    case SubscriptionState::kRenewing:
      return "RENEWING";
    case SubscriptionState::kExpired:
      return "EXPIRED";
  }
  return "UNKNOWN";
}

constexpr bool HoldsSubscription(SubscriptionState state) {
  return state == SubscriptionState::kActive || state == SubscriptionState::kRenewing;
}

/*
  UNSUBSCRIBED -> SUBSCRIBING -> ACTIVE -> RENEWING -> ACTIVE | EXPIRED -> UNSUBSCRIBED

  SUBSCRIBING may also fall back to UNSUBSCRIBED (retries exhausted, device
  lost) and any state may drop to UNSUBSCRIBED on removal or shutdown.
*/
constexpr bool CanTransition(SubscriptionState from, SubscriptionState to) {
  if (to == SubscriptionState::kUnsubscribed) {
    return true;
  }

  switch (from) {
    case SubscriptionState::kUnsubscribed:
      return to == SubscriptionState::kSubscribing;
    case SubscriptionState::kSubscribing:
      return to == SubscriptionState::kSubscribing || to == SubscriptionState::kActive;
    case SubscriptionState::kActive:
      return to == SubscriptionState::kRenewing || to == SubscriptionState::kExpired;
    case SubscriptionState::kRenewing:
      return to == SubscriptionState::kActive || to == SubscriptionState::kExpired;
    case SubscriptionState::kExpired:
      return false;
  }
  return false;
}

} // namespace household::model
