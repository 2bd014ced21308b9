#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace household::model {

/*
  Event services a player publishes. One subscription exists per
  (device, category).
*/
enum class EventCategory : std::uint8_t {
  kZoneGroupTopology     = 0,
  kAVTransport           = 1,
  kRenderingControl      = 2,
  kGroupRenderingControl = 3,
};

inline constexpr std::array<EventCategory, 4> kAllCategories = {
    EventCategory::kZoneGroupTopology,
    EventCategory::kAVTransport,
    EventCategory::kRenderingControl,
    EventCategory::kGroupRenderingControl,
};

constexpr std::string_view CategoryName(EventCategory category) {
  switch (category) {
    case EventCategory::kZoneGroupTopology:
      return "ZoneGroupTopology";
    case EventCategory::kAVTransport:
      return "AVTransport";
    case EventCategory::kRenderingControl:
      return "RenderingControl";
    case EventCategory::kGroupRenderingControl:
      return "GroupRenderingControl";
  }
  return "Unknown";
}

// Event subscription URL path on the player.
constexpr std::string_view EventPath(EventCategory category) {
  switch (category) {
    case EventCategory::kZoneGroupTopology:
      return "/ZoneGroupTopology/Event";
    case EventCategory::kAVTransport:
      return "/MediaRenderer/AVTransport/Event";
    case EventCategory::kRenderingControl:
      return "/MediaRenderer/RenderingControl/Event";
    case EventCategory::kGroupRenderingControl:
      return "/MediaRenderer/GroupRenderingControl/Event";
  }
  return "/";
}

constexpr std::optional<EventCategory> ParseCategory(std::string_view name) {
  for (auto category : kAllCategories) {
    if (CategoryName(category) == name) return category;
  }
  return std::nullopt;
}

} // namespace household::model
