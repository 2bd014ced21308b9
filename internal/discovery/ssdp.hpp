#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/device.hpp"

namespace household::discovery::ssdp {

enum class MessageKind {
  kSearchResponse,
  kAlive,
  kByeBye,
};

struct Announcement {
  MessageKind   kind{MessageKind::kSearchResponse};
  std::string   device_id;
  std::string   location;
  std::string   host;
  std::uint16_t port{0};
  std::string   household_id;
  std::string   server;
  std::uint32_t boot_seq{0};
  int           max_age_seconds{0};

  model::Device ToDevice() const;
};

std::string BuildSearchRequest(std::string_view multicast_address, std::uint16_t multicast_port, std::string_view search_target,
                               int mx_seconds);

/*
  Parses an M-SEARCH response or a NOTIFY announcement. Returns nullopt for
  anything that is not about a device of search_target (M-SEARCH requests
  from other control points, foreign device types, malformed datagrams).
*/
std::optional<Announcement> ParseMessage(std::string_view datagram, std::string_view search_target);

// "uuid:RINCON_X::urn:..." -> "RINCON_X"
std::string DeviceIdFromUsn(std::string_view usn);

} // namespace household::discovery::ssdp
