#pragma once

#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace household::model {

/*
  A discovered player. Owned by the DeviceRegistry; everything else holds
  copies or refers to it by id.
*/
struct Device {
  std::string   id;
  std::string   host;
  std::uint16_t port{1400};
  std::string   location;
  std::string   household_id;
  std::string   model;
  // X-RINCON-BOOTSEQ; grows on every player reboot. 0 when unknown.
  std::uint32_t boot_seq{0};

  bool            reachable{true};
  util::TimePoint last_seen{};

  bool SameLocation(const Device& other) const {
    return host == other.host && port == other.port;
  }

  bool operator==(const Device&) const = default;
};

} // namespace household::model
