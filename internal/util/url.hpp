#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace household::util {

struct HttpUrl {
  std::string   host;
  std::uint16_t port{80};
  std::string   target{"/"};
};

// Accepts http://host[:port][/path]; anything else yields nullopt.
std::optional<HttpUrl> ParseHttpUrl(std::string_view url);

} // namespace household::util
