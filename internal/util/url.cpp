#include "url.hpp"

#include <charconv>

namespace household::util {

std::optional<HttpUrl> ParseHttpUrl(std::string_view url) {
  constexpr std::string_view kScheme = "http://";
  if (url.substr(0, kScheme.size()) != kScheme) return std::nullopt;
  url.remove_prefix(kScheme.size());

  HttpUrl out;
  auto    slash     = url.find('/');
  auto    authority = url.substr(0, slash);
  if (slash != std::string_view::npos) out.target = std::string(url.substr(slash));

  auto colon = authority.rfind(':');
  if (colon != std::string_view::npos) {
    auto     port_text = authority.substr(colon + 1);
    unsigned port      = 0;
    auto [ptr, ec]     = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc() || ptr != port_text.data() + port_text.size() || port == 0 || port > 65535) return std::nullopt;
    out.port  = static_cast<std::uint16_t>(port);
    authority = authority.substr(0, colon);
  }

  if (authority.empty()) return std::nullopt;
  out.host = std::string(authority);
  return out;
}

} // namespace household::util
