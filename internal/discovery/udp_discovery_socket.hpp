#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <deque>
#include <string>

#include "discovery_socket.hpp"

namespace household::discovery {

/*
  SSDP over UDP.

  search_socket_ is bound to an ephemeral port and receives unicast
  M-SEARCH responses; notify_socket_ is bound to the SSDP port and joined to
  the multicast group for NOTIFY announcements. Receive() drives a private
  io_context, so it must only be called from one thread at a time.
*/
class UdpDiscoverySocket final : public DiscoverySocket {
 public:
  UdpDiscoverySocket(std::string multicast_address, std::uint16_t multicast_port, std::string interface_address);
  ~UdpDiscoverySocket() override;

  UdpDiscoverySocket(const UdpDiscoverySocket&)            = delete;
  UdpDiscoverySocket& operator=(const UdpDiscoverySocket&) = delete;

  void                    SendSearch(const std::string& request) override;
  std::optional<Datagram> Receive(util::Millis timeout) override;
  void                    Close() override;

 private:
  struct Endpoint {
    boost::asio::ip::udp::socket   socket;
    boost::asio::ip::udp::endpoint sender;
    std::array<char, 2048>         buffer{};

    explicit Endpoint(boost::asio::io_context& io) : socket(io) {
    }
  };

  void Open();
  void Arm(Endpoint& endpoint);

  std::string   multicast_address_;
  std::uint16_t multicast_port_;
  std::string   interface_address_;

  boost::asio::io_context io_;
  Endpoint                search_;
  Endpoint                notify_;
  bool                    notify_enabled_{false};

  std::deque<Datagram> pending_;
  std::atomic<bool>    closed_{false};
};

} // namespace household::discovery
