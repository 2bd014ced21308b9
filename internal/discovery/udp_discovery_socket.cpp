#include "udp_discovery_socket.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/post.hpp>

#include <memory>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace household::discovery {

namespace asio = boost::asio;
using asio::ip::udp;

UdpDiscoverySocket::UdpDiscoverySocket(std::string multicast_address, std::uint16_t multicast_port, std::string interface_address)
    : multicast_address_(std::move(multicast_address)),
      multicast_port_(multicast_port),
      interface_address_(std::move(interface_address)),
      search_(io_),
      notify_(io_) {
  Open();
}

UdpDiscoverySocket::~UdpDiscoverySocket() {
  Close();
}

void UdpDiscoverySocket::Open() {
  boost::system::error_code ec;

  const auto group = asio::ip::make_address_v4(multicast_address_, ec);
  if (ec) {
    throw util::DiscoveryError("invalid multicast address " + multicast_address_ + ": " + ec.message());
  }

  asio::ip::address_v4 local = asio::ip::address_v4::any();
  if (!interface_address_.empty()) {
    local = asio::ip::make_address_v4(interface_address_, ec);
    if (ec) {
      throw util::DiscoveryError("invalid interface address " + interface_address_ + ": " + ec.message());
    }
  }

  search_.socket.open(udp::v4(), ec);
  if (!ec) search_.socket.bind(udp::endpoint(local, 0), ec);
  if (!ec && !interface_address_.empty()) search_.socket.set_option(asio::ip::multicast::outbound_interface(local), ec);
  if (!ec) search_.socket.set_option(asio::ip::multicast::hops(4), ec);
  if (ec) {
    throw util::DiscoveryError("failed to open SSDP search socket: " + ec.message());
  }
  Arm(search_);

  // Another control point on this host may own the SSDP port; searching
  // still works without the passive listener.
  notify_.socket.open(udp::v4(), ec);
  if (!ec) notify_.socket.set_option(udp::socket::reuse_address(true), ec);
  if (!ec) notify_.socket.bind(udp::endpoint(asio::ip::address_v4::any(), multicast_port_), ec);
  if (!ec) notify_.socket.set_option(asio::ip::multicast::join_group(group, local), ec);
  if (ec) {
    HOUSEHOLD_LOG_WARN("SSDP presence listener unavailable", {observability::StringField("error", ec.message())});
    boost::system::error_code ignored;
    notify_.socket.close(ignored);
    return;
  }
  notify_enabled_ = true;
  Arm(notify_);
}

void UdpDiscoverySocket::Arm(Endpoint& endpoint) {
  endpoint.socket.async_receive_from(asio::buffer(endpoint.buffer), endpoint.sender,
                                     [this, &endpoint](const boost::system::error_code& ec, std::size_t bytes) {
                                       if (ec == asio::error::operation_aborted || closed_) return;
                                       if (!ec) {
                                         pending_.push_back(Datagram{std::string(endpoint.buffer.data(), bytes),
                                                                     endpoint.sender.address().to_string()});
                                       } else {
                                         HOUSEHOLD_LOG_WARN("SSDP receive failed", {observability::StringField("error", ec.message())});
                                       }
                                       Arm(endpoint);
                                     });
}

void UdpDiscoverySocket::SendSearch(const std::string& request) {
  if (closed_) {
    throw util::DiscoveryError("discovery socket closed");
  }

  boost::system::error_code ec;
  const udp::endpoint       target(asio::ip::make_address_v4(multicast_address_, ec), multicast_port_);
  if (ec) {
    throw util::DiscoveryError("invalid multicast address " + multicast_address_);
  }

  // Executed by whichever thread next runs Receive(), so the socket is
  // only ever touched from the io_context.
  asio::post(io_, [this, target, payload = std::make_shared<std::string>(request)] {
    boost::system::error_code send_ec;
    search_.socket.send_to(asio::buffer(*payload), target, 0, send_ec);
    if (send_ec) {
      HOUSEHOLD_LOG_WARN("SSDP probe send failed", {observability::StringField("error", send_ec.message())});
    }
  });
}

std::optional<Datagram> UdpDiscoverySocket::Receive(util::Millis timeout) {
  const auto deadline = util::Clock::now() + timeout;

  while (!closed_) {
    if (!pending_.empty()) {
      auto datagram = std::move(pending_.front());
      pending_.pop_front();
      return datagram;
    }

    const auto now = util::Clock::now();
    if (now >= deadline) break;

    if (io_.stopped()) io_.restart();
    io_.run_one_for(deadline - now);
  }
  return std::nullopt;
}

void UdpDiscoverySocket::Close() {
  if (closed_.exchange(true)) return;

  boost::system::error_code ignored;
  search_.socket.close(ignored);
  if (notify_enabled_) notify_.socket.close(ignored);
  io_.stop();
}

} // namespace household::discovery
