#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "discovery_socket.hpp"
#include "internal/model/device.hpp"
#include "internal/registry/device_registry.hpp"
#include "internal/runtime/scheduler.hpp"

namespace household::runtime::config {
class DiscoveryConfig;
}

namespace household::discovery {

class DiscoveryListener {
 public:
  virtual ~DiscoveryListener() = default;

  // New device, unreachable -> reachable, moved, or rebooted.
  virtual void OnDeviceReachable(const model::Device& device) = 0;
  virtual void OnDeviceUnreachable(const std::string& device_id) = 0;
  virtual void OnDeviceRemoved(const std::string& device_id) = 0;
};

struct ScannerOptions {
  util::Millis  scan_interval{30000};
  std::uint32_t liveness_intervals{3};
  util::Millis  response_window{1500};
  util::Millis  removal_after{600000};
  std::string   multicast_address{"239.255.255.250"};
  std::uint16_t multicast_port{1900};
  std::string   search_target{"urn:schemas-upnp-org:device:ZonePlayer:1"};

  static ScannerOptions FromConfig(const household::runtime::config::DiscoveryConfig& config);

  util::Millis LivenessWindow() const {
    return scan_interval * liveness_intervals;
  }
};

/*
  Probes at a fixed interval and listens for presence announcements.

  Background mode runs two threads: a listener that handles every inbound
  datagram and a prober that sends a search and sweeps liveness once per
  interval. ScanOnce() is the synchronous variant used before (or instead
  of) background mode.
*/
class DiscoveryScanner {
 public:
  DiscoveryScanner(ScannerOptions options, std::shared_ptr<DiscoverySocket> socket, std::shared_ptr<registry::DeviceRegistry> registry,
                   std::shared_ptr<runtime::Scheduler> clock);
  ~DiscoveryScanner();

  DiscoveryScanner(const DiscoveryScanner&)            = delete;
  DiscoveryScanner& operator=(const DiscoveryScanner&) = delete;

  void AddListener(std::shared_ptr<DiscoveryListener> listener);

  // Probe, collect responses for the response window, sweep liveness.
  // Returns the number of announcements handled.
  std::size_t ScanOnce();

  void Start();
  void Stop();
  bool Running() const {
    return running_;
  }

  // Returns true when the datagram was a device announcement.
  bool HandleDatagram(const Datagram& datagram);

  void SweepLiveness();

  std::uint64_t ProbesSent() const {
    return probes_sent_;
  }
  std::uint64_t ProbeFailures() const {
    return probe_failures_;
  }

 private:
  void Probe();
  void ListenLoop();
  void ProbeLoop();

  std::vector<std::shared_ptr<DiscoveryListener>> Listeners() const;
  void NotifyReachable(const model::Device& device);
  void NotifyUnreachable(const std::string& device_id);
  void NotifyRemoved(const std::string& device_id);

  ScannerOptions                            options_;
  std::shared_ptr<DiscoverySocket>          socket_;
  std::shared_ptr<registry::DeviceRegistry> registry_;
  std::shared_ptr<runtime::Scheduler>       clock_;
  std::string                               search_request_;

  mutable std::mutex                              listeners_mutex_;
  std::vector<std::shared_ptr<DiscoveryListener>> listeners_;

  std::mutex                                       sweep_mutex_;
  std::unordered_map<std::string, util::TimePoint> unreachable_since_;

  std::atomic<bool>       running_{false};
  std::mutex              wake_mutex_;
  std::condition_variable wake_cv_;
  std::thread             listen_thread_;
  std::thread             probe_thread_;

  std::atomic<std::uint64_t> probes_sent_{0};
  std::atomic<std::uint64_t> probe_failures_{0};
};

} // namespace household::discovery
