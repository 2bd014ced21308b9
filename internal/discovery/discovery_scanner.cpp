#include "discovery_scanner.hpp"

#include <algorithm>
#include <exception>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "ssdp.hpp"

namespace household::discovery {

using observability::IntField;
using observability::StringField;

namespace {

constexpr util::Millis kListenSlice{200};

} // namespace

ScannerOptions ScannerOptions::FromConfig(const household::runtime::config::DiscoveryConfig& config) {
  ScannerOptions options;
  options.scan_interval      = util::FromProto(config.scan_interval());
  options.liveness_intervals = config.liveness_intervals();
  options.response_window    = util::FromProto(config.response_window());
  options.removal_after      = util::FromProto(config.removal_after());
  options.multicast_address  = config.multicast_address();
  options.multicast_port     = static_cast<std::uint16_t>(config.multicast_port());
  options.search_target      = config.search_target();
  return options;
}

DiscoveryScanner::DiscoveryScanner(ScannerOptions options, std::shared_ptr<DiscoverySocket> socket,
                                   std::shared_ptr<registry::DeviceRegistry> registry, std::shared_ptr<runtime::Scheduler> clock)
    : options_(std::move(options)), socket_(std::move(socket)), registry_(std::move(registry)), clock_(std::move(clock)) {
  const auto mx   = std::chrono::duration_cast<std::chrono::seconds>(options_.response_window).count();
  search_request_ = ssdp::BuildSearchRequest(options_.multicast_address, options_.multicast_port, options_.search_target,
                                             static_cast<int>(mx));
}

DiscoveryScanner::~DiscoveryScanner() {
  Stop();
}

void DiscoveryScanner::AddListener(std::shared_ptr<DiscoveryListener> listener) {
  std::lock_guard lock(listeners_mutex_);
  listeners_.push_back(std::move(listener));
}

std::vector<std::shared_ptr<DiscoveryListener>> DiscoveryScanner::Listeners() const {
  std::lock_guard lock(listeners_mutex_);
  return listeners_;
}

// ------------------------------------------------------------
// Probing
// ------------------------------------------------------------

void DiscoveryScanner::Probe() {
  try {
    socket_->SendSearch(search_request_);
    ++probes_sent_;
  } catch (const util::DiscoveryError& e) {
    ++probe_failures_;
    HOUSEHOLD_LOG_WARN("Discovery probe failed; retrying next interval", {StringField("error", e.what())});
  }
}

std::size_t DiscoveryScanner::ScanOnce() {
  Probe();

  std::size_t handled = 0;
  if (running_) {
    // The background listener owns the socket; give it the window.
    std::unique_lock lock(wake_mutex_);
    wake_cv_.wait_for(lock, options_.response_window, [this] { return !running_; });
  } else {
    const auto deadline = util::Clock::now() + options_.response_window;
    while (true) {
      const auto now = util::Clock::now();
      if (now >= deadline) break;
      auto datagram = socket_->Receive(std::chrono::duration_cast<util::Millis>(deadline - now));
      if (!datagram) break;
      if (HandleDatagram(*datagram)) ++handled;
    }
  }

  SweepLiveness();
  return handled;
}

bool DiscoveryScanner::HandleDatagram(const Datagram& datagram) {
  auto announcement = ssdp::ParseMessage(datagram.payload, options_.search_target);
  if (!announcement) return false;

  if (announcement->kind == ssdp::MessageKind::kByeBye) {
    if (registry_->MarkUnreachable(announcement->device_id)) {
      {
        std::lock_guard lock(sweep_mutex_);
        unreachable_since_[announcement->device_id] = clock_->Now();
      }
      HOUSEHOLD_LOG_INFO("Device left the network", {StringField("device", announcement->device_id)});
      NotifyUnreachable(announcement->device_id);
    }
    return true;
  }

  const auto now    = clock_->Now();
  auto       result = registry_->Upsert(announcement->ToDevice(), now);
  {
    std::lock_guard lock(sweep_mutex_);
    unreachable_since_.erase(announcement->device_id);
  }

  if (result.NeedsAttention()) {
    HOUSEHOLD_LOG_INFO("Device reachable", {StringField("device", announcement->device_id), StringField("host", announcement->host),
                                            observability::BoolField("new", result.is_new),
                                            observability::BoolField("rebooted", result.rebooted)});
    if (auto device = registry_->Get(announcement->device_id)) {
      NotifyReachable(*device);
    }
  }
  return true;
}

// ------------------------------------------------------------
// Liveness
// ------------------------------------------------------------

void DiscoveryScanner::SweepLiveness() {
  const auto now    = clock_->Now();
  const auto window = options_.LivenessWindow();

  std::vector<std::string> lost;
  std::vector<std::string> expired;

  for (const auto& device : registry_->List()) {
    if (device.reachable) {
      if (now - device.last_seen > window && registry_->MarkUnreachable(device.id)) {
        std::lock_guard lock(sweep_mutex_);
        unreachable_since_[device.id] = now;
        lost.push_back(device.id);
      }
      continue;
    }

    util::TimePoint since;
    {
      std::lock_guard lock(sweep_mutex_);
      since = unreachable_since_.emplace(device.id, now).first->second;
    }
    if (now - since >= options_.removal_after) {
      expired.push_back(device.id);
    }
  }

  for (const auto& id : lost) {
    HOUSEHOLD_LOG_WARN("Device missed liveness window", {StringField("device", id), IntField("window_ms", window.count())});
    NotifyUnreachable(id);
  }

  for (const auto& id : expired) {
    if (!registry_->Remove(id)) continue;
    {
      std::lock_guard lock(sweep_mutex_);
      unreachable_since_.erase(id);
    }
    HOUSEHOLD_LOG_INFO("Device removed", {StringField("device", id)});
    NotifyRemoved(id);
  }
}

// ------------------------------------------------------------
// Background mode
// ------------------------------------------------------------

void DiscoveryScanner::Start() {
  if (running_.exchange(true)) return;

  listen_thread_ = std::thread(&DiscoveryScanner::ListenLoop, this);
  probe_thread_  = std::thread(&DiscoveryScanner::ProbeLoop, this);
  HOUSEHOLD_LOG_INFO("Background discovery started", {IntField("interval_ms", options_.scan_interval.count())});
}

void DiscoveryScanner::Stop() {
  {
    std::lock_guard lock(wake_mutex_);
    if (!running_.exchange(false)) return;
  }
  wake_cv_.notify_all();

  if (probe_thread_.joinable()) probe_thread_.join();
  if (listen_thread_.joinable()) listen_thread_.join();
  socket_->Close();
  HOUSEHOLD_LOG_INFO("Background discovery stopped");
}

void DiscoveryScanner::ListenLoop() {
  while (running_) {
    auto datagram = socket_->Receive(kListenSlice);
    if (!datagram) continue;
    try {
      HandleDatagram(*datagram);
    } catch (const std::exception& e) {
      HOUSEHOLD_LOG_WARN("Discovery datagram handling failed", {StringField("sender", datagram->sender), StringField("error", e.what())});
    }
  }
}

void DiscoveryScanner::ProbeLoop() {
  while (running_) {
    Probe();
    try {
      SweepLiveness();
    } catch (const std::exception& e) {
      HOUSEHOLD_LOG_WARN("Liveness sweep failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(wake_mutex_);
    wake_cv_.wait_for(lock, options_.scan_interval, [this] { return !running_; });
  }
}

// ------------------------------------------------------------
// Listener fan-out
// ------------------------------------------------------------

void DiscoveryScanner::NotifyReachable(const model::Device& device) {
  for (const auto& listener : Listeners()) {
    listener->OnDeviceReachable(device);
  }
}

void DiscoveryScanner::NotifyUnreachable(const std::string& device_id) {
  for (const auto& listener : Listeners()) {
    listener->OnDeviceUnreachable(device_id);
  }
}

void DiscoveryScanner::NotifyRemoved(const std::string& device_id) {
  for (const auto& listener : Listeners()) {
    listener->OnDeviceRemoved(device_id);
  }
}

} // namespace household::discovery
