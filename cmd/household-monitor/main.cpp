#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "client/cpp/household_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/model/snapshot_proto.hpp"
#include "internal/observability/logging.hpp"

using household::client::HouseholdClient;
using household::observability::IntField;
using household::observability::StringField;

namespace {

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

struct Options {
  std::optional<std::string> config_path;
  bool                       once{false};
  bool                       pretty{false};
};

// Time for subscriptions to deliver initial state after a one-shot scan.
constexpr auto kSettleTime    = std::chrono::seconds(3);
constexpr auto kStatsInterval = std::chrono::seconds(60);

void PrintUsage() {
  std::cerr << "Usage: household-monitor [--config <config.yaml>] [--once] [--pretty]\n"
               "  --once    discover, wait for initial events, print one snapshot and exit\n"
               "  --pretty  indent JSON output\n";
}

std::optional<Options> ParseArgs(int argc, char** argv) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      options.config_path = argv[++i];
    } else if (arg == "--once") {
      options.once = true;
    } else if (arg == "--pretty") {
      options.pretty = true;
    } else {
      return std::nullopt;
    }
  }
  return options;
}

void LogStats(const HouseholdClient& client) {
  const auto stats = client.Stats();
  HOUSEHOLD_LOG_INFO("Household stats", {IntField("devices", static_cast<std::int64_t>(stats.devices_known)),
                                         IntField("notifications", static_cast<std::int64_t>(stats.notifications_accepted)),
                                         IntField("dropped", static_cast<std::int64_t>(stats.notifications_dropped)),
                                         IntField("decode_errors", static_cast<std::int64_t>(stats.decode_errors)),
                                         IntField("degraded", static_cast<std::int64_t>(stats.degraded_subscriptions)),
                                         IntField("snapshots", static_cast<std::int64_t>(stats.snapshots_published))});
}

} // namespace

int main(int argc, char** argv) {
  const auto options = ParseArgs(argc, argv);
  if (!options) {
    PrintUsage();
    return 1;
  }

  try {
    auto config = options->config_path ? household::config::ConfigLoader::LoadFromYaml(*options->config_path)
                                       : household::config::ConfigLoader::Defaults();

    household::observability::InitializeLogging(config);

    HouseholdClient client(config);

    if (options->once) {
      client.Start();
      const auto handled = client.DiscoverOnce();
      HOUSEHOLD_LOG_INFO("Discovery pass finished", {IntField("responses", static_cast<std::int64_t>(handled))});

      std::this_thread::sleep_for(kSettleTime);
      std::cout << household::model::ToJson(*client.GetSnapshot(), options->pretty) << std::endl;

      client.Shutdown();
      household::observability::ShutdownLogging();
      return 0;
    }

    std::mutex out_mutex;
    client.SubscribeToChanges([&out_mutex, pretty = options->pretty](const household::topology::TopologyChange& change) {
      const auto json = household::model::ToJson(*change.snapshot, pretty);
      std::lock_guard lock(out_mutex);
      std::cout << json << std::endl;
    });

    // Register signal handlers before starting to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    client.Start();
    client.StartBackgroundDiscovery();
    HOUSEHOLD_LOG_INFO("Household monitor started", {StringField("callback_url", client.CallbackUrl())});

    auto next_stats = std::chrono::steady_clock::now() + kStatsInterval;
    while (g_running) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
      if (std::chrono::steady_clock::now() >= next_stats) {
        LogStats(client);
        next_stats += kStatsInterval;
      }
    }

    HOUSEHOLD_LOG_INFO("Shutting down household monitor");

    client.Shutdown();
    household::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    HOUSEHOLD_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    household::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
