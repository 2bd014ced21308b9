#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "client/cpp/household_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/model/group.hpp"

int main(int argc, char** argv) {
  // Optional YAML config; defaults otherwise.
  auto config = argc > 1 ? household::config::ConfigLoader::LoadFromYaml(argv[1]) : household::config::ConfigLoader::Defaults();

  household::client::HouseholdClient client(config);

  // Only group-level changes; player volume churn is filtered out.
  household::topology::ChangeFilter filter;
  filter.types = {household::topology::ChangeType::kGroupAdded, household::topology::ChangeType::kGroupRemoved,
                  household::topology::ChangeType::kGroupUpdated};

  client.SubscribeToChanges(
      [](const household::topology::TopologyChange& change) {
        std::cout << "version " << change.snapshot->version << '\n';
        for (const auto& event : change.events) {
          std::cout << "  " << household::topology::ChangeTypeName(event.type) << ' ' << event.object_id << '\n';
        }
        for (const auto& [id, group] : change.snapshot->groups) {
          std::cout << "  group " << (group.name.empty() ? id : group.name) << " ["
                    << household::model::PlaybackStateName(group.playback.state) << "] members=" << group.member_ids.size() << '\n';
        }
      },
      filter);

  client.Start();
  const auto handled = client.DiscoverOnce();
  std::cout << "discovery handled " << handled << " responses\n";

  std::this_thread::sleep_for(std::chrono::seconds(30));

  const auto stats = client.Stats();
  std::cout << "notifications=" << stats.notifications_accepted << " snapshots=" << stats.snapshots_published
            << " degraded=" << stats.degraded_subscriptions << '\n';

  client.Shutdown();
  return 0;
}
