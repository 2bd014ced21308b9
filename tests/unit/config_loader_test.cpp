#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using household::config::ConfigLoader;
using household::util::FromProto;
using household::util::InvalidConfig;
using household::util::Millis;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "household_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& test_name, const std::string& yaml_content) {
  const auto yaml_path = WriteYaml(test_name, yaml_content);
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const InvalidConfig&) {
    return true;
  }
  return false;
}

void TestEmptyFileGetsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");
  auto       config    = ConfigLoader::LoadFromYaml(yaml_path.string());

  assert(FromProto(config.discovery().scan_interval()) == Millis(30000));
  assert(config.discovery().liveness_intervals() == 3);
  assert(FromProto(config.discovery().removal_after()) == Millis(600000));
  assert(config.discovery().multicast_address() == "239.255.255.250");
  assert(config.discovery().multicast_port() == 1900);
  assert(FromProto(config.subscriptions().requested_timeout()) == Millis(1800000));
  assert(config.subscriptions().max_attempts() == 3);
  assert(config.subscriptions().categories_size() == 4);
  assert(config.callback().port() == 3400);
  assert(FromProto(config.topology().coordinator_grace()) == Millis(10000));
  assert(config.workers().threads() == 4);
}

void TestDurationsAndOverrides() {
  const auto yaml_path = WriteYaml("overrides",
                                   R"(logging:
  level: debug
discovery:
  scan_interval: 10s
  response_window: 0.5s
  interface_address: "192.168.1.5"
subscriptions:
  requested_timeout: 600s
  renewal_margin: 30s
  request_timeout: 2s
  categories:
    - ZoneGroupTopology
    - AVTransport
callback:
  port: 0
  allow_ephemeral_port: true
  advertised_host: "10.0.0.5"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(FromProto(config.discovery().scan_interval()) == Millis(10000));
  assert(FromProto(config.discovery().response_window()) == Millis(500));
  assert(config.discovery().interface_address() == "192.168.1.5");
  assert(FromProto(config.subscriptions().renewal_margin()) == Millis(30000));
  assert(config.subscriptions().categories_size() == 2);
  assert(config.subscriptions().categories(1) == "AVTransport");
  assert(config.callback().port() == 0);
  assert(config.callback().advertised_host() == "10.0.0.5");
  assert(config.callback().bind_address() == "0.0.0.0");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("unknown_field", R"(discovery:
  scan_interval: 30s
unknown_field: 123
)"));
  assert(Rejects("unknown_nested", R"(callback:
  prot: 3400
)"));
}

void TestInvalidValuesAreRejected() {
  // Margin must leave room for a failed renewal and the fallback subscribe.
  assert(Rejects("tight_margin", R"(subscriptions:
  renewal_margin: 8s
  request_timeout: 5s
)"));
  assert(Rejects("margin_exceeds_timeout", R"(subscriptions:
  requested_timeout: 30s
  renewal_margin: 60s
)"));
  assert(Rejects("window_exceeds_interval", R"(discovery:
  scan_interval: 2s
  response_window: 3s
)"));
  assert(Rejects("bad_category", R"(subscriptions:
  categories:
    - AlarmClock
)"));
  assert(Rejects("backoff_order", R"(subscriptions:
  initial_backoff: 90s
  max_backoff: 60s
)"));
  assert(Rejects("port_range", R"(callback:
  port: 70000
)"));
  assert(Rejects("bad_duration", R"(topology:
  coordinator_grace: soon
)"));
  assert(Rejects("bad_log_level", R"(logging:
  level: chatty
)"));
}

void TestMissingFileIsInvalidConfig() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/household.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must reject a missing file.");
}

void TestDefaultsPassValidation() {
  auto defaults = ConfigLoader::Defaults();
  ConfigLoader::Validate(defaults);
  assert(defaults.callback().threads() == 2);
}

} // namespace

int main() {
  TestEmptyFileGetsDefaults();
  TestDurationsAndOverrides();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestMissingFileIsInvalidConfig();
  TestDefaultsPassValidation();

  std::cout << "household_unit_config_loader: pass\n";
  return 0;
}
