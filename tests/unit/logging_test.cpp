#include "internal/observability/logging.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"

namespace {

using household::observability::BoolField;
using household::observability::FormatFields;
using household::observability::IntField;
using household::observability::ParseLogLevel;
using household::observability::StringField;

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream      in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

void TestFieldsAreQuotedOnlyWhenNeeded() {
  assert(FormatFields({}) == "");
  assert(FormatFields({StringField("device", "RINCON_A"), IntField("attempts", 3), BoolField("degraded", true)}) ==
         "device=RINCON_A attempts=3 degraded=true");
  assert(FormatFields({StringField("error", "UPnP error 701")}) == "error=\"UPnP error 701\"");
  assert(FormatFields({StringField("sid", "")}) == "sid=\"\"");
  assert(FormatFields({StringField("body", "a=\"b\"\nc")}) == "body=\"a=\\\"b\\\" c\"");
}

void TestLevelNames() {
  assert(ParseLogLevel("debug") == spdlog::level::debug);
  assert(ParseLogLevel("warn") == spdlog::level::warn);
  assert(ParseLogLevel("warning") == spdlog::level::warn);
  assert(ParseLogLevel("err") == spdlog::level::err);
  assert(ParseLogLevel("error") == spdlog::level::err);
  assert(ParseLogLevel("off") == spdlog::level::off);
  assert(!ParseLogLevel("chatty").has_value());
  assert(!ParseLogLevel("").has_value());
}

void TestFileSinkReceivesStructuredLines() {
  ::unsetenv("HOUSEHOLD_LOG_LEVEL");
  ::unsetenv("HOUSEHOLD_LOG_PATTERN");

  const auto path = std::filesystem::temp_directory_path() / "household_logging_test.log";
  std::filesystem::remove(path);

  auto config = household::config::ConfigLoader::Defaults();
  config.mutable_logging()->set_level("info");
  config.mutable_logging()->set_pattern("%l %v");
  config.mutable_logging()->set_file(path.string());
  household::observability::InitializeLogging(config);

  HOUSEHOLD_LOG_DEBUG("Hidden below level");
  HOUSEHOLD_LOG_WARN("Subscription degraded", {StringField("device", "RINCON_A"), IntField("attempts", 3)});
  household::observability::ShutdownLogging();

  const auto text = ReadFile(path);
  assert(text.find("warning Subscription degraded device=RINCON_A attempts=3") != std::string::npos);
  assert(text.find("Hidden below level") == std::string::npos);
}

void TestUnknownLevelFailsInitialization() {
  ::unsetenv("HOUSEHOLD_LOG_LEVEL");

  auto config = household::config::ConfigLoader::Defaults();
  config.mutable_logging()->set_level("chatty");

  bool threw = false;
  try {
    household::observability::InitializeLogging(config);
  } catch (const household::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

void TestEnvironmentOverridesConfigLevel() {
  ::setenv("HOUSEHOLD_LOG_LEVEL", "nonsense", 1);

  bool threw = false;
  try {
    household::observability::InitializeLogging(household::config::ConfigLoader::Defaults());
  } catch (const household::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
  ::unsetenv("HOUSEHOLD_LOG_LEVEL");
}

} // namespace

int main() {
  TestFieldsAreQuotedOnlyWhenNeeded();
  TestLevelNames();
  TestFileSinkReceivesStructuredLines();
  TestUnknownLevelFailsInitialization();
  TestEnvironmentOverridesConfigLevel();

  std::cout << "household_unit_logging: pass\n";
  return 0;
}
