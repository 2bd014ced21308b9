#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "client/cpp/household_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "Usage: send_command_example <group_id> <Service#Action> [name=value ...]\n";
    return 1;
  }

  household::transport::ActionArgs args{{"InstanceID", "0"}};
  for (int i = 3; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto        eq  = arg.find('=');
    if (eq == std::string::npos) {
      std::cerr << "argument must be name=value: " << arg << '\n';
      return 1;
    }
    args[arg.substr(0, eq)] = arg.substr(eq + 1);
  }

  household::client::HouseholdClient client(household::config::ConfigLoader::Defaults());
  client.Start();
  client.DiscoverOnce();

  // Group ids only exist once topology events have arrived.
  std::this_thread::sleep_for(std::chrono::seconds(3));

  try {
    const auto result = client.SendGroupCommand(argv[1], argv[2], args);
    for (const auto& [name, value] : result) {
      std::cout << name << " = " << value << '\n';
    }
  } catch (const household::util::CommandError& e) {
    std::cerr << "command failed: " << e.what() << '\n';
    client.Shutdown();
    return 2;
  }

  client.Shutdown();
  return 0;
}
