#include <exception>
#include <iostream>
#include <string>

#include "core/config.hpp"
#include "core/status_writer.hpp"
#include "model/status_record.hpp"
#include "store/status_store.hpp"

namespace {

int print_usage() {
  std::cout << "Usage: presence-status [-c PATH] <state> [message]\n"
            << "States: " << agent_presence::model::valid_state_names() << "\n"
            << "  -c, --config PATH   config file shared with presence-display\n"
            << "                      (default: $AGENT_PRESENCE_CONFIG or configs/presence.yaml)\n\n"
            << "Examples:\n"
            << "  presence-status work \"Building feature\"\n"
            << "  presence-status think \"Analyzing data\"\n"
            << "  presence-status idle\n";
  return 1;
}

std::string upper(std::string value) {
  for (auto& c : value) {
    if (c >= 'a' && c <= 'z') {
      c = static_cast<char>(c - 'a' + 'A');
    }
  }
  return value;
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path = agent_presence::core::default_config_path();

  // Options come before the state; everything after it is the message.
  int first = 1;
  while (first < argc) {
    const std::string arg = argv[first];
    if (arg != "-c" && arg != "--config") {
      break;
    }
    if (first + 1 >= argc) {
      std::cerr << "Error: " << arg << " requires a value\n";
      return 1;
    }
    config_path = argv[first + 1];
    first += 2;
  }

  if (first >= argc) {
    return print_usage();
  }

  const std::string state_name = argv[first];
  if (state_name == "-h" || state_name == "--help" || state_name == "help") {
    return print_usage();
  }

  std::string message;
  for (int i = first + 1; i < argc; ++i) {
    if (!message.empty()) {
      message += ' ';
    }
    message += argv[i];
  }

  agent_presence::core::PresenceConfig config{};
  try {
    config = agent_presence::core::load_presence_config_or_default(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  auto store = agent_presence::store::make_status_store(config);
  agent_presence::core::StatusWriter writer{*store};

  const auto error = writer.submit(state_name, message);
  if (error == agent_presence::model::status_error::INVALID_STATE) {
    std::cerr << "Error: Invalid state '" << state_name << "'\n"
              << "Valid states: " << agent_presence::model::valid_state_names() << '\n';
    return 1;
  }
  if (error != agent_presence::model::status_error::NONE) {
    std::cerr << "Error writing state: " << agent_presence::model::to_string(error) << '\n';
    return 1;
  }

  const auto& record = writer.last_submitted();
  std::cout << upper(agent_presence::model::to_string(record.state));
  if (!record.message.empty()) {
    std::cout << ": " << record.message;
  }
  std::cout << '\n';
  return 0;
}
