#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "core/config.hpp"

namespace {

struct Options {
  std::string config_path{};
  std::optional<std::string> letter{};
  std::optional<std::string> name{};
  std::optional<long long> timeout{};
  std::optional<int> sleep_start{};
  std::optional<int> sleep_end{};
  bool show{false};
};

void print_usage(std::ostream& out) {
  out << "Usage: presence-configure [options]\n"
      << "  -l, --letter X        monogram letter (A-Z)\n"
      << "  -n, --name NAME       display name shown at the bottom\n"
      << "  -t, --timeout SECS    auto-idle timeout in seconds (0 disables)\n"
      << "      --sleep-start H   first hour of the sleep window (0-23)\n"
      << "      --sleep-end H     hour the sleep window ends (0-23, equal to start disables)\n"
      << "  -s, --show            print the current configuration\n"
      << "  -c, --config PATH     config file (default: $AGENT_PRESENCE_CONFIG or configs/presence.yaml)\n";
}

std::optional<char> validate_letter(const std::string& value) {
  std::size_t begin = 0;
  std::size_t end = value.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }
  if (end - begin != 1 || std::isalpha(static_cast<unsigned char>(value[begin])) == 0) {
    return std::nullopt;
  }
  return static_cast<char>(std::toupper(static_cast<unsigned char>(value[begin])));
}

std::optional<int> parse_hour(const std::string& value) {
  try {
    std::size_t consumed = 0;
    const int hour = std::stoi(value, &consumed);
    if (consumed != value.size() || hour < 0 || hour > 23) {
      return std::nullopt;
    }
    return hour;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::string upper(std::string value) {
  for (auto& c : value) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return value;
}

std::string trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

// Returns 0 on success, otherwise the process exit code.
int parse_options(int argc, char** argv, Options& options) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto next = [&](std::string& out) {
      if (i + 1 >= argc) {
        std::cerr << "Error: " << arg << " requires a value\n";
        return false;
      }
      out = argv[++i];
      return true;
    };

    std::string value;
    if (arg == "-h" || arg == "--help") {
      print_usage(std::cout);
      return 2;
    }
    if (arg == "-s" || arg == "--show") {
      options.show = true;
      continue;
    }
    if (!next(value)) {
      return 1;
    }

    if (arg == "-c" || arg == "--config") {
      options.config_path = value;
    } else if (arg == "-l" || arg == "--letter") {
      options.letter = value;
    } else if (arg == "-n" || arg == "--name") {
      options.name = value;
    } else if (arg == "-t" || arg == "--timeout") {
      try {
        std::size_t consumed = 0;
        options.timeout = std::stoll(value, &consumed);
        if (consumed != value.size()) {
          throw std::invalid_argument(value);
        }
      } catch (const std::exception&) {
        std::cerr << "Error: Invalid timeout '" << value << "'. Must be an integer.\n";
        return 1;
      }
    } else if (arg == "--sleep-start" || arg == "--sleep-end") {
      const auto hour = parse_hour(value);
      if (!hour.has_value()) {
        std::cerr << "Error: Invalid hour '" << value << "'. Must be 0-23.\n";
        return 1;
      }
      (arg == "--sleep-start" ? options.sleep_start : options.sleep_end) = hour;
    } else {
      std::cerr << "Error: unknown option " << arg << '\n';
      print_usage(std::cerr);
      return 1;
    }
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  Options options{};
  if (const int rc = parse_options(argc, argv, options); rc != 0) {
    return rc == 2 ? 0 : rc;
  }
  if (options.config_path.empty()) {
    options.config_path = agent_presence::core::default_config_path();
  }

  agent_presence::core::PresenceConfig config{};
  try {
    config = agent_presence::core::load_presence_config_or_default(options.config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  if (options.show) {
    std::cout << agent_presence::core::format_presence_config(config) << '\n';
    return 0;
  }

  bool changed = false;

  if (options.letter.has_value()) {
    const auto letter = validate_letter(*options.letter);
    if (!letter.has_value()) {
      std::cerr << "Error: Invalid letter '" << *options.letter << "'. Must be A-Z.\n";
      return 1;
    }
    config.letter = *letter;
    changed = true;
  }

  if (options.name.has_value()) {
    const auto name = upper(trim(*options.name));
    if (name.empty()) {
      std::cerr << "Error: name must not be empty\n";
      return 1;
    }
    config.name = name;
    changed = true;
  }

  if (options.timeout.has_value()) {
    config.idle_timeout_seconds = static_cast<std::uint32_t>(std::clamp<long long>(*options.timeout, 0, static_cast<long long>(UINT32_MAX)));
    changed = true;
  }

  if (options.sleep_start.has_value()) {
    config.sleep_start_hour = *options.sleep_start;
    changed = true;
  }

  if (options.sleep_end.has_value()) {
    config.sleep_end_hour = *options.sleep_end;
    changed = true;
  }

  if (!changed) {
    std::cout << "Current configuration:\n"
              << agent_presence::core::format_presence_config(config) << "\n\n"
              << "Use --help to see options\n";
    return 0;
  }

  try {
    agent_presence::core::save_presence_config(options.config_path, config);
  } catch (const std::exception& ex) {
    std::cerr << "Error saving config: " << ex.what() << '\n';
    return 1;
  }

  std::cout << "Configuration updated (" << options.config_path << "):\n"
            << agent_presence::core::format_presence_config(config) << '\n';
  return 0;
}
