#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace agent_presence::core {
namespace {

constexpr const char* kConfigEnvVar = "AGENT_PRESENCE_CONFIG";
constexpr const char* kDefaultConfigPath = "configs/presence.yaml";
constexpr const char* kStateHomeEnvVar = "XDG_STATE_HOME";
constexpr const char* kStateSubdir = "agent-presence";

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

// '#' starts a comment unless it sits inside a double quoted value.
void strip_comment(std::string& line) {
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (line[i] == '"') {
      quoted = !quoted;
    } else if (line[i] == '#' && !quoted) {
      line.erase(i);
      return;
    }
  }
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

int parse_hour(const std::string& key, const std::string& value) {
  const auto hour = std::stoi(value);
  if (hour < 0 || hour > 23) {
    throw std::runtime_error(key + " must be in range 0..23");
  }
  return hour;
}

// The status record never leaves the host: only unix socket addresses.
void apply_redis_address(RedisConfig& redis, const std::string& value) {
  if (value.empty()) {
    redis.enabled = false;
    redis.unix_socket.clear();
    return;
  }

  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
  } else if (value.front() == '/') {
    redis.unix_socket = value;
  } else {
    throw std::runtime_error("store.redis_address must be a unix socket (unix:///path or /path): " + value);
  }

  if (redis.unix_socket.empty() || redis.unix_socket.front() != '/') {
    throw std::runtime_error("store.redis_address must name an absolute socket path: " + value);
  }
  redis.enabled = true;
}

void apply_key_value(PresenceConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (key == "letter") {
    if (value.size() != 1 || std::isalpha(static_cast<unsigned char>(value.front())) == 0) {
      throw std::runtime_error("letter must be a single character A-Z");
    }
    config.letter = static_cast<char>(std::toupper(static_cast<unsigned char>(value.front())));
    return;
  }

  if (key == "name") {
    config.name = value;
    return;
  }

  if (key == "idle_timeout") {
    const auto seconds = std::stoll(value);
    if (seconds < 0) {
      throw std::runtime_error("idle_timeout must be greater than or equal to 0");
    }
    if (seconds > static_cast<long long>(std::numeric_limits<std::uint32_t>::max())) {
      throw std::runtime_error("idle_timeout must be at most " +
                               std::to_string(std::numeric_limits<std::uint32_t>::max()) + " seconds");
    }
    config.idle_timeout_seconds = static_cast<std::uint32_t>(seconds);
    return;
  }

  if (key == "sleep.start_hour") {
    config.sleep_start_hour = parse_hour(key, value);
    return;
  }

  if (key == "sleep.end_hour") {
    config.sleep_end_hour = parse_hour(key, value);
    return;
  }

  if (key == "tick_rate_hz") {
    const auto hz = std::stoi(value);
    if (hz <= 0) {
      throw std::runtime_error("tick_rate_hz must be greater than 0");
    }

    if (hz > 10) {
      throw std::runtime_error("tick_rate_hz must be less than or equal to 10");
    }

    config.tick_interval = std::chrono::milliseconds(1000 / hz);
    return;
  }

  if (key == "store.path") {
    if (value.empty()) {
      throw std::runtime_error("store.path must not be empty");
    }
    config.store.path = value;
    return;
  }

  if (key == "store.redis_address") {
    apply_redis_address(config.store.redis, value);
    return;
  }

  if (key == "store.redis_key") {
    if (value.empty()) {
      throw std::runtime_error("store.redis_key must not be empty");
    }
    config.store.redis.key = value;
    return;
  }

  if (key == "display.stdout_debug") {
    config.display.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "display.monogram_dir") {
    config.display.monogram_dir = value;
    return;
  }

  std::cerr << "[config] ignoring unknown key " << key << '\n';
}

std::filesystem::path config_base_dir(const std::string& path) {
  const auto parent = std::filesystem::path(path).parent_path();
  const auto dir = parent.empty() ? std::filesystem::path(".") : parent;
  std::error_code ec;
  const auto absolute = std::filesystem::absolute(dir, ec);
  return ec ? dir : absolute.lexically_normal();
}

std::filesystem::path resolve_against(const PresenceConfig& config, const std::string& value) {
  const std::filesystem::path candidate(value);
  if (candidate.is_absolute() || config.base_dir.empty()) {
    return candidate;
  }
  return config.base_dir / candidate;
}

std::string quote(const std::string& value) { return '"' + value + '"'; }

}  // namespace

PresenceConfig load_presence_config(const std::string& path) {
  PresenceConfig config{};
  config.base_dir = config_base_dir(path);

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    strip_comment(line);

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    try {
      apply_key_value(config, full_key.str(), value);
    } catch (const std::runtime_error&) {
      throw;
    } catch (const std::exception& ex) {
      // std::stoi and friends report only the function name.
      throw std::runtime_error("invalid value for " + full_key.str() + ": " + value + " (" + ex.what() + ")");
    }
  }

  return config;
}

PresenceConfig load_presence_config_or_default(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    // Without a config file every process must agree on one store location,
    // whatever its working directory.
    PresenceConfig config{};
    config.base_dir = config_base_dir(path);
    config.store.path = default_state_path().string();
    return config;
  }
  return load_presence_config(path);
}

void save_presence_config(const std::string& path, const PresenceConfig& config) {
  std::ostringstream out;
  out << "letter: " << config.letter << '\n';
  out << "name: " << quote(config.name) << '\n';
  out << "idle_timeout: " << config.idle_timeout_seconds << '\n';
  out << "tick_rate_hz: " << std::max<long long>(1, 1000 / std::max<long long>(1, config.tick_interval.count())) << '\n';
  out << "sleep:\n";
  out << "  start_hour: " << config.sleep_start_hour << '\n';
  out << "  end_hour: " << config.sleep_end_hour << '\n';
  out << "store:\n";
  out << "  path: " << quote(config.store.path) << '\n';
  if (config.store.redis.enabled) {
    out << "  redis_address: " << quote("unix://" + config.store.redis.unix_socket) << '\n';
  }
  out << "  redis_key: " << quote(config.store.redis.key) << '\n';
  out << "display:\n";
  out << "  stdout_debug: " << (config.display.stdout_debug ? "true" : "false") << '\n';
  out << "  monogram_dir: " << quote(config.display.monogram_dir) << '\n';

  const std::filesystem::path target(path);
  std::error_code ec;
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("unable to create config directory: " + target.parent_path().string() + ": " +
                               ec.message());
    }
  }

  const std::string temp_path = path + ".tmp." + std::to_string(::getpid());
  {
    std::ofstream output(temp_path, std::ios::trunc);
    if (!output.is_open()) {
      throw std::runtime_error("unable to write config file: " + temp_path);
    }
    output << out.str();
    output.flush();
    if (!output) {
      std::filesystem::remove(temp_path, ec);
      throw std::runtime_error("unable to write config file: " + temp_path);
    }
  }

  std::filesystem::rename(temp_path, target, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(temp_path, cleanup_ec);
    throw std::runtime_error("unable to replace config file: " + path + ": " + ec.message());
  }
}

std::string format_presence_config(const PresenceConfig& config) {
  std::ostringstream output;
  output << "letter=" << config.letter
         << " | name=" << config.name
         << " | idle_timeout_s=" << config.idle_timeout_seconds
         << " | sleep_window=" << config.sleep_start_hour << ".." << config.sleep_end_hour
         << " | tick_interval_ms=" << config.tick_interval.count()
         << " | stdout_debug=" << (config.display.stdout_debug ? "true" : "false")
         << " | store=";

  if (!config.store.redis.enabled) {
    output << "file://" << resolved_store_path(config).string();
  } else {
    output << "redis+unix://" << config.store.redis.unix_socket << '/' << config.store.redis.key;
  }
  return output.str();
}

std::string default_config_path() {
  if (const auto* value = std::getenv(kConfigEnvVar); value != nullptr && value[0] != '\0') {
    return std::string(value);
  }
  return kDefaultConfigPath;
}

std::filesystem::path default_state_path() {
  if (const auto* state_home = std::getenv(kStateHomeEnvVar); state_home != nullptr && state_home[0] == '/') {
    return std::filesystem::path(state_home) / kStateSubdir / "state.json";
  }
  if (const auto* home = std::getenv("HOME"); home != nullptr && home[0] == '/') {
    return std::filesystem::path(home) / ".local" / "state" / kStateSubdir / "state.json";
  }
  return std::filesystem::temp_directory_path() / kStateSubdir / "state.json";
}

std::filesystem::path resolved_store_path(const PresenceConfig& config) {
  return resolve_against(config, config.store.path);
}

std::filesystem::path resolved_monogram_dir(const PresenceConfig& config) {
  return resolve_against(config, config.display.monogram_dir);
}

ConfigWatcher::ConfigWatcher(std::string path) : path_(std::move(path)), last_write_(current_write_time()) {}

bool ConfigWatcher::poll(PresenceConfig& config) {
  const auto write_time = current_write_time();
  if (!write_time.has_value() || write_time == last_write_) {
    return false;
  }
  last_write_ = write_time;

  try {
    config = load_presence_config(path_);
  } catch (const std::exception& ex) {
    std::cerr << "[config] reload of " << path_ << " failed, keeping previous settings: " << ex.what() << '\n';
    return false;
  }

  std::cerr << "[config] reloaded " << format_presence_config(config) << '\n';
  return true;
}

std::optional<std::filesystem::file_time_type> ConfigWatcher::current_write_time() const {
  std::error_code ec;
  const auto write_time = std::filesystem::last_write_time(path_, ec);
  if (ec) {
    return std::nullopt;
  }
  return write_time;
}

}  // namespace agent_presence::core
