#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace agent_presence::core {

// Local Redis over a unix socket; enabled by store.redis_address.
struct RedisConfig {
  std::string unix_socket{};
  std::string key{"agent_presence:status"};
  bool enabled{false};
};

struct StoreConfig {
  std::string path{"state.json"};
  RedisConfig redis{};
};

struct DisplayConfig {
  bool stdout_debug{false};
  std::string monogram_dir{"assets/monograms"};
};

struct PresenceConfig {
  char letter{'A'};
  std::string name{"AGENT"};
  // 0 disables auto-idle.
  std::uint32_t idle_timeout_seconds{300};
  // [start, end) in local hours; start == end disables the window.
  int sleep_start_hour{0};
  int sleep_end_hour{0};
  std::chrono::milliseconds tick_interval{1000};
  StoreConfig store{};
  DisplayConfig display{};

  // Directory relative store/monogram paths are resolved against.
  std::filesystem::path base_dir{};
};

PresenceConfig load_presence_config(const std::string& path);

// Same as load_presence_config, but a missing file yields defaults with the
// store at default_state_path().
PresenceConfig load_presence_config_or_default(const std::string& path);

void save_presence_config(const std::string& path, const PresenceConfig& config);

std::string format_presence_config(const PresenceConfig& config);

// AGENT_PRESENCE_CONFIG, else configs/presence.yaml.
std::string default_config_path();

// $XDG_STATE_HOME/agent-presence/state.json, else ~/.local/state/agent-presence/state.json.
[[nodiscard]] std::filesystem::path default_state_path();

[[nodiscard]] std::filesystem::path resolved_store_path(const PresenceConfig& config);
[[nodiscard]] std::filesystem::path resolved_monogram_dir(const PresenceConfig& config);

// Picks up edits made by presence-configure while the display runs.
class ConfigWatcher {
 public:
  explicit ConfigWatcher(std::string path);

  // Replaces `config` and returns true when the file changed and parsed.
  // A file that fails to parse is reported once and the old config stays.
  bool poll(PresenceConfig& config);

 private:
  [[nodiscard]] std::optional<std::filesystem::file_time_type> current_write_time() const;

  std::string path_;
  std::optional<std::filesystem::file_time_type> last_write_{};
};

}  // namespace agent_presence::core
