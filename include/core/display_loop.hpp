#pragma once

#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/timestamp.hpp"
#include "model/status_record.hpp"
#include "sinks/renderer.hpp"
#include "store/status_store.hpp"

namespace agent_presence::core {

enum class loop_phase : std::uint8_t {
  STARTING = 0,
  RUNNING = 1,
  STOPPED = 2,
};

struct DisplayStats {
  std::size_t ticks_executed{0};
  std::size_t renders{0};
  std::size_t config_reloads{0};
  std::size_t degraded_reads{0};
};

class DisplayLoop {
 public:
  using ClockSource = std::function<ClockReading()>;

  // `config_path` enables hot reload of the config file; empty disables it.
  DisplayLoop(PresenceConfig config, store::StatusStore& store, sinks::Renderer& renderer,
              ClockSource clock = {}, std::string config_path = {});
  ~DisplayLoop();

  DisplayLoop(const DisplayLoop&) = delete;
  DisplayLoop& operator=(const DisplayLoop&) = delete;

  // Initial read and render; moves STARTING -> RUNNING.
  void start();

  // Runs `total_ticks` ticks on the fixed schedule; 0 means until stop().
  DisplayStats run_for_ticks(std::size_t total_ticks);

  // Runs until `stop_requested` becomes non-zero. The flag is checked at
  // least every 100 ms, so shutdown never waits a full tick.
  DisplayStats run_until(const volatile std::sig_atomic_t& stop_requested);

  // Releases the renderer; RUNNING -> STOPPED. Safe to call repeatedly.
  void stop();

  [[nodiscard]] loop_phase phase() const noexcept { return phase_; }
  [[nodiscard]] const model::effective_state& current() const noexcept { return current_; }
  [[nodiscard]] const PresenceConfig& config() const noexcept { return config_; }

 private:
  void tick(DisplayStats& stats);
  model::status_record read_record(DisplayStats& stats);
  void note_store_health(model::status_error error);
  void reload_monogram();
  bool wait_for_next_tick(const volatile std::sig_atomic_t* stop_requested);

  PresenceConfig config_;
  store::StatusStore& store_;
  sinks::Renderer& renderer_;
  ClockSource clock_;
  std::optional<ConfigWatcher> config_watcher_{};

  loop_phase phase_{loop_phase::STARTING};
  std::chrono::steady_clock::time_point next_wakeup_{};
  model::status_record bootstrap_{};
  model::status_record last_good_record_{};
  model::status_error store_health_{model::status_error::NONE};
  model::effective_state current_{};
  std::vector<std::string> monogram_{};
  std::optional<sinks::RenderFrame> last_frame_{};
};

}  // namespace agent_presence::core
