#include "core/display_loop.hpp"

#include <algorithm>
#include <iostream>
#include <thread>
#include <utility>

#include "core/presence_engine.hpp"
#include "sinks/monogram.hpp"

namespace agent_presence::core {
namespace {

constexpr std::chrono::milliseconds kStopPollSlice{100};

}  // namespace

DisplayLoop::DisplayLoop(PresenceConfig config, store::StatusStore& store, sinks::Renderer& renderer,
                         ClockSource clock, std::string config_path)
    : config_(std::move(config)), store_(store), renderer_(renderer), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return read_local_clock(); };
  }
  if (!config_path.empty()) {
    config_watcher_.emplace(std::move(config_path));
  }
}

DisplayLoop::~DisplayLoop() { stop(); }

void DisplayLoop::start() {
  if (phase_ != loop_phase::STARTING) {
    return;
  }

  bootstrap_ = model::bootstrap_record(clock_().now);
  last_good_record_ = bootstrap_;
  reload_monogram();

  DisplayStats initial{};
  tick(initial);

  next_wakeup_ = std::chrono::steady_clock::now();
  phase_ = loop_phase::RUNNING;
  std::cerr << "[display] running with store=" << store_.name() << " tick_interval_ms=" << config_.tick_interval.count()
            << '\n';
}

DisplayStats DisplayLoop::run_for_ticks(const std::size_t total_ticks) {
  DisplayStats stats{};
  start();

  for (std::size_t i = 0; phase_ == loop_phase::RUNNING && (total_ticks == 0 || i < total_ticks); ++i) {
    wait_for_next_tick(nullptr);
    tick(stats);
  }

  return stats;
}

DisplayStats DisplayLoop::run_until(const volatile std::sig_atomic_t& stop_requested) {
  DisplayStats stats{};
  start();

  while (phase_ == loop_phase::RUNNING && stop_requested == 0) {
    if (!wait_for_next_tick(&stop_requested)) {
      break;
    }
    tick(stats);
  }

  return stats;
}

void DisplayLoop::stop() {
  if (phase_ == loop_phase::STOPPED) {
    return;
  }
  const bool was_running = phase_ == loop_phase::RUNNING;
  phase_ = loop_phase::STOPPED;
  renderer_.teardown();
  last_frame_.reset();
  if (was_running) {
    std::cerr << "[display] stopped\n";
  }
}

void DisplayLoop::tick(DisplayStats& stats) {
  ++stats.ticks_executed;

  if (config_watcher_.has_value()) {
    const char previous_letter = config_.letter;
    const std::string previous_monogram_dir = config_.display.monogram_dir;
    if (config_watcher_->poll(config_)) {
      ++stats.config_reloads;
      if (config_.letter != previous_letter || config_.display.monogram_dir != previous_monogram_dir) {
        reload_monogram();
      }
    }
  }

  const auto clock = clock_();
  const auto record = read_record(stats);
  current_ = resolve_effective_state(record, config_, clock);

  sinks::RenderFrame frame{monogram_, current_.state, current_.message, config_.name, format_clock(clock)};
  if (last_frame_.has_value() && *last_frame_ == frame && !renderer_.invalidated()) {
    return;
  }

  renderer_.render(frame);
  ++stats.renders;
  last_frame_ = std::move(frame);
}

model::status_record DisplayLoop::read_record(DisplayStats& stats) {
  auto result = store_.read();
  note_store_health(result.error);

  switch (result.error) {
    case model::status_error::NONE:
      last_good_record_ = result.absent ? bootstrap_ : std::move(result.record);
      return last_good_record_;
    case model::status_error::CORRUPT_STATE:
      ++stats.degraded_reads;
      return bootstrap_;
    case model::status_error::STORE_UNAVAILABLE:
    case model::status_error::INVALID_STATE:
      ++stats.degraded_reads;
      return last_good_record_;
  }
  return last_good_record_;
}

void DisplayLoop::note_store_health(const model::status_error error) {
  if (error == store_health_) {
    return;
  }

  switch (error) {
    case model::status_error::NONE:
      std::cerr << "[display] state store recovered\n";
      break;
    case model::status_error::CORRUPT_STATE:
      std::cerr << "[display] state store holds a corrupt record; showing idle until the next write\n";
      break;
    default:
      std::cerr << "[display] state store " << model::to_string(error) << "; keeping last known state\n";
      break;
  }
  store_health_ = error;
}

void DisplayLoop::reload_monogram() {
  monogram_ = sinks::load_monogram(config_.letter, resolved_monogram_dir(config_));
}

bool DisplayLoop::wait_for_next_tick(const volatile std::sig_atomic_t* stop_requested) {
  const auto now = std::chrono::steady_clock::now();
  next_wakeup_ += config_.tick_interval;
  // After a long stall (suspend, debugger) resync instead of bursting ticks.
  if (next_wakeup_ + config_.tick_interval < now) {
    next_wakeup_ = now;
  }

  if (stop_requested == nullptr) {
    std::this_thread::sleep_until(next_wakeup_);
    return true;
  }

  while (*stop_requested == 0) {
    const auto remaining = next_wakeup_ - std::chrono::steady_clock::now();
    if (remaining <= std::chrono::steady_clock::duration::zero()) {
      return true;
    }
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(remaining, kStopPollSlice));
  }
  return false;
}

}  // namespace agent_presence::core
