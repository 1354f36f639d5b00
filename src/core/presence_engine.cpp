#include "core/presence_engine.hpp"

#include <chrono>

namespace agent_presence::core {

bool in_sleep_window(const int start_hour, const int end_hour, const int hour) noexcept {
  if (start_hour == end_hour) {
    return false;
  }
  if (start_hour < end_hour) {
    return hour >= start_hour && hour < end_hour;
  }
  return hour >= start_hour || hour < end_hour;
}

model::effective_state resolve_effective_state(const model::status_record& record, const PresenceConfig& config,
                                               const ClockReading& clock) {
  if (in_sleep_window(config.sleep_start_hour, config.sleep_end_hour, clock.hour_of_day)) {
    return model::effective_state{model::activity_state::SLEEP, std::string{}};
  }

  if (config.idle_timeout_seconds > 0) {
    const auto elapsed = clock.now > record.updated_at ? clock.now - record.updated_at
                                                       : model::wall_clock::duration::zero();
    if (elapsed >= std::chrono::seconds(config.idle_timeout_seconds)) {
      return model::effective_state{model::activity_state::IDLE, std::string{}};
    }
  }

  return model::effective_state{record.state, record.message};
}

}  // namespace agent_presence::core
