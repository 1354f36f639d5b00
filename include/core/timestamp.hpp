#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

#include "model/status_record.hpp"

namespace agent_presence::core {

// Wall-clock instant plus its local hour, captured together so the
// resolution logic never consults the system clock itself.
struct ClockReading {
  model::wall_clock::time_point now{};
  int hour_of_day{0};
  int minute_of_hour{0};
};

inline ClockReading read_local_clock(const model::wall_clock::time_point now) {
  const std::time_t seconds = model::wall_clock::to_time_t(now);
  std::tm local{};
  if (localtime_r(&seconds, &local) == nullptr) {
    return ClockReading{now, 0, 0};
  }
  return ClockReading{now, local.tm_hour, local.tm_min};
}

inline ClockReading read_local_clock() { return read_local_clock(model::wall_clock::now()); }

// "HH:MM" as shown in the top line of the display.
inline std::string format_clock(const ClockReading& clock) {
  char buffer[8]{};
  std::snprintf(buffer, sizeof(buffer), "%02d:%02d", clock.hour_of_day, clock.minute_of_hour);
  return buffer;
}

}  // namespace agent_presence::core
