#pragma once

#include "core/config.hpp"
#include "core/timestamp.hpp"
#include "model/status_record.hpp"

namespace agent_presence::core {

// True when `hour` lies in [start_hour, end_hour). The window wraps past
// midnight when start_hour > end_hour; start_hour == end_hour is empty.
[[nodiscard]] bool in_sleep_window(int start_hour, int end_hour, int hour) noexcept;

// Effective state for one display tick, in precedence order:
//   1. inside the sleep window -> {sleep, ""}
//   2. record older than idle_timeout (when non-zero) -> {idle, ""}
//   3. otherwise the record verbatim
// A record stamped in the future counts as zero seconds old.
[[nodiscard]] model::effective_state resolve_effective_state(const model::status_record& record,
                                                            const PresenceConfig& config,
                                                            const ClockReading& clock);

}  // namespace agent_presence::core
