#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace agent_presence::model {

enum class activity_state : std::uint8_t {
    IDLE = 0,
    WORK = 1,
    THINK = 2,
    ALERT = 3,
    SLEEP = 4,
};

inline constexpr std::array<activity_state, 5> kAllActivityStates = {
    activity_state::IDLE, activity_state::WORK, activity_state::THINK, activity_state::ALERT, activity_state::SLEEP,
};

enum class status_error : std::uint8_t {
    NONE = 0,
    INVALID_STATE = 1,
    CORRUPT_STATE = 2,
    STORE_UNAVAILABLE = 3,
};

using wall_clock = std::chrono::system_clock;

// Messages are one line of short text; longer input is cut to this many bytes.
inline constexpr std::size_t kMaxMessageBytes = 256;

// Single persisted slot. Each write replaces the previous record entirely.
struct status_record {
    activity_state state{activity_state::IDLE};
    std::string message{};
    wall_clock::time_point updated_at{};
};

// What the display actually shows for one tick. Never persisted.
struct effective_state {
    activity_state state{activity_state::IDLE};
    std::string message{};

    bool operator==(const effective_state& other) const = default;
};

[[nodiscard]] std::optional<activity_state> parse_activity_state(std::string_view name);
[[nodiscard]] const char* to_string(activity_state state) noexcept;
[[nodiscard]] const char* to_string(status_error error) noexcept;

// Comma separated list of every valid state name, for usage and error text.
[[nodiscard]] std::string valid_state_names();

[[nodiscard]] status_record bootstrap_record(wall_clock::time_point now);

// `record` with updated_at set to now when the caller left it unset.
[[nodiscard]] status_record stamped(status_record record);

}  // namespace agent_presence::model
