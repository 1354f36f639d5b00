#include "model/status_record.hpp"

#include <algorithm>
#include <cctype>

namespace agent_presence::model {
namespace {

std::string normalize(std::string_view value) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  const auto begin = std::find_if_not(value.begin(), value.end(), is_space);
  const auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }

  std::string out;
  out.reserve(static_cast<std::size_t>(end - begin));
  for (auto it = begin; it != end; ++it) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*it))));
  }
  return out;
}

}  // namespace

std::optional<activity_state> parse_activity_state(const std::string_view name) {
  const std::string normalized = normalize(name);
  for (const auto state : kAllActivityStates) {
    if (normalized == to_string(state)) {
      return state;
    }
  }
  return std::nullopt;
}

const char* to_string(const activity_state state) noexcept {
  switch (state) {
    case activity_state::IDLE:
      return "idle";
    case activity_state::WORK:
      return "work";
    case activity_state::THINK:
      return "think";
    case activity_state::ALERT:
      return "alert";
    case activity_state::SLEEP:
      return "sleep";
  }
  return "idle";
}

const char* to_string(const status_error error) noexcept {
  switch (error) {
    case status_error::NONE:
      return "none";
    case status_error::INVALID_STATE:
      return "invalid state";
    case status_error::CORRUPT_STATE:
      return "corrupt state";
    case status_error::STORE_UNAVAILABLE:
      return "store unavailable";
  }
  return "unknown";
}

std::string valid_state_names() {
  std::string out;
  for (const auto state : kAllActivityStates) {
    if (!out.empty()) {
      out += ", ";
    }
    out += to_string(state);
  }
  return out;
}

status_record bootstrap_record(const wall_clock::time_point now) {
  return status_record{activity_state::IDLE, std::string{}, now};
}

status_record stamped(status_record record) {
  if (record.updated_at == wall_clock::time_point{}) {
    record.updated_at = wall_clock::now();
  }
  return record;
}

}  // namespace agent_presence::model
