#include "model/status_codec.hpp"

#include <chrono>
#include <cmath>

#include <nlohmann/json.hpp>

namespace agent_presence::model {
namespace {

// Year 5138; far past any real record, far inside the clock's range.
constexpr double kMaxUnixSeconds = 1e11;

double to_unix_seconds(const wall_clock::time_point value) {
  return std::chrono::duration_cast<std::chrono::duration<double>>(value.time_since_epoch()).count();
}

wall_clock::time_point from_unix_seconds(const double seconds) {
  return wall_clock::time_point(
      std::chrono::duration_cast<wall_clock::duration>(std::chrono::duration<double>(seconds)));
}

}  // namespace

std::string encode_status_record(const status_record& record) {
  const nlohmann::json payload{
      {"state", to_string(record.state)},
      {"message", record.message},
      {"updated", to_unix_seconds(record.updated_at)},
  };
  // Messages come straight from argv and may carry invalid UTF-8.
  return payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<status_record> decode_status_record(const std::string_view payload) {
  const auto parsed = nlohmann::json::parse(payload.begin(), payload.end(), nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return std::nullopt;
  }

  const auto state_it = parsed.find("state");
  if (state_it == parsed.end() || !state_it->is_string()) {
    return std::nullopt;
  }
  const auto state = parse_activity_state(state_it->get<std::string>());
  if (!state.has_value()) {
    return std::nullopt;
  }

  const auto updated_it = parsed.find("updated");
  if (updated_it == parsed.end() || !updated_it->is_number()) {
    return std::nullopt;
  }
  const double updated = updated_it->get<double>();
  if (!std::isfinite(updated) || updated < 0.0 || updated > kMaxUnixSeconds) {
    return std::nullopt;
  }

  status_record record{};
  record.state = *state;
  record.updated_at = from_unix_seconds(updated);

  const auto message_it = parsed.find("message");
  if (message_it != parsed.end()) {
    if (!message_it->is_string()) {
      return std::nullopt;
    }
    record.message = message_it->get<std::string>();
  }

  return record;
}

}  // namespace agent_presence::model
