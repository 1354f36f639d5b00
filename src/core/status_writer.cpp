#include "core/status_writer.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace agent_presence::core {
namespace {

std::string trim(const std::string_view value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

// Cuts at a UTF-8 character boundary so the stored text stays valid.
std::string truncate_message(std::string message) {
  if (message.size() <= model::kMaxMessageBytes) {
    return message;
  }
  std::size_t cut = model::kMaxMessageBytes;
  while (cut > 0 && (static_cast<unsigned char>(message[cut]) & 0xC0U) == 0x80U) {
    --cut;
  }
  message.resize(cut);
  return trim(message);
}

}  // namespace

StatusWriter::StatusWriter(store::StatusStore& store) : store_(store) {}

model::status_error StatusWriter::submit(const std::string_view state_name, const std::string_view message) {
  return submit(state_name, message, model::wall_clock::now());
}

model::status_error StatusWriter::submit(const std::string_view state_name, const std::string_view message,
                                         const model::wall_clock::time_point now) {
  const auto state = model::parse_activity_state(state_name);
  if (!state.has_value()) {
    return model::status_error::INVALID_STATE;
  }

  model::status_record record{*state, truncate_message(trim(message)), now};
  const auto error = store_.write(record);
  if (error != model::status_error::NONE) {
    return error;
  }

  last_submitted_ = std::move(record);
  return model::status_error::NONE;
}

}  // namespace agent_presence::core
