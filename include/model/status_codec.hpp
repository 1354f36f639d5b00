#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "model/status_record.hpp"

namespace agent_presence::model {

// Wire form shared by every store backend:
// {"state": "work", "message": "...", "updated": <unix seconds>}
std::string encode_status_record(const status_record& record);

// Returns nullopt on malformed input, an unknown state name or a missing
// "updated" stamp. A missing "message" decodes as empty.
std::optional<status_record> decode_status_record(std::string_view payload);

}  // namespace agent_presence::model
