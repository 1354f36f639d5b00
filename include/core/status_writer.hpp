#pragma once

#include <string_view>

#include "model/status_record.hpp"
#include "store/status_store.hpp"

namespace agent_presence::core {

class StatusWriter {
 public:
  explicit StatusWriter(store::StatusStore& store);

  // Validates `state_name` and replaces the stored record. The message is
  // trimmed and cut to model::kMaxMessageBytes. Nothing is written on
  // INVALID_STATE. Returns STORE_UNAVAILABLE when the store refused the write.
  model::status_error submit(std::string_view state_name, std::string_view message = {});
  model::status_error submit(std::string_view state_name, std::string_view message,
                             model::wall_clock::time_point now);

  // Last record accepted by the store, for confirmation output.
  [[nodiscard]] const model::status_record& last_submitted() const noexcept { return last_submitted_; }

 private:
  store::StatusStore& store_;
  model::status_record last_submitted_{};
};

}  // namespace agent_presence::core
