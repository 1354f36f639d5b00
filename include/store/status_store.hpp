#pragma once

#include <memory>

#include "core/config.hpp"
#include "model/status_record.hpp"

namespace agent_presence::store {

struct read_result {
  // NONE with `absent` set means nothing was ever written.
  model::status_error error{model::status_error::NONE};
  bool absent{false};
  model::status_record record{};

  [[nodiscard]] bool ok() const noexcept { return error == model::status_error::NONE && !absent; }
};

// Durable single-slot storage shared by the writer and the display.
// write() either replaces the whole record or leaves the old one in place.
// A record without updated_at is stamped with the current time.
class StatusStore {
 public:
  virtual ~StatusStore() = default;

  virtual model::status_error write(const model::status_record& record) = 0;
  virtual read_result read() = 0;
  [[nodiscard]] virtual const char* name() const noexcept = 0;
};

std::unique_ptr<StatusStore> make_status_store(const core::PresenceConfig& config);

}  // namespace agent_presence::store
