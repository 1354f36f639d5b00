#pragma once

#include <filesystem>

#include "store/status_store.hpp"

namespace agent_presence::store {

// JSON file replaced by write-temp, fsync, rename.
class FileStatusStore final : public StatusStore {
 public:
  explicit FileStatusStore(std::filesystem::path path);

  model::status_error write(const model::status_record& record) override;
  read_result read() override;
  [[nodiscard]] const char* name() const noexcept override { return "file"; }

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

 private:
  [[nodiscard]] std::filesystem::path temp_path() const;

  std::filesystem::path path_;
};

}  // namespace agent_presence::store
