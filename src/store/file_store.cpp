#include "store/file_store.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include "model/status_codec.hpp"

namespace agent_presence::store {
namespace {

constexpr std::size_t kReadChunkSize = 4096;
// A status record is a few hundred bytes; anything far larger is not ours.
constexpr std::size_t kMaxRecordBytes = 1U << 20U;

bool write_all(const int fd, const std::string& data) {
  std::size_t written = 0;
  while (written < data.size()) {
    const ssize_t rc = ::write(fd, data.data() + written, data.size() - written);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    written += static_cast<std::size_t>(rc);
  }
  return true;
}

}  // namespace

FileStatusStore::FileStatusStore(std::filesystem::path path) : path_(std::move(path)) {}

model::status_error FileStatusStore::write(const model::status_record& record) {
  const std::string payload = model::encode_status_record(model::stamped(record)) + '\n';

  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      std::cerr << "[store] cannot create " << path_.parent_path().string() << ": " << ec.message() << '\n';
      return model::status_error::STORE_UNAVAILABLE;
    }
  }

  const auto temp = temp_path();
  const int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    std::cerr << "[store] cannot open " << temp.string() << ": " << std::strerror(errno) << '\n';
    return model::status_error::STORE_UNAVAILABLE;
  }

  int failure_errno = 0;
  if (!write_all(fd, payload) || ::fsync(fd) != 0) {
    failure_errno = errno;
  }
  if (::close(fd) != 0 && failure_errno == 0) {
    failure_errno = errno;
  }
  if (failure_errno != 0) {
    std::cerr << "[store] write to " << temp.string() << " failed: " << std::strerror(failure_errno) << '\n';
    std::filesystem::remove(temp, ec);
    return model::status_error::STORE_UNAVAILABLE;
  }

  if (std::rename(temp.c_str(), path_.c_str()) != 0) {
    std::cerr << "[store] rename to " << path_.string() << " failed: " << std::strerror(errno) << '\n';
    std::filesystem::remove(temp, ec);
    return model::status_error::STORE_UNAVAILABLE;
  }

  return model::status_error::NONE;
}

read_result FileStatusStore::read() {
  read_result result{};

  std::FILE* file = std::fopen(path_.c_str(), "rb");
  if (file == nullptr) {
    if (errno == ENOENT) {
      result.absent = true;
    } else {
      result.error = model::status_error::STORE_UNAVAILABLE;
    }
    return result;
  }

  std::string payload;
  char buffer[kReadChunkSize];
  bool read_failed = false;
  while (true) {
    const std::size_t bytes_read = std::fread(buffer, 1, sizeof(buffer), file);
    payload.append(buffer, bytes_read);
    if (bytes_read < sizeof(buffer)) {
      read_failed = std::ferror(file) != 0;
      break;
    }
    if (payload.size() > kMaxRecordBytes) {
      break;
    }
  }
  std::fclose(file);

  if (read_failed) {
    result.error = model::status_error::STORE_UNAVAILABLE;
    return result;
  }

  auto decoded = model::decode_status_record(payload);
  if (!decoded.has_value()) {
    result.error = model::status_error::CORRUPT_STATE;
    return result;
  }

  result.record = std::move(*decoded);
  return result;
}

std::filesystem::path FileStatusStore::temp_path() const {
  // Per-process temp name so two racing writers never share a half-written file.
  return std::filesystem::path(path_.string() + ".tmp." + std::to_string(::getpid()));
}

}  // namespace agent_presence::store
