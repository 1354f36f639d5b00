#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "store/status_store.hpp"

struct redisContext;

namespace agent_presence::store {

struct RedisStoreOptions {
  std::string unix_socket{"/run/redis/redis.sock"};
  std::string key{"agent_presence:status"};
  std::uint32_t connect_timeout_ms{1000};
};

// Single Redis string key on a local unix socket. SET replaces the value
// atomically, so readers see either the previous record or the new one.
class RedisStatusStore final : public StatusStore {
 public:
  explicit RedisStatusStore(RedisStoreOptions options = {});
  ~RedisStatusStore() override;

  RedisStatusStore(const RedisStatusStore&) = delete;
  RedisStatusStore& operator=(const RedisStatusStore&) = delete;
  RedisStatusStore(RedisStatusStore&&) noexcept;
  RedisStatusStore& operator=(RedisStatusStore&&) noexcept;

  bool check_connectivity();

  model::status_error write(const model::status_record& record) override;
  read_result read() override;
  [[nodiscard]] const char* name() const noexcept override { return "redis"; }

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  [[nodiscard]] std::string endpoint() const;

  RedisStoreOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  bool was_ok_{true};
};

}  // namespace agent_presence::store
