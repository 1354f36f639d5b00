#include "store/status_store.hpp"

#include "store/file_store.hpp"
#include "store/redis_store.hpp"

namespace agent_presence::store {

std::unique_ptr<StatusStore> make_status_store(const core::PresenceConfig& config) {
  if (!config.store.redis.enabled) {
    return std::make_unique<FileStatusStore>(core::resolved_store_path(config));
  }

  RedisStoreOptions options{};
  options.unix_socket = config.store.redis.unix_socket;
  options.key = config.store.redis.key;
  return std::make_unique<RedisStatusStore>(options);
}

}  // namespace agent_presence::store
