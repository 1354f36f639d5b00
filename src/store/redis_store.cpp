#include "store/redis_store.hpp"

#include <array>
#include <cstddef>
#include <iostream>
#include <string>
#include <utility>

#include <hiredis/hiredis.h>

#include "model/status_codec.hpp"

namespace agent_presence::store {
namespace {

struct ReplyDeleter {
  void operator()(redisReply* reply) const {
    if (reply != nullptr) {
      freeReplyObject(reply);
    }
  }
};

using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

template <std::size_t N>
ReplyPtr command_argv(redisContext* context, const std::array<const std::string*, N>& args) {
  std::array<const char*, N> argv{};
  std::array<std::size_t, N> argv_len{};
  for (std::size_t i = 0; i < N; ++i) {
    argv[i] = args[i]->data();
    argv_len[i] = args[i]->size();
  }
  return ReplyPtr(static_cast<redisReply*>(
      redisCommandArgv(context, static_cast<int>(N), argv.data(), argv_len.data())));
}

}  // namespace

RedisStatusStore::RedisStatusStore(RedisStoreOptions options) : options_(std::move(options)) {}

RedisStatusStore::~RedisStatusStore() = default;

RedisStatusStore::RedisStatusStore(RedisStatusStore&&) noexcept = default;
RedisStatusStore& RedisStatusStore::operator=(RedisStatusStore&&) noexcept = default;

void RedisStatusStore::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisStatusStore::check_connectivity() {
  return ensure_connected();
}

bool RedisStatusStore::ensure_connected() {
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisStatusStore::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (was_ok_) {
      if (raw != nullptr) {
        std::cerr << "[redis] connect to " << endpoint() << " failed: " << raw->errstr << '\n';
      } else {
        std::cerr << "[redis] connect to " << endpoint() << " failed: out of memory\n";
      }
      was_ok_ = false;
    }
    if (raw != nullptr) {
      redisFree(raw);
    }
    return false;
  }

  context_.reset(raw);
  if (!was_ok_) {
    std::cerr << "[redis] connection to " << endpoint() << " recovered\n";
    was_ok_ = true;
  }
  return true;
}

model::status_error RedisStatusStore::write(const model::status_record& record) {
  static const std::string kSet{"SET"};
  const std::string payload = model::encode_status_record(model::stamped(record));

  for (int attempt = 0; attempt < 2; ++attempt) {
    if (!ensure_connected()) {
      return model::status_error::STORE_UNAVAILABLE;
    }

    const auto reply = command_argv<3>(context_.get(), {&kSet, &options_.key, &payload});
    if (reply == nullptr) {
      // Broken connection; drop it and try once more on a fresh one.
      context_.reset();
      continue;
    }
    if (reply->type == REDIS_REPLY_ERROR) {
      std::cerr << "[redis] SET " << options_.key << " rejected: " << (reply->str != nullptr ? reply->str : "unknown")
                << '\n';
      return model::status_error::STORE_UNAVAILABLE;
    }
    return model::status_error::NONE;
  }

  return model::status_error::STORE_UNAVAILABLE;
}

read_result RedisStatusStore::read() {
  static const std::string kGet{"GET"};
  read_result result{};

  if (!ensure_connected()) {
    result.error = model::status_error::STORE_UNAVAILABLE;
    return result;
  }

  const auto reply = command_argv<2>(context_.get(), {&kGet, &options_.key});
  if (reply == nullptr) {
    context_.reset();
    result.error = model::status_error::STORE_UNAVAILABLE;
    return result;
  }

  switch (reply->type) {
    case REDIS_REPLY_NIL:
      result.absent = true;
      return result;
    case REDIS_REPLY_STRING: {
      auto decoded = model::decode_status_record(std::string(reply->str, reply->len));
      if (!decoded.has_value()) {
        result.error = model::status_error::CORRUPT_STATE;
        return result;
      }
      result.record = std::move(*decoded);
      return result;
    }
    case REDIS_REPLY_ERROR:
      result.error = model::status_error::STORE_UNAVAILABLE;
      return result;
    default:
      // Key holds something other than a string.
      result.error = model::status_error::CORRUPT_STATE;
      return result;
  }
}

std::string RedisStatusStore::endpoint() const {
  return "unix://" + options_.unix_socket;
}

}  // namespace agent_presence::store
