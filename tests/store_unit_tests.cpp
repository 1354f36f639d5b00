#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <hiredis/hiredis.h>

#include "core/config.hpp"
#include "core/presence_engine.hpp"
#include "core/status_writer.hpp"
#include "model/status_codec.hpp"
#include "model/status_record.hpp"
#include "store/file_store.hpp"
#include "store/redis_store.hpp"
#include "store/status_store.hpp"

using agent_presence::core::ClockReading;
using agent_presence::core::PresenceConfig;
using agent_presence::core::StatusWriter;
using agent_presence::core::resolve_effective_state;
using agent_presence::model::activity_state;
using agent_presence::model::decode_status_record;
using agent_presence::model::encode_status_record;
using agent_presence::model::status_error;
using agent_presence::model::status_record;
using agent_presence::model::wall_clock;
using agent_presence::store::FileStatusStore;
using agent_presence::store::RedisStatusStore;
using agent_presence::store::RedisStoreOptions;

namespace {

struct RedisMockState {
  std::map<std::string, std::string> keys{};
  std::vector<std::string> last_argv{};
  std::string last_socket{};
  int command_argv_calls{0};
  bool fail_connect{false};
  bool drop_next_reply{false};
};

RedisMockState g_redis_mock{};

redisReply* make_reply(const int type) {
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = type;
  return reply;
}

redisContext* make_context() {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = g_redis_mock.fail_connect ? REDIS_ERR_IO : REDIS_OK;
  if (g_redis_mock.fail_connect) {
    std::strcpy(context->errstr, "Connection refused");
  }
  return context;
}

extern "C" {

redisContext* redisConnectUnixWithTimeout(const char* path, const struct timeval) {
  g_redis_mock.last_socket = path;
  return make_context();
}

void redisFree(redisContext* c) { std::free(c); }

void* redisCommandArgv(redisContext*, int argc, const char** argv, const size_t* argvlen) {
  g_redis_mock.command_argv_calls += 1;
  g_redis_mock.last_argv.clear();
  for (int i = 0; i < argc; ++i) {
    g_redis_mock.last_argv.emplace_back(argv[i], argvlen[i]);
  }

  if (g_redis_mock.drop_next_reply) {
    g_redis_mock.drop_next_reply = false;
    return nullptr;
  }

  const auto& args = g_redis_mock.last_argv;
  if (args.size() == 3 && args[0] == "SET") {
    g_redis_mock.keys[args[1]] = args[2];
    return make_reply(REDIS_REPLY_STATUS);
  }
  if (args.size() == 2 && args[0] == "GET") {
    const auto it = g_redis_mock.keys.find(args[1]);
    if (it == g_redis_mock.keys.end()) {
      return make_reply(REDIS_REPLY_NIL);
    }
    auto* reply = make_reply(REDIS_REPLY_STRING);
    reply->len = it->second.size();
    reply->str = static_cast<char*>(std::malloc(it->second.size() + 1));
    std::memcpy(reply->str, it->second.c_str(), it->second.size() + 1);
    return reply;
  }
  return make_reply(REDIS_REPLY_ERROR);
}

void freeReplyObject(void* reply) {
  auto* typed = static_cast<redisReply*>(reply);
  if (typed != nullptr) {
    std::free(typed->str);
  }
  std::free(reply);
}

}  // extern "C"

const wall_clock::time_point kT0 = wall_clock::time_point(std::chrono::seconds(1709251200));

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::filesystem::path fresh_dir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() /
                   ("agent_presence_" + name + "_" + std::to_string(::getpid()));
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

void write_raw(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::trunc);
  out << content;
}

bool same_record(const status_record& a, const status_record& b) {
  const auto skew = a.updated_at > b.updated_at ? a.updated_at - b.updated_at : b.updated_at - a.updated_at;
  return a.state == b.state && a.message == b.message && skew < std::chrono::milliseconds(1);
}

int test_codec_accepts_and_rejects() {
  const status_record record{activity_state::THINK, "weighing \"options\"", kT0 + std::chrono::milliseconds(250)};
  const auto decoded = decode_status_record(encode_status_record(record));
  if (!decoded.has_value() || !same_record(*decoded, record)) {
    return fail("test_codec_accepts_and_rejects", "encoded record must decode to the same value");
  }

  const auto no_message = decode_status_record(R"({"state": "work", "updated": 1709251200})");
  if (!no_message.has_value() || !no_message->message.empty() || no_message->state != activity_state::WORK) {
    return fail("test_codec_accepts_and_rejects", "missing message must decode as empty");
  }

  const char* rejected[] = {
      "",
      "{\"state\": \"wo",
      "[]",
      R"({"state": "dance", "message": "", "updated": 1})",
      R"({"message": "x", "updated": 1})",
      R"({"state": "work", "message": "x"})",
      R"({"state": "work", "message": "x", "updated": "yesterday"})",
      R"({"state": "work", "message": 7, "updated": 1})",
      R"({"state": "work", "message": "x", "updated": 1e300})",
      R"({"state": "work", "message": "x", "updated": -1709251200})",
      R"({"state": "work", "message": "x", "updated": 1e12})",
  };
  for (const char* payload : rejected) {
    if (decode_status_record(payload).has_value()) {
      return fail("test_codec_accepts_and_rejects", "malformed payload must be rejected");
    }
  }
  return 0;
}

int test_file_store_absent_before_first_write() {
  const auto dir = fresh_dir("absent");
  FileStatusStore store(dir / "state.json");

  const auto result = store.read();
  std::filesystem::remove_all(dir);
  if (result.error != status_error::NONE || !result.absent || result.ok()) {
    return fail("test_file_store_absent_before_first_write", "missing file must read as absent");
  }
  return 0;
}

int test_writer_round_trip_every_state() {
  const auto dir = fresh_dir("round_trip");
  FileStatusStore store(dir / "nested" / "state.json");
  StatusWriter writer(store);

  for (const auto state : agent_presence::model::kAllActivityStates) {
    const std::string message = std::string("doing ") + agent_presence::model::to_string(state);
    if (writer.submit(agent_presence::model::to_string(state), message, kT0) != status_error::NONE) {
      std::filesystem::remove_all(dir);
      return fail("test_writer_round_trip_every_state", "submit of a valid state must succeed");
    }
    const auto result = store.read();
    if (!result.ok() || !same_record(result.record, status_record{state, message, kT0})) {
      std::filesystem::remove_all(dir);
      return fail("test_writer_round_trip_every_state", "read must return exactly what was submitted");
    }
  }

  for (const auto& entry : std::filesystem::directory_iterator(dir / "nested")) {
    if (entry.path().filename() != "state.json") {
      std::filesystem::remove_all(dir);
      return fail("test_writer_round_trip_every_state", "no temp files may be left beside the state file");
    }
  }

  std::filesystem::remove_all(dir);
  return 0;
}

int test_writer_normalizes_input() {
  const auto dir = fresh_dir("normalize");
  FileStatusStore store(dir / "state.json");
  StatusWriter writer(store);

  if (writer.submit("  WORK ", "  Building feature X \n", kT0) != status_error::NONE) {
    std::filesystem::remove_all(dir);
    return fail("test_writer_normalizes_input", "mixed case state name must be accepted");
  }
  const auto result = store.read();
  std::filesystem::remove_all(dir);
  if (!result.ok() || result.record.state != activity_state::WORK || result.record.message != "Building feature X") {
    return fail("test_writer_normalizes_input", "state and message must be trimmed");
  }
  if (writer.last_submitted().message != "Building feature X") {
    return fail("test_writer_normalizes_input", "last_submitted must mirror the stored record");
  }
  return 0;
}

int test_invalid_state_leaves_store_unchanged() {
  const auto dir = fresh_dir("invalid");
  const auto path = dir / "state.json";
  FileStatusStore store(path);
  StatusWriter writer(store);

  if (writer.submit("dance", "x", kT0) != status_error::INVALID_STATE) {
    std::filesystem::remove_all(dir);
    return fail("test_invalid_state_leaves_store_unchanged", "unknown state must be rejected");
  }
  if (!store.read().absent || std::filesystem::exists(path)) {
    std::filesystem::remove_all(dir);
    return fail("test_invalid_state_leaves_store_unchanged", "rejected submit must not create a record");
  }

  if (writer.submit("alert", "need input", kT0) != status_error::NONE) {
    std::filesystem::remove_all(dir);
    return fail("test_invalid_state_leaves_store_unchanged", "valid submit failed");
  }
  const auto before = store.read();
  if (writer.submit("", "nothing", kT0 + std::chrono::seconds(5)) != status_error::INVALID_STATE ||
      writer.submit("sleeping", "", kT0 + std::chrono::seconds(6)) != status_error::INVALID_STATE) {
    std::filesystem::remove_all(dir);
    return fail("test_invalid_state_leaves_store_unchanged", "empty and near-miss names must be rejected");
  }
  const auto after = store.read();
  std::filesystem::remove_all(dir);

  if (!before.ok() || !after.ok() || !same_record(before.record, after.record)) {
    return fail("test_invalid_state_leaves_store_unchanged", "rejected submit must keep the previous record");
  }
  return 0;
}

int test_repeated_submit_is_idempotent() {
  const auto dir = fresh_dir("idempotent");
  FileStatusStore store(dir / "state.json");
  StatusWriter writer(store);

  PresenceConfig config{};
  const ClockReading clock{kT0 + std::chrono::seconds(30), 12, 0};

  (void)writer.submit("work", "X", kT0);
  const auto once = resolve_effective_state(store.read().record, config, clock);
  (void)writer.submit("work", "X", kT0);
  const auto twice = resolve_effective_state(store.read().record, config, clock);
  std::filesystem::remove_all(dir);

  if (once != twice || once.state != activity_state::WORK || once.message != "X") {
    return fail("test_repeated_submit_is_idempotent", "second identical submit must not change the effective state");
  }
  return 0;
}

int test_file_store_detects_corruption() {
  const auto dir = fresh_dir("corrupt");
  const auto path = dir / "state.json";
  FileStatusStore store(path);

  const char* payloads[] = {"", "{\"state\": \"work\", \"mess", "not json at all", R"({"state": "dance", "updated": 1})"};
  for (const char* payload : payloads) {
    write_raw(path, payload);
    const auto result = store.read();
    if (result.error != status_error::CORRUPT_STATE || result.absent) {
      std::filesystem::remove_all(dir);
      return fail("test_file_store_detects_corruption", "truncated or malformed file must read as corrupt");
    }
  }

  StatusWriter writer(store);
  if (writer.submit("think", "recovering", kT0) != status_error::NONE || !store.read().ok()) {
    std::filesystem::remove_all(dir);
    return fail("test_file_store_detects_corruption", "a new write must replace a corrupt record");
  }

  std::filesystem::remove_all(dir);
  return 0;
}

int test_file_store_unavailable_medium() {
  const auto dir = fresh_dir("unavailable");

  // The state path is a directory: opening works but reading does not.
  std::filesystem::create_directories(dir / "state.json");
  FileStatusStore directory_store(dir / "state.json");
  if (directory_store.read().error != status_error::STORE_UNAVAILABLE) {
    std::filesystem::remove_all(dir);
    return fail("test_file_store_unavailable_medium", "unreadable state path must be unavailable");
  }

  // The parent of the state path is a regular file.
  write_raw(dir / "blocker", "x");
  FileStatusStore blocked_store(dir / "blocker" / "state.json");
  StatusWriter writer(blocked_store);
  const auto error = writer.submit("work", "x", kT0);
  std::filesystem::remove_all(dir);

  if (error != status_error::STORE_UNAVAILABLE) {
    return fail("test_file_store_unavailable_medium", "write into an impossible path must fail as unavailable");
  }
  return 0;
}

int test_last_write_wins() {
  const auto dir = fresh_dir("last_write");
  FileStatusStore first(dir / "state.json");
  FileStatusStore second(dir / "state.json");

  (void)first.write(status_record{activity_state::WORK, "one", kT0});
  (void)second.write(status_record{activity_state::ALERT, "two", kT0 + std::chrono::seconds(1)});

  const auto result = first.read();
  std::filesystem::remove_all(dir);
  if (!result.ok() || result.record.state != activity_state::ALERT || result.record.message != "two") {
    return fail("test_last_write_wins", "the later write must replace the earlier one whole");
  }
  return 0;
}

int test_writer_caps_message_length() {
  const auto dir = fresh_dir("long_message");
  FileStatusStore store(dir / "state.json");
  StatusWriter writer(store);
  constexpr std::size_t kLimit = agent_presence::model::kMaxMessageBytes;

  const std::string long_message(5 * kLimit, 'x');
  if (writer.submit("work", long_message, kT0) != status_error::NONE) {
    std::filesystem::remove_all(dir);
    return fail("test_writer_caps_message_length", "oversized message must still be accepted");
  }
  const auto ascii = store.read();
  if (!ascii.ok() || ascii.record.message != long_message.substr(0, kLimit)) {
    std::filesystem::remove_all(dir);
    return fail("test_writer_caps_message_length", "stored message must be cut to the limit");
  }

  // 'a' then two-byte characters: the limit falls inside a character.
  std::string accented = "a";
  for (std::size_t i = 0; i < kLimit; ++i) {
    accented += "\xC3\xA9";
  }
  (void)writer.submit("think", accented, kT0);
  const auto multibyte = store.read();
  std::filesystem::remove_all(dir);
  if (!multibyte.ok() || multibyte.record.message.size() != kLimit - 1 ||
      multibyte.record.message != accented.substr(0, kLimit - 1)) {
    return fail("test_writer_caps_message_length", "cut must not split a UTF-8 character");
  }
  if (writer.last_submitted().message != multibyte.record.message) {
    return fail("test_writer_caps_message_length", "last_submitted must report the stored text");
  }
  return 0;
}

int test_store_stamps_missing_timestamp() {
  const auto dir = fresh_dir("stamp");
  FileStatusStore store(dir / "state.json");

  const auto before = wall_clock::now();
  const auto error = store.write(status_record{activity_state::ALERT, "unstamped", {}});
  const auto after = wall_clock::now();
  const auto result = store.read();
  std::filesystem::remove_all(dir);

  if (error != status_error::NONE || !result.ok()) {
    return fail("test_store_stamps_missing_timestamp", "write without timestamp must succeed");
  }
  if (result.record.updated_at < before - std::chrono::milliseconds(1) ||
      result.record.updated_at > after + std::chrono::milliseconds(1)) {
    return fail("test_store_stamps_missing_timestamp", "unset updated_at must be stamped with the write time");
  }
  return 0;
}

int test_reader_never_sees_partial_record() {
  const auto dir = fresh_dir("concurrent");
  const auto path = dir / "state.json";
  // Large enough that one record spans many write and read calls.
  const status_record first{activity_state::WORK, std::string(48 * 1024, 'a'), kT0};
  const status_record second{activity_state::THINK, std::string(64 * 1024, 'b'), kT0 + std::chrono::seconds(1)};

  FileStatusStore store(path);
  if (store.write(first) != status_error::NONE) {
    std::filesystem::remove_all(dir);
    return fail("test_reader_never_sees_partial_record", "initial write failed");
  }

  std::cout.flush();
  std::cerr.flush();
  const pid_t child = ::fork();
  if (child < 0) {
    std::filesystem::remove_all(dir);
    return fail("test_reader_never_sees_partial_record", "fork failed");
  }
  if (child == 0) {
    FileStatusStore writer_store(path);
    for (int i = 0; i < 200; ++i) {
      if (writer_store.write(i % 2 == 0 ? second : first) != status_error::NONE) {
        ::_exit(2);
      }
    }
    ::_exit(0);
  }

  bool consistent = true;
  bool child_done = false;
  int child_status = 0;
  while (!child_done) {
    const auto result = store.read();
    const bool whole_first = result.record.state == first.state && result.record.message == first.message;
    const bool whole_second = result.record.state == second.state && result.record.message == second.message;
    if (!result.ok() || !(whole_first || whole_second)) {
      consistent = false;
      break;
    }
    child_done = ::waitpid(child, &child_status, WNOHANG) == child;
  }
  if (!child_done) {
    ::waitpid(child, &child_status, 0);
  }
  std::filesystem::remove_all(dir);

  if (!consistent) {
    return fail("test_reader_never_sees_partial_record", "concurrent read returned a torn or mixed record");
  }
  if (!WIFEXITED(child_status) || WEXITSTATUS(child_status) != 0) {
    return fail("test_reader_never_sees_partial_record", "writer process failed");
  }
  return 0;
}

int test_redis_store_set_get() {
  g_redis_mock = RedisMockState{};
  RedisStoreOptions options{};
  options.unix_socket = "/tmp/agent_presence_test_redis.sock";
  options.key = "test:presence";
  RedisStatusStore store(options);

  if (!store.read().absent) {
    return fail("test_redis_store_set_get", "missing key must read as absent");
  }
  if (g_redis_mock.last_socket != "/tmp/agent_presence_test_redis.sock") {
    return fail("test_redis_store_set_get", "store must connect through the configured unix socket");
  }

  StatusWriter writer(store);
  if (writer.submit("work", "deploying", kT0) != status_error::NONE) {
    return fail("test_redis_store_set_get", "SET must succeed");
  }
  if (g_redis_mock.last_argv.size() != 3 || g_redis_mock.last_argv[0] != "SET" ||
      g_redis_mock.last_argv[1] != "test:presence") {
    return fail("test_redis_store_set_get", "write must issue SET on the configured key");
  }

  const auto result = store.read();
  if (!result.ok() || !same_record(result.record, status_record{activity_state::WORK, "deploying", kT0})) {
    return fail("test_redis_store_set_get", "GET must return the stored record");
  }

  g_redis_mock.keys["test:presence"] = "{\"state\":";
  if (store.read().error != status_error::CORRUPT_STATE) {
    return fail("test_redis_store_set_get", "unparsable value must read as corrupt");
  }

  return 0;
}

int test_redis_store_connection_failures() {
  g_redis_mock = RedisMockState{};
  g_redis_mock.fail_connect = true;
  RedisStatusStore store{};

  if (store.check_connectivity()) {
    return fail("test_redis_store_connection_failures", "refused connection must report not connected");
  }
  if (store.read().error != status_error::STORE_UNAVAILABLE) {
    return fail("test_redis_store_connection_failures", "read without connection must be unavailable");
  }
  StatusWriter writer(store);
  if (writer.submit("idle", "", kT0) != status_error::STORE_UNAVAILABLE) {
    return fail("test_redis_store_connection_failures", "write without connection must be unavailable");
  }

  g_redis_mock.fail_connect = false;
  g_redis_mock.drop_next_reply = true;
  if (writer.submit("think", "retry", kT0) != status_error::NONE) {
    return fail("test_redis_store_connection_failures", "write must retry once on a fresh connection");
  }
  if (g_redis_mock.command_argv_calls != 2) {
    return fail("test_redis_store_connection_failures", "expected exactly one retry");
  }
  return 0;
}

int test_make_status_store_selects_backend() {
  PresenceConfig config{};
  config.base_dir = "/tmp/agent_presence_cfg";
  auto file_store = agent_presence::store::make_status_store(config);
  if (std::string(file_store->name()) != "file") {
    return fail("test_make_status_store_selects_backend", "default backend must be the file store");
  }
  const auto* as_file = dynamic_cast<FileStatusStore*>(file_store.get());
  if (as_file == nullptr || as_file->path() != std::filesystem::path("/tmp/agent_presence_cfg/state.json")) {
    return fail("test_make_status_store_selects_backend", "relative store path must resolve against the config dir");
  }

  config.store.redis.enabled = true;
  config.store.redis.unix_socket = "/run/redis/redis.sock";
  auto redis_store = agent_presence::store::make_status_store(config);
  if (std::string(redis_store->name()) != "redis") {
    return fail("test_make_status_store_selects_backend", "redis address must select the redis backend");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_codec_accepts_and_rejects(); rc != 0) return rc;
  if (int rc = test_file_store_absent_before_first_write(); rc != 0) return rc;
  if (int rc = test_writer_round_trip_every_state(); rc != 0) return rc;
  if (int rc = test_writer_normalizes_input(); rc != 0) return rc;
  if (int rc = test_invalid_state_leaves_store_unchanged(); rc != 0) return rc;
  if (int rc = test_repeated_submit_is_idempotent(); rc != 0) return rc;
  if (int rc = test_file_store_detects_corruption(); rc != 0) return rc;
  if (int rc = test_file_store_unavailable_medium(); rc != 0) return rc;
  if (int rc = test_last_write_wins(); rc != 0) return rc;
  if (int rc = test_writer_caps_message_length(); rc != 0) return rc;
  if (int rc = test_store_stamps_missing_timestamp(); rc != 0) return rc;
  if (int rc = test_reader_never_sees_partial_record(); rc != 0) return rc;
  if (int rc = test_redis_store_set_get(); rc != 0) return rc;
  if (int rc = test_redis_store_connection_failures(); rc != 0) return rc;
  if (int rc = test_make_status_store_selects_backend(); rc != 0) return rc;

  std::cout << "[PASS] store unit tests\n";
  return 0;
}
