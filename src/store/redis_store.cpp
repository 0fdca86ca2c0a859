#include "store/redis_store.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace orchestra::store {
namespace {

core::Error redis_error(const std::string& what) {
  return core::make_error(core::ErrorKind::storage, "redis " + what);
}

bool is_error_reply(const redisReply* reply) {
  return reply == nullptr || reply->type == REDIS_REPLY_ERROR;
}

std::string reply_text(const redisReply* reply) {
  if (reply == nullptr || reply->str == nullptr) {
    return {};
  }
  return std::string(reply->str, reply->len);
}

core::Result<model::task> decode_task(const std::string& id, const std::string& document) {
  try {
    return nlohmann::json::parse(document).get<model::task>();
  } catch (const std::exception& ex) {
    return redis_error("malformed task " + id + " (" + ex.what() + ")");
  }
}

}  // namespace

RedisTaskStore::RedisTaskStore(RedisStoreOptions options)
    : options_(std::move(options)), hash_key_(options_.key_prefix + ":tasks") {}

RedisTaskStore::~RedisTaskStore() = default;

void RedisTaskStore::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

void RedisTaskStore::ReplyDeleter::operator()(redisReply* reply) const {
  if (reply != nullptr) {
    freeReplyObject(reply);
  }
}

bool RedisTaskStore::check_connectivity() {
  std::lock_guard<std::mutex> lock(mutex_);
  return ensure_connected();
}

bool RedisTaskStore::ensure_connected() {
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTaskStore::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate() || !select_db()) {
    context_.reset();
    return false;
  }
  return true;
}

bool RedisTaskStore::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  ReplyPtr reply(static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str())));
  if (is_error_reply(reply.get())) {
    std::cerr << "[redis] AUTH rejected\n";
    return false;
  }
  return true;
}

bool RedisTaskStore::select_db() {
  if (options_.db == 0) {
    return true;
  }

  ReplyPtr reply(static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db)));
  return !is_error_reply(reply.get());
}

RedisTaskStore::ReplyPtr RedisTaskStore::command(const std::vector<std::string>& args) {
  std::vector<const char*> argv;
  std::vector<std::size_t> argv_len;
  argv.reserve(args.size());
  argv_len.reserve(args.size());
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
    argv_len.push_back(arg.size());
  }

  return ReplyPtr(static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(argv.size()), argv.data(), argv_len.data())));
}

// Reconnects once when the connection dropped mid-command.
RedisTaskStore::ReplyPtr RedisTaskStore::command_with_retry(const std::vector<std::string>& args) {
  if (!ensure_connected()) {
    if (was_ok_) {
      std::cerr << "[redis] store unavailable\n";
      was_ok_ = false;
    }
    return nullptr;
  }

  auto reply = command(args);
  if (reply == nullptr) {
    if (!reconnect()) {
      was_ok_ = false;
      return nullptr;
    }
    reply = command(args);
  }

  if (reply != nullptr && !was_ok_) {
    std::cerr << "[redis] store recovered\n";
    was_ok_ = true;
  }
  return reply;
}

core::Result<void> RedisTaskStore::put(const model::task& task) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto reply = command_with_retry({"HSET", hash_key_, task.id, nlohmann::json(task).dump()});
  if (reply == nullptr) {
    return redis_error("unreachable on HSET " + task.id);
  }
  if (reply->type == REDIS_REPLY_ERROR) {
    return redis_error("HSET " + task.id + " rejected: " + reply_text(reply.get()));
  }
  return core::ok();
}

core::Result<std::optional<model::task>> RedisTaskStore::get(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto reply = command_with_retry({"HGET", hash_key_, id});
  if (reply == nullptr) {
    return redis_error("unreachable on HGET " + id);
  }
  if (reply->type == REDIS_REPLY_NIL) {
    return std::optional<model::task>{};
  }
  if (reply->type != REDIS_REPLY_STRING) {
    return redis_error("HGET " + id + " unexpected reply: " + reply_text(reply.get()));
  }

  auto decoded = decode_task(id, reply_text(reply.get()));
  if (!decoded) {
    return decoded.error();
  }
  return std::optional<model::task>{std::move(decoded).value()};
}

core::Result<std::vector<model::task>> RedisTaskStore::list() {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto reply = command_with_retry({"HGETALL", hash_key_});
  if (reply == nullptr) {
    return redis_error("unreachable on HGETALL");
  }
  if (reply->type != REDIS_REPLY_ARRAY) {
    return redis_error("HGETALL unexpected reply: " + reply_text(reply.get()));
  }

  std::vector<model::task> out;
  out.reserve(reply->elements / 2);
  for (std::size_t i = 0; i + 1 < reply->elements; i += 2) {
    const std::string id = reply_text(reply->element[i]);
    auto decoded = decode_task(id, reply_text(reply->element[i + 1]));
    if (!decoded) {
      std::cerr << "[redis] skipping " << core::describe(decoded.error()) << '\n';
      continue;
    }
    out.push_back(std::move(decoded).value());
  }
  return out;
}

core::Result<void> RedisTaskStore::remove(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto reply = command_with_retry({"HDEL", hash_key_, id});
  if (reply == nullptr) {
    return redis_error("unreachable on HDEL " + id);
  }
  if (reply->type == REDIS_REPLY_ERROR) {
    return redis_error("HDEL " + id + " rejected: " + reply_text(reply.get()));
  }
  return core::ok();
}

}  // namespace orchestra::store
