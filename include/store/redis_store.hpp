#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "store/task_store.hpp"

struct redisContext;
struct redisReply;

namespace orchestra::store {

struct RedisStoreOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"orchestra"};
  std::uint32_t connect_timeout_ms{1000};
};

// Tasks live in a single hash "<key_prefix>:tasks" keyed by task id, each
// value the task's JSON document.
class RedisTaskStore final : public TaskStore {
 public:
  explicit RedisTaskStore(RedisStoreOptions options = {});
  ~RedisTaskStore() override;

  RedisTaskStore(const RedisTaskStore&) = delete;
  RedisTaskStore& operator=(const RedisTaskStore&) = delete;

  bool check_connectivity();

  core::Result<void> put(const model::task& task) override;
  core::Result<std::optional<model::task>> get(const std::string& id) override;
  core::Result<std::vector<model::task>> list() override;
  core::Result<void> remove(const std::string& id) override;

  [[nodiscard]] const std::string& hash_key() const noexcept { return hash_key_; }

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };
  struct ReplyDeleter {
    void operator()(redisReply* reply) const;
  };
  using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  ReplyPtr command(const std::vector<std::string>& args);
  ReplyPtr command_with_retry(const std::vector<std::string>& args);

  RedisStoreOptions options_;
  std::string hash_key_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::mutex mutex_;
  bool was_ok_{true};
};

}  // namespace orchestra::store
