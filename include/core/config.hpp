#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace orchestra::core {

enum class StoreBackend : std::uint8_t { MEMORY, FILE, REDIS };

const char* to_string(StoreBackend backend) noexcept;

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"orchestra"};
};

struct StoreConfig {
  StoreBackend backend{StoreBackend::MEMORY};
  std::string directory{"task_storage"};
  RedisConfig redis{};
};

struct OrchestraConfig {
  std::chrono::milliseconds tick_interval{100};
  std::size_t workers{5};
  std::optional<std::chrono::milliseconds> agent_timeout{};
  int max_retries{3};
  std::chrono::seconds cleanup_interval{std::chrono::hours(1)};
  std::chrono::hours cleanup_max_age{24 * 7};
  std::size_t event_queue_capacity{1000};
  bool stdout_events{true};
  StoreConfig store{};
};

// Throws std::runtime_error naming the offending key on invalid values.
OrchestraConfig load_orchestra_config(const std::string& path);

}  // namespace orchestra::core
