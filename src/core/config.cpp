#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace orchestra::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string to_lower(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& value) {
  const std::string lower = to_lower(value);
  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

long long parse_positive(const std::string& key, const std::string& value) {
  const auto parsed = std::stoll(value);
  if (parsed <= 0) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  return parsed;
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = std::stoi(value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }

  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(OrchestraConfig& config, const std::string& key, const std::string& value) {
  if (key == "tick_rate_hz") {
    const auto hz = std::stoi(value);
    if (hz <= 0) {
      throw std::runtime_error("tick_rate_hz must be greater than 0");
    }

    if (hz > 1000) {
      throw std::runtime_error("tick_rate_hz must be less than or equal to 1000");
    }

    config.tick_interval = std::chrono::milliseconds(1000 / hz);
    return;
  }

  if (key == "orchestrator.workers") {
    const auto workers = parse_positive(key, value);
    if (workers > 256) {
      throw std::runtime_error("orchestrator.workers must be less than or equal to 256");
    }
    config.workers = static_cast<std::size_t>(workers);
    return;
  }

  if (key == "orchestrator.agent_timeout_ms") {
    const auto timeout_ms = std::stoll(value);
    if (timeout_ms < 0) {
      throw std::runtime_error("orchestrator.agent_timeout_ms must be greater than or equal to 0");
    }
    if (timeout_ms == 0) {
      config.agent_timeout.reset();
    } else {
      config.agent_timeout = std::chrono::milliseconds(timeout_ms);
    }
    return;
  }

  if (key == "tasks.max_retries") {
    const auto retries = std::stoi(value);
    if (retries < 0) {
      throw std::runtime_error("tasks.max_retries must be greater than or equal to 0");
    }
    config.max_retries = retries;
    return;
  }

  if (key == "tasks.cleanup_interval_s") {
    config.cleanup_interval = std::chrono::seconds(parse_positive(key, value));
    return;
  }

  if (key == "tasks.cleanup_max_age_h") {
    config.cleanup_max_age = std::chrono::hours(parse_positive(key, value));
    return;
  }

  if (key == "events.queue_capacity") {
    config.event_queue_capacity = static_cast<std::size_t>(parse_positive(key, value));
    return;
  }

  if (key == "events.stdout_debug") {
    config.stdout_events = parse_bool(value);
    return;
  }

  if (key == "store.backend") {
    const auto backend = to_lower(value);
    if (backend == "memory") {
      config.store.backend = StoreBackend::MEMORY;
    } else if (backend == "file") {
      config.store.backend = StoreBackend::FILE;
    } else if (backend == "redis") {
      config.store.backend = StoreBackend::REDIS;
    } else {
      throw std::runtime_error("store.backend must be one of memory, file, redis");
    }
    return;
  }

  if (key == "store.directory") {
    config.store.directory = value;
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.store.redis, value);
    return;
  }

  if (key == "redis.password") {
    config.store.redis.password = value;
    return;
  }

  if (key == "redis.db") {
    const auto db = std::stoi(value);
    if (db < 0) {
      throw std::runtime_error("redis.db must be greater than or equal to 0");
    }
    config.store.redis.db = db;
    return;
  }

  if (key == "redis.key_prefix") {
    config.store.redis.key_prefix = value;
  }
}

}  // namespace

const char* to_string(const StoreBackend backend) noexcept {
  switch (backend) {
    case StoreBackend::MEMORY:
      return "memory";
    case StoreBackend::FILE:
      return "file";
    case StoreBackend::REDIS:
      return "redis";
  }
  return "unknown";
}

OrchestraConfig load_orchestra_config(const std::string& path) {
  OrchestraConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  return config;
}

}  // namespace orchestra::core
