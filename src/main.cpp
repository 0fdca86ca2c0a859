#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "agents/echo.hpp"
#include "core/config.hpp"
#include "core/runtime.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

}  // namespace

std::string format_config_settings(const orchestra::core::OrchestraConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[orchestra] loaded config from " << config_path
         << " | tick_interval_ms=" << config.tick_interval.count()
         << " | workers=" << config.workers
         << " | agent_timeout_ms=" << (config.agent_timeout.has_value() ? config.agent_timeout->count() : 0)
         << " | max_retries=" << config.max_retries
         << " | event_queue_capacity=" << config.event_queue_capacity
         << " | stdout_events=" << (config.stdout_events ? "true" : "false")
         << " | store=" << orchestra::core::to_string(config.store.backend);

  if (config.store.backend == orchestra::core::StoreBackend::FILE) {
    output << " | store_directory=" << config.store.directory;
  } else if (config.store.backend == orchestra::core::StoreBackend::REDIS) {
    output << " | redis_address=";
    if (!config.store.redis.unix_socket.empty()) {
      output << "unix://" << config.store.redis.unix_socket;
    } else {
      output << config.store.redis.host << ':' << config.store.redis.port;
    }
  }
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/orchestra.yaml";

  orchestra::core::OrchestraConfig config{};
  try {
    config = orchestra::core::load_orchestra_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  orchestra::core::Runtime runtime{config};
  runtime.orchestrator().register_agent("echo", std::make_shared<orchestra::agents::EchoAgent>(),
                                        config.agent_timeout);

  if (auto started = runtime.start(); !started) {
    std::cerr << "startup error: " << orchestra::core::describe(started.error()) << '\n';
    return 1;
  }

  while (g_shutdown_requested == 0) {
    runtime.run_for_ticks(1);
  }

  std::cerr << "[orchestra] shutdown signal received; exiting cleanly\n";
  runtime.stop();

  return 0;
}
