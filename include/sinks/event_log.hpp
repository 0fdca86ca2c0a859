#pragma once

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "bus/event_bus.hpp"
#include "model/event.hpp"

namespace orchestra::sinks {

// One line per lifecycle event on stdout.
class EventLogSink final : public bus::EventHandler {
 public:
  explicit EventLogSink(std::FILE* out = stdout);

  void on_event(const model::event& event) override;

  static const std::vector<std::string>& lifecycle_event_types();

 private:
  std::FILE* out_;
};

void attach_event_log(bus::EventBus& bus, const std::shared_ptr<EventLogSink>& sink);

}  // namespace orchestra::sinks
