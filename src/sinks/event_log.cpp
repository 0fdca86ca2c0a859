#include "sinks/event_log.hpp"

#include "core/timestamp.hpp"

namespace orchestra::sinks {

EventLogSink::EventLogSink(std::FILE* out) : out_(out) {}

const std::vector<std::string>& EventLogSink::lifecycle_event_types() {
  static const std::vector<std::string> kTypes = {
      model::event_types::kTaskCreated,   model::event_types::kTaskStateChanged,
      model::event_types::kTaskCancelled, model::event_types::kTaskScheduled,
      model::event_types::kTaskDispatched, model::event_types::kTaskExecuted,
  };
  return kTypes;
}

void EventLogSink::on_event(const model::event& event) {
  const auto timestamp_ms = event.timestamp.has_value() ? core::to_unix_ms(*event.timestamp) : 0;
  std::fprintf(out_, "[event] ts_ms=%lld type=%s priority=%s source=%s data=%s\n",
               static_cast<long long>(timestamp_ms), event.type.c_str(), model::to_string(event.priority),
               event.source.value_or("-").c_str(), event.data.dump().c_str());
  std::fflush(out_);
}

void attach_event_log(bus::EventBus& bus, const std::shared_ptr<EventLogSink>& sink) {
  for (const auto& type : EventLogSink::lifecycle_event_types()) {
    bus.subscribe(type, sink);
  }
}

}  // namespace orchestra::sinks
