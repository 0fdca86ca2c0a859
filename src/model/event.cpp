#include "model/event.hpp"

namespace orchestra::model {

const char* to_string(const event_priority priority) noexcept {
  switch (priority) {
    case event_priority::LOW:
      return "low";
    case event_priority::NORMAL:
      return "normal";
    case event_priority::HIGH:
      return "high";
    case event_priority::CRITICAL:
      return "critical";
  }
  return "unknown";
}

}  // namespace orchestra::model
