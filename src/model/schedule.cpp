#include "model/schedule.hpp"

namespace orchestra::model {

const char* to_string(const schedule_kind kind) noexcept {
  switch (kind) {
    case schedule_kind::ONE_TIME:
      return "one_time";
    case schedule_kind::RECURRING:
      return "recurring";
    case schedule_kind::CRON:
      return "cron";
  }
  return "unknown";
}

}  // namespace orchestra::model
