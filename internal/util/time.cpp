#include "time.hpp"

namespace registry::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixSeconds(TimePoint tp) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count());
}

} // namespace registry::util
