#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace muse::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::string ToIso8601(TimePoint tp) {
  const auto  ms   = ToUnixMillis(tp);
  std::time_t secs = static_cast<std::time_t>(ms / 1000);
  std::tm     utc{};
  gmtime_r(&secs, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << (ms % 1000) << 'Z';
  return out.str();
}

int LocalMinuteOfDay(TimePoint tp) {
  std::time_t secs = Clock::to_time_t(tp);
  std::tm     local{};
  localtime_r(&secs, &local);
  return local.tm_hour * 60 + local.tm_min;
}

int64_t UtcDayNumber(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::hours>(tp.time_since_epoch()).count() / 24;
}

} // namespace muse::util
