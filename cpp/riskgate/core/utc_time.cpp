#include "riskgate/core/utc_time.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace riskgate {

UtcTimestamp utc_from_epoch_ms(std::int64_t epoch_ms) {
  // Floor division so pre-epoch values still render a valid millisecond field.
  std::int64_t secs = epoch_ms / 1000;
  std::int64_t ms = epoch_ms % 1000;
  if (ms < 0) {
    ms += 1000;
    secs -= 1;
  }

  const std::time_t tt = static_cast<std::time_t>(secs);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
      << "." << std::setw(3) << std::setfill('0') << ms << "Z";

  UtcTimestamp out;
  out.epoch_ms = epoch_ms;
  out.iso8601 = oss.str();
  return out;
}

UtcTimestamp utc_now() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
  return utc_from_epoch_ms(static_cast<std::int64_t>(ms));
}

}  // namespace riskgate
