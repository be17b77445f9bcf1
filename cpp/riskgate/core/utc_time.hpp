#pragma once
/*
================================================================================
Fragment 1.3 — Core: UTC Timestamps
FILE: cpp/riskgate/core/utc_time.hpp

Purpose:
  - The single wall-clock read used by the engine (seal time + log stamps).
  - Millisecond resolution, rendered as ISO-8601 with a trailing 'Z'.
================================================================================
*/

#include <cstdint>
#include <string>

namespace riskgate {

struct UtcTimestamp {
  std::int64_t epoch_ms = 0;  // milliseconds since 1970-01-01T00:00:00Z
  std::string iso8601;        // "YYYY-MM-DDTHH:MM:SS.mmmZ"

  bool operator==(const UtcTimestamp& o) const noexcept {
    return epoch_ms == o.epoch_ms && iso8601 == o.iso8601;
  }
  bool operator!=(const UtcTimestamp& o) const noexcept { return !(*this == o); }
};

// Reads the system clock once.
UtcTimestamp utc_now();

// Deterministic conversion; used by tests and by utc_now().
UtcTimestamp utc_from_epoch_ms(std::int64_t epoch_ms);

}  // namespace riskgate
