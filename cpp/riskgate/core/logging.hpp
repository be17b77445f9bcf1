#pragma once
/*
===========================================================
Fragment 1.1 — Core: Logging
FILE: cpp/riskgate/core/logging.hpp
===========================================================
Purpose:
  - Minimal, dependency-free logging used by every pipeline stage.
  - Centralizes stdout/stderr policy.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation).
  - Log output never feeds back into a computed value.
===========================================================
*/

#include <string>

namespace riskgate {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

LogLevel get_log_level() noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

}  // namespace riskgate
