#pragma once
/*
================================================================================
Fragment 1.2 — Core: Error Codes + Exception (Engine-Wide)
FILE: cpp/riskgate/core/error.hpp

Purpose:
  - One exception type for every failure the pipeline can raise.
  - Stable numeric codes so callers can branch by category:
      * kInvalidInput      -> caller supplied a bad rating/confidence/structure
      * kInvalidOverride   -> override without justification
      * kInvalidPolicy     -> malformed policy configuration
      * kInternalInvariant -> upstream defect (never clamped, never recovered)
      * kInvalidTransition -> evaluation stage called out of order
      * kNotComparable     -> cross-version comparison (result code, not thrown)
      * kCrypto            -> digest backend failure

Hardening:
  - Includes code + file/line/function for auditability.
  - Keep numeric values stable once public.
================================================================================
*/

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace riskgate {

enum class ErrorCode : int {
  kOk                = 0,
  kInvalidInput      = 1,
  kInvalidOverride   = 2,
  kInvalidPolicy     = 3,
  kInternalInvariant = 4,
  kInvalidTransition = 5,
  kNotComparable     = 6,
  kCrypto            = 7,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kOk:                return "Ok";
    case ErrorCode::kInvalidInput:      return "InvalidInput";
    case ErrorCode::kInvalidOverride:   return "InvalidOverride";
    case ErrorCode::kInvalidPolicy:     return "InvalidPolicy";
    case ErrorCode::kInternalInvariant: return "InternalInvariantViolation";
    case ErrorCode::kInvalidTransition: return "InvalidTransition";
    case ErrorCode::kNotComparable:     return "NotComparable";
    case ErrorCode::kCrypto:            return "Crypto";
    default:                            return "Unknown";
  }
}

class Error final : public std::runtime_error {
 public:
  Error(ErrorCode code,
        std::string message,
        const char* file,
        int line,
        const char* function)
      : std::runtime_error(build_what(code, message, file, line, function)),
        code_(code),
        message_(std::move(message)),
        file_(file ? file : ""),
        function_(function ? function : ""),
        line_(line) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  const std::string& file() const noexcept { return file_; }
  const std::string& function() const noexcept { return function_; }
  int line() const noexcept { return line_; }

 private:
  static std::string build_what(ErrorCode code,
                                const std::string& msg,
                                const char* file,
                                int line,
                                const char* func) {
    std::ostringstream oss;
    oss << "[riskgate::Error code=" << to_string(code) << "(" << static_cast<int>(code) << ")] "
        << msg;
    if (file && *file) {
      oss << " @ " << file << ":" << line;
      if (func && *func) oss << " (" << func << ")";
    }
    return oss.str();
  }

  ErrorCode code_;
  std::string message_;
  std::string file_;
  std::string function_;
  int line_;
};

[[noreturn]] inline void throw_error(ErrorCode code,
                                    std::string message,
                                    const char* file,
                                    int line,
                                    const char* function) {
  throw Error(code, std::move(message), file, line, function);
}

inline void ensure(bool ok,
                   ErrorCode code,
                   std::string message,
                   const char* file,
                   int line,
                   const char* function) {
  if (!ok) {
    throw_error(code, std::move(message), file, line, function);
  }
}

}  // namespace riskgate

#define RISKGATE_THROW(CODE, MSG) ::riskgate::throw_error((CODE), (MSG), __FILE__, __LINE__, __func__)
#define RISKGATE_ENSURE(EXPR, CODE, MSG) ::riskgate::ensure((EXPR), (CODE), (MSG), __FILE__, __LINE__, __func__)
