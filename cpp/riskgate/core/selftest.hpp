#pragma once
/*
  Fragment 1.6 — Framework-Free Selftest Helpers

  Shared by the *_selftest.cpp executables. Each check prints "[ OK ]" or
  "[FAIL]" to stderr; selftest_exit_code() is non-zero when anything failed.
  No Catch2/GoogleTest dependency.
*/

#include "riskgate/core/error.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>

namespace riskgate::selftest {

inline int g_fail_count = 0;

inline void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

inline void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

inline void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

inline void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

inline void expect_near(double got, double exp, double tol, std::string_view msg) {
  if (!(std::fabs(got - exp) <= tol)) {
    fail(msg);
    std::cerr << "  got " << got << ", expected " << exp << "\n";
  } else {
    pass(msg);
  }
}

inline void expect_contains(const std::string& hay, std::string_view needle, std::string_view msg) {
  if (hay.find(needle) == std::string::npos) {
    fail(msg);
    std::cerr << "  missing: " << needle << "\n";
    std::cerr << "  in:      " << hay << "\n";
  } else {
    pass(msg);
  }
}

// fn must throw riskgate::Error with `code`.
template <class Fn>
void expect_error(ErrorCode code, Fn&& fn, std::string_view msg) {
  try {
    fn();
  } catch (const Error& e) {
    if (e.code() == code) {
      pass(msg);
    } else {
      fail(msg);
      std::cerr << "  wrong code: " << to_string(e.code()) << " (expected " << to_string(code) << ")\n";
    }
    return;
  }
  fail(msg);
  std::cerr << "  no error thrown (expected " << to_string(code) << ")\n";
}

inline int selftest_exit_code() {
  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}

}  // namespace riskgate::selftest
