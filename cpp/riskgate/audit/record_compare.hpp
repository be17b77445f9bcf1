#pragma once
/*
================================================================================
Fragment 6.3 — Audit: Record Comparison (Same Policy Version Only)
FILE: cpp/riskgate/audit/record_compare.hpp

Rules:
  - Records sealed under different policy_version values are NOT comparable.
    This is a usage-level result (code == kNotComparable), not an exception;
    callers must branch on comparable().
  - The same holds for records whose version matches but whose policy hash does
    not: one version string, two configurations.
  - Otherwise every snapshot field is compared and differences are listed in a
    fixed field order. The timestamp (and the seal hash, which covers it) are
    reported separately so "same content, sealed twice" is easy to detect.
================================================================================
*/

#include "riskgate/audit/audit_record.hpp"
#include "riskgate/core/error.hpp"

#include <string>
#include <vector>

namespace riskgate {

struct FieldDiff {
  std::string field;
  std::string a;
  std::string b;
};

struct RecordComparison {
  ErrorCode code = ErrorCode::kOk;
  std::string message;

  std::vector<FieldDiff> diffs;  // content differences only
  bool sealed_at_differs = false;

  bool comparable() const noexcept { return code == ErrorCode::kOk; }
  bool same_content() const noexcept { return comparable() && diffs.empty(); }
};

RecordComparison compare(const AuditRecord& a, const AuditRecord& b);

}  // namespace riskgate
