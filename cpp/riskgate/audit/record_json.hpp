#pragma once
/*
================================================================================
Fragment 6.4 — Audit: AuditRecord JSON Rendering
FILE: cpp/riskgate/audit/record_json.hpp

Purpose:
  - Deterministic JSON view of a sealed record for external export/persistence.
  - Fixed key order, fixed number formatting (6 decimals), escaped strings.
  - Produces a string only; writing it anywhere is the caller's job.
================================================================================
*/

#include "riskgate/audit/audit_record.hpp"

#include <string>

namespace riskgate {

struct JsonWriteOptions {
  bool pretty = true;
};

std::string audit_record_to_json(const AuditRecord& r, const JsonWriteOptions& opt = {});

}  // namespace riskgate
