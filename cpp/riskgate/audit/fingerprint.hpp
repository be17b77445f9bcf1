#pragma once
/*
================================================================================
Fragment 6.1 — Audit: Input Fingerprint (Canonical SHA-256 of RiskInput)
FILE: cpp/riskgate/audit/fingerprint.hpp

Purpose:
  - Audit identity key for a RiskInput (NOT a scoring-equivalence key).

Canonical form ("RiskInput/v1"):
  - Tagged sections, fixed field order, length-delimited strings, LE integers.
  - impact.domains in enum order (std::set), likelihood.signals sorted.
  - Every field participates, including confidence, which never affects scoring.
================================================================================
*/

#include "riskgate/core/hashing.hpp"
#include "riskgate/model/risk_input.hpp"

#include <string>

namespace riskgate {

Digest256 fingerprint(const RiskInput& input);

// 64 lowercase hex chars.
std::string fingerprint_hex(const RiskInput& input);

}  // namespace riskgate
