#pragma once
/*
================================================================================
Fragment 4.1 — Scoring: Scorer (Raw Rating -> [0,1])
FILE: cpp/riskgate/scoring/scorer.hpp

Contract:
  - normalize(raw) = (raw - raw_min) / (raw_max - raw_min); baseline (raw - 1) / 4.
  - Pure, deterministic, monotonic, bijective over the legal raw values.
  - Out-of-domain raw -> ErrorCode::kInvalidInput. Never clamped.
  - Confidence is range-checked to [1,5] and otherwise untouched.
================================================================================
*/

#include "riskgate/model/risk_input.hpp"
#include "riskgate/model/risk_types.hpp"
#include "riskgate/policy/policy.hpp"

namespace riskgate {

// Baseline 1..5 scale.
double normalize(int raw);

double normalize(int raw, const ScaleSpec& scale);

void validate_confidence(int confidence, const char* field);

// All scalar and enum checks for one input. Runs before any scoring so an
// invalid input never yields a partial result.
void validate_input(const RiskInput& in, const PolicyConfig& policy);

// validate_input + normalize both dimensions.
NormalizedScore score(const RiskInput& in, const PolicyConfig& policy);

}  // namespace riskgate
