#pragma once
/*
================================================================================
Fragment 5.2 — Decision: Explainability (Deterministic Rationale)
FILE: cpp/riskgate/decision/explainability.hpp

One statement per computation step, always in this order:
  LIKELIHOOD, IMPACT, AGGREGATE, CLASSIFY, DECIDE, OVERRIDE

Determinism:
  - Statements depend only on (input, intermediate values, policy).
  - Numbers are formatted with the classic "C" locale, 6 significant digits.
  - No clocks, no addresses, no unordered containers.
================================================================================
*/

#include "riskgate/decision/decision_rules.hpp"
#include "riskgate/model/risk_input.hpp"
#include "riskgate/model/risk_types.hpp"
#include "riskgate/policy/policy.hpp"
#include "riskgate/scoring/classifier.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace riskgate {

enum class RationaleStage : std::uint8_t {
  Likelihood = 0,
  Impact     = 1,
  Aggregate  = 2,
  Classify   = 3,
  Decide     = 4,
  Override   = 5,
};

const char* to_string(RationaleStage s) noexcept;

struct RationaleStep {
  RationaleStage stage = RationaleStage::Likelihood;
  std::string statement;

  bool operator==(const RationaleStep& o) const noexcept {
    return stage == o.stage && statement == o.statement;
  }
  bool operator!=(const RationaleStep& o) const noexcept { return !(*this == o); }
};

using DecisionRationale = std::vector<RationaleStep>;

DecisionRationale explain(const RiskInput& input,
                          const NormalizedScore& normalized,
                          double overall,
                          const BandMatch& band,
                          const DecisionOutcome& decision,
                          const PolicyConfig& policy);

// "1. [LIKELIHOOD] ...\n2. [IMPACT] ...\n" — stable, diffable.
std::string render_rationale_text(const DecisionRationale& r);

// Locale-independent number text used by the rationale: the shortest form
// (at least 6 significant digits tried first) that parses back exactly.
std::string format_number(double v);

}  // namespace riskgate
