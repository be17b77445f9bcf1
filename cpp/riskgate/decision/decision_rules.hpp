#pragma once
/*
================================================================================
Fragment 5.1 — Decision: Category -> Decision (+ Human Override)
FILE: cpp/riskgate/decision/decision_rules.hpp

Baseline mapping (pure function of category + tie-break configuration):
  Low      -> ACCEPT
  Medium   -> REDUCE
  High     -> TieBreakDefaults::high      (REDUCE | MITIGATE)
  Critical -> TieBreakDefaults::critical  (STOP | ESCALATE)

Override:
  - Requires a justification that is non-empty after trimming whitespace,
    else kInvalidOverride.
  - Sets `applied`; `computed` always keeps the baseline.
  - Nothing is remembered between calls.
================================================================================
*/

#include "riskgate/model/risk_types.hpp"
#include "riskgate/policy/policy.hpp"

#include <optional>
#include <string>

namespace riskgate {

struct TieBreakDefaults {
  Decision high = Decision::Mitigate;
  Decision critical = Decision::Escalate;
};

TieBreakDefaults tie_break_defaults(const PolicyConfig& policy);

struct Override {
  Decision value = Decision::Reduce;
  std::string justification;
};

struct DecisionOutcome {
  Decision computed = Decision::Accept;
  Decision applied = Decision::Accept;

  // True when `computed` came from a policy tie-break (High / Critical).
  bool tie_break_applied = false;

  // Set only when an override was supplied and accepted.
  std::optional<std::string> override_justification;

  bool overridden() const noexcept { return override_justification.has_value(); }
};

// Baseline mapping only.
Decision baseline_decision(RiskCategory category, const TieBreakDefaults& defaults);

// Throws kInvalidOverride for a missing justification.
void validate_override(const Override& ov);

DecisionOutcome decide(RiskCategory category,
                       const TieBreakDefaults& defaults,
                       const std::optional<Override>& ov = std::nullopt);

}  // namespace riskgate
