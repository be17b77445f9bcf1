#include "riskgate/decision/decision_rules.hpp"

#include "riskgate/core/error.hpp"

#include <algorithm>
#include <cctype>

namespace riskgate {

namespace {

bool is_blank(const std::string& s) {
  return std::all_of(s.begin(), s.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

TieBreakDefaults tie_break_defaults(const PolicyConfig& policy) {
  TieBreakDefaults d;
  d.high = policy.high_default;
  d.critical = policy.critical_default;
  return d;
}

Decision baseline_decision(RiskCategory category, const TieBreakDefaults& defaults) {
  switch (category) {
    case RiskCategory::Low:    return Decision::Accept;
    case RiskCategory::Medium: return Decision::Reduce;
    case RiskCategory::High:
      RISKGATE_ENSURE(defaults.high == Decision::Reduce || defaults.high == Decision::Mitigate,
                      ErrorCode::kInvalidPolicy, "High tie-break must be REDUCE or MITIGATE");
      return defaults.high;
    case RiskCategory::Critical:
      RISKGATE_ENSURE(defaults.critical == Decision::Stop || defaults.critical == Decision::Escalate,
                      ErrorCode::kInvalidPolicy, "Critical tie-break must be STOP or ESCALATE");
      return defaults.critical;
    default:
      RISKGATE_THROW(ErrorCode::kInternalInvariant, "unknown risk category");
  }
}

void validate_override(const Override& ov) {
  RISKGATE_ENSURE(!is_blank(ov.justification), ErrorCode::kInvalidOverride,
                  std::string("override to ") + to_string(ov.value) + " has no justification");
  RISKGATE_ENSURE(static_cast<int>(ov.value) <= static_cast<int>(Decision::Escalate),
                  ErrorCode::kInvalidOverride, "override holds an unknown decision");
}

DecisionOutcome decide(RiskCategory category,
                       const TieBreakDefaults& defaults,
                       const std::optional<Override>& ov) {
  // Reject a bad override before computing anything.
  if (ov) validate_override(*ov);

  DecisionOutcome out;
  out.computed = baseline_decision(category, defaults);
  out.tie_break_applied = (category == RiskCategory::High || category == RiskCategory::Critical);
  out.applied = out.computed;

  if (ov) {
    out.applied = ov->value;
    out.override_justification = ov->justification;
  }
  return out;
}

}  // namespace riskgate
