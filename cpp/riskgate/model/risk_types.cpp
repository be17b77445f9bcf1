#include "riskgate/model/risk_types.hpp"

namespace riskgate {

const char* to_string(LikelihoodBasis v) noexcept {
  switch (v) {
    case LikelihoodBasis::HistoricalData:  return "historical_data";
    case LikelihoodBasis::MeasuredData:    return "measured_data";
    case LikelihoodBasis::ExpertJudgement: return "expert_judgement";
    case LikelihoodBasis::Assumption:      return "assumption";
    default:                               return "unknown";
  }
}

const char* to_string(ImpactDomain v) noexcept {
  switch (v) {
    case ImpactDomain::Financial:         return "financial";
    case ImpactDomain::LegalOrCompliance: return "legal_or_compliance";
    case ImpactDomain::Operational:       return "operational";
    case ImpactDomain::Safety:            return "safety";
    case ImpactDomain::Reputation:        return "reputation";
    case ImpactDomain::Strategic:         return "strategic";
    default:                              return "unknown";
  }
}

const char* to_string(Reversibility v) noexcept {
  switch (v) {
    case Reversibility::Fully:         return "fully";
    case Reversibility::Partially:     return "partially";
    case Reversibility::NotReversible: return "not_reversible";
    default:                           return "unknown";
  }
}

const char* to_string(AcceptabilityHint v) noexcept {
  switch (v) {
    case AcceptabilityHint::Yes:                 return "yes";
    case AcceptabilityHint::No:                  return "no";
    case AcceptabilityHint::OnlyUnderConditions: return "only_under_conditions";
    default:                                     return "unknown";
  }
}

const char* to_string(RiskCategory v) noexcept {
  switch (v) {
    case RiskCategory::Low:      return "Low";
    case RiskCategory::Medium:   return "Medium";
    case RiskCategory::High:     return "High";
    case RiskCategory::Critical: return "Critical";
    default:                     return "Unknown";
  }
}

const char* to_string(Decision v) noexcept {
  switch (v) {
    case Decision::Accept:   return "ACCEPT";
    case Decision::Reduce:   return "REDUCE";
    case Decision::Mitigate: return "MITIGATE";
    case Decision::Stop:     return "STOP";
    case Decision::Escalate: return "ESCALATE";
    default:                 return "UNKNOWN";
  }
}

}  // namespace riskgate
