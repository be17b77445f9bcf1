#include "riskgate/scoring/scorer.hpp"

#include "riskgate/core/error.hpp"

#include <sstream>

namespace riskgate {

namespace {

ScaleSpec baseline_scale() {
  ScaleSpec s;
  s.raw_min = kRatingMin;
  s.raw_max = kRatingMax;
  return s;
}

void require_rating(int raw, const ScaleSpec& scale, const char* field) {
  if (raw < scale.raw_min || raw > scale.raw_max) {
    std::ostringstream oss;
    oss << field << "=" << raw << " outside [" << scale.raw_min << "," << scale.raw_max << "]";
    RISKGATE_THROW(ErrorCode::kInvalidInput, oss.str());
  }
}

template <class E>
void require_enum(E v, E last, const char* field) {
  RISKGATE_ENSURE(static_cast<int>(v) >= 0 && static_cast<int>(v) <= static_cast<int>(last),
                  ErrorCode::kInvalidInput, std::string(field) + " holds an unknown enumerator");
}

}  // namespace

double normalize(int raw) {
  return normalize(raw, baseline_scale());
}

double normalize(int raw, const ScaleSpec& scale) {
  scale.validate_or_throw("scale");
  require_rating(raw, scale, "raw");
  const double span = static_cast<double>(scale.raw_max) - static_cast<double>(scale.raw_min);
  return (static_cast<double>(raw) - static_cast<double>(scale.raw_min)) / span;
}

void validate_confidence(int confidence, const char* field) {
  if (confidence < kConfidenceMin || confidence > kConfidenceMax) {
    std::ostringstream oss;
    oss << (field ? field : "confidence") << "=" << confidence
        << " outside [" << kConfidenceMin << "," << kConfidenceMax << "]";
    RISKGATE_THROW(ErrorCode::kInvalidInput, oss.str());
  }
}

void validate_input(const RiskInput& in, const PolicyConfig& policy) {
  policy.likelihood_scale.validate_or_throw("likelihood_scale");
  policy.impact_scale.validate_or_throw("impact_scale");

  require_rating(in.likelihood.raw, policy.likelihood_scale, "likelihood.raw");
  require_rating(in.impact.raw_severity, policy.impact_scale, "impact.raw_severity");

  validate_confidence(in.likelihood.confidence, "likelihood.confidence");
  validate_confidence(in.impact.confidence, "impact.confidence");

  require_enum(in.likelihood.basis, LikelihoodBasis::Assumption, "likelihood.basis");
  require_enum(in.impact.reversibility, Reversibility::NotReversible, "impact.reversibility");
  require_enum(in.impact.acceptability_hint, AcceptabilityHint::OnlyUnderConditions,
               "impact.acceptability_hint");
  for (const auto d : in.impact.domains) {
    require_enum(d, ImpactDomain::Strategic, "impact.domains");
  }
}

NormalizedScore score(const RiskInput& in, const PolicyConfig& policy) {
  validate_input(in, policy);

  NormalizedScore s;
  s.likelihood_norm = normalize(in.likelihood.raw, policy.likelihood_scale);
  s.impact_norm = normalize(in.impact.raw_severity, policy.impact_scale);
  return s;
}

}  // namespace riskgate
