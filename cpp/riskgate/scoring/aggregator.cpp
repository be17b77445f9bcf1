#include "riskgate/scoring/aggregator.hpp"

#include "riskgate/core/error.hpp"

#include <cmath>
#include <sstream>

namespace riskgate {

namespace {

void require_unit(double x, const char* what) {
  if (!(std::isfinite(x) && x >= 0.0 && x <= 1.0)) {
    std::ostringstream oss;
    oss << "aggregator received " << what << "=" << x << " outside [0,1]";
    RISKGATE_THROW(ErrorCode::kInternalInvariant, oss.str());
  }
}

}  // namespace

double aggregate(double likelihood_norm, double impact_norm) {
  return aggregate(NormalizedScore{likelihood_norm, impact_norm}, AggregationOp::Product);
}

double aggregate(const NormalizedScore& s, AggregationOp op) {
  require_unit(s.likelihood_norm, "likelihood_norm");
  require_unit(s.impact_norm, "impact_norm");

  double overall = 0.0;
  switch (op) {
    case AggregationOp::Product:
      overall = s.likelihood_norm * s.impact_norm;
      break;
    default:
      RISKGATE_THROW(ErrorCode::kInternalInvariant, "unknown aggregation operator");
  }

  // Product of two unit values cannot leave [0,1]; a failure here is a defect.
  require_unit(overall, "overall");
  return overall;
}

}  // namespace riskgate
