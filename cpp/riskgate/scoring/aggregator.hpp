#pragma once
/*
================================================================================
Fragment 4.2 — Scoring: Aggregator (Two Dimensions -> Overall Risk)
FILE: cpp/riskgate/scoring/aggregator.hpp

Contract:
  - overall = likelihood_norm * impact_norm.
  - Zero in either dimension forces zero; 1.0 only when both are 1.0.
  - No weighting, no confidence adjustment, no clamping.
  - Inputs outside [0,1] are an upstream defect -> kInternalInvariant.
================================================================================
*/

#include "riskgate/model/risk_types.hpp"
#include "riskgate/policy/policy.hpp"

namespace riskgate {

double aggregate(double likelihood_norm, double impact_norm);

double aggregate(const NormalizedScore& s, AggregationOp op);

}  // namespace riskgate
