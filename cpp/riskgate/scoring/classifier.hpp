#pragma once
/*
================================================================================
Fragment 4.3 — Scoring: Classifier (Overall Risk -> Category)
FILE: cpp/riskgate/scoring/classifier.hpp

Contract:
  - Bands come from policy (validated via validate_band_table), never hardcoded.
  - Band match is [low, high) except the top band, which is closed at 1.0.
  - overall outside [0,1] (or NaN) -> kInternalInvariant. Never clamped.
  - Result carries the matched bounds so the rationale can cite them.
================================================================================
*/

#include "riskgate/model/risk_types.hpp"
#include "riskgate/policy/policy.hpp"

#include <vector>

namespace riskgate {

struct BandMatch {
  RiskCategory category = RiskCategory::Low;
  double low = 0.0;
  double high = 0.0;
  bool closed_high = false;  // true only for the top band
};

BandMatch classify(double overall, const std::vector<Band>& bands);

inline BandMatch classify(double overall, const PolicyConfig& policy) {
  return classify(overall, policy.bands);
}

}  // namespace riskgate
