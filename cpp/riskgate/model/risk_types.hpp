#pragma once
/*
================================================================================
Fragment 2.1 — Model: Risk Enumerations + Intermediate Values
FILE: cpp/riskgate/model/risk_types.hpp

Notes:
  - Enum underlying values are hashed into fingerprints. Never renumber.
  - RiskCategory order is the ordinal order (Low < Medium < High < Critical).
================================================================================
*/

#include <cstdint>

namespace riskgate {

enum class LikelihoodBasis : std::uint8_t {
  HistoricalData   = 0,
  MeasuredData     = 1,
  ExpertJudgement  = 2,
  Assumption       = 3,
};

enum class ImpactDomain : std::uint8_t {
  Financial          = 0,
  LegalOrCompliance  = 1,
  Operational        = 2,
  Safety             = 3,
  Reputation         = 4,
  Strategic          = 5,
};

enum class Reversibility : std::uint8_t {
  Fully          = 0,
  Partially      = 1,
  NotReversible  = 2,
};

enum class AcceptabilityHint : std::uint8_t {
  Yes                  = 0,
  No                   = 1,
  OnlyUnderConditions  = 2,
};

enum class RiskCategory : std::uint8_t {
  Low      = 0,
  Medium   = 1,
  High     = 2,
  Critical = 3,
};

inline constexpr int kRiskCategoryCount = 4;

// Raw ratings and confidences share one fixed 1..5 scale.
inline constexpr int kRatingMin = 1;
inline constexpr int kRatingMax = 5;
inline constexpr int kConfidenceMin = 1;
inline constexpr int kConfidenceMax = 5;

enum class Decision : std::uint8_t {
  Accept   = 0,
  Reduce   = 1,
  Mitigate = 2,
  Stop     = 3,
  Escalate = 4,
};

// Scorer output. Both components lie in [0,1].
struct NormalizedScore {
  double likelihood_norm = 0.0;
  double impact_norm = 0.0;
};

const char* to_string(LikelihoodBasis v) noexcept;
const char* to_string(ImpactDomain v) noexcept;
const char* to_string(Reversibility v) noexcept;
const char* to_string(AcceptabilityHint v) noexcept;
const char* to_string(RiskCategory v) noexcept;
const char* to_string(Decision v) noexcept;

}  // namespace riskgate
