#pragma once
/*
================================================================================
Fragment 3.1 — Policy: Versioned Evaluation Policy (Validated, Immutable)
FILE: cpp/riskgate/policy/policy.hpp

Purpose:
  - Centralize every policy choice the pipeline depends on into one validated
    value, identified by policy_version:
      * normalization scale per dimension (linear (raw - raw_min)/(raw_max - raw_min))
      * aggregation operator (Product)
      * classification band table (four contiguous bands over [0,1])
      * High / Critical tie-break defaults
      * acceptance escalation threshold + authority matrix (advisory only)

Why this exists:
  - Evaluations must be reproducible across time. ANY change here must come with
    a new policy_version, and changes the policy fingerprint.

Hardening:
  - validate_or_throw() rejects gaps, overlaps, inversions, non-finite bounds and
    tie-break defaults outside their admissible pair.
  - There is no global "active" policy: callers pass one into every evaluation,
    and an Evaluation keeps its own copy.
================================================================================
*/

#include "riskgate/core/hashing.hpp"
#include "riskgate/model/risk_types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace riskgate {

// ----------------------------- Scale -----------------------------------------
struct ScaleSpec {
  int raw_min = 1;
  int raw_max = 5;

  // Optional human labels, one per raw value (raw_min first). Empty = none.
  std::vector<std::string> labels;

  void validate_or_throw(const char* scale_name) const;

  // nullptr when no labels are configured.
  const std::string* label_for(int raw) const noexcept;
};

// ----------------------------- Aggregation -----------------------------------
enum class AggregationOp : std::uint8_t {
  Product = 0,
};

const char* to_string(AggregationOp op) noexcept;

// ----------------------------- Bands -----------------------------------------
// Half-open [low, high); the top band is closed at 1.0.
struct Band {
  RiskCategory category = RiskCategory::Low;
  double low = 0.0;
  double high = 0.0;
};

// ----------------------------- Authority -------------------------------------
struct AuthorityLimit {
  std::string role;
  double max_overall_to_accept = 0.0;
};

// ----------------------------- PolicyConfig ----------------------------------
struct PolicyConfig {
  std::string policy_version;

  ScaleSpec likelihood_scale;
  ScaleSpec impact_scale;

  AggregationOp aggregation = AggregationOp::Product;

  // Ascending, one per category, Low..Critical.
  std::vector<Band> bands;

  Decision high_default = Decision::Mitigate;      // REDUCE | MITIGATE
  Decision critical_default = Decision::Escalate;  // STOP | ESCALATE

  // Accepting a risk whose overall score is >= this needs escalation.
  double acceptance_escalation_threshold = 1.0;
  std::vector<AuthorityLimit> authority_matrix;

  void validate_or_throw() const;
};

// Check band table totality/order on its own (also called by validate_or_throw).
void validate_band_table(const std::vector<Band>& bands);

// The single named baseline ("v1"). Band edges 0.2 / 0.4 / 0.7,
// High -> MITIGATE, Critical -> ESCALATE.
PolicyConfig baseline_policy_v1();

// Canonical digest over every policy field.
Digest256 policy_fingerprint(const PolicyConfig& p);
std::string policy_fingerprint_hex(const PolicyConfig& p);

}  // namespace riskgate
