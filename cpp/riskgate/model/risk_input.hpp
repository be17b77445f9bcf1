#pragma once
/*
================================================================================
Fragment 2.2 — Model: RiskInput (Raw, Caller-Owned Snapshot)
FILE: cpp/riskgate/model/risk_input.hpp

Purpose:
  - The one record an external collaborator hands to the pipeline.
  - Field presence is the collaborator's job; scalar range checks are the
    Scorer's job (see scoring/scorer.hpp validate_input).

Rules:
  - Confidence fields are inert metadata. They are validated, fingerprinted and
    shown in the rationale, and never enter the scoring arithmetic.
  - Domains are a set; signals are canonicalized (sorted) by the fingerprint,
    so construction order never changes identity.
================================================================================
*/

#include "riskgate/model/risk_types.hpp"

#include <set>
#include <string>
#include <vector>

namespace riskgate {

struct LikelihoodInput {
  int raw = 1;         // 1..5
  int confidence = 1;  // 1..5, metadata only
  LikelihoodBasis basis = LikelihoodBasis::Assumption;
  std::vector<std::string> signals;
};

struct ImpactInput {
  std::set<ImpactDomain> domains;
  std::string worst_credible_outcome;
  Reversibility reversibility = Reversibility::Fully;
  int raw_severity = 1;  // 1..5
  int confidence = 1;    // 1..5, metadata only
  AcceptabilityHint acceptability_hint = AcceptabilityHint::OnlyUnderConditions;
};

struct RiskInput {
  LikelihoodInput likelihood;
  ImpactInput impact;
};

}  // namespace riskgate
