#pragma once
/*
================================================================================
Fragment 6.2 — Audit: Sealed AuditRecord (Immutable, Versioned)
FILE: cpp/riskgate/audit/audit_record.hpp

Purpose:
  - Bind policy_version, one UTC timestamp, the input hash and the full
    evaluation snapshot into a single value that cannot be edited.

Immutability (type level):
  - Only seal() constructs a record (private default constructor).
  - All accessors are const; copy/move assignment are deleted and there is no
    move constructor, so a record can be copied but never overwritten or
    hollowed out.
  - A correction or a policy change means a NEW record.

Seal integrity:
  - seal() re-derives every intermediate value from (input, policy) and refuses
    (kInternalInvariant) if the supplied values disagree. No partially
    populated record is ever returned.
  - sealed_at is rebuilt from its epoch; the caller's text is never stored.
================================================================================
*/

#include "riskgate/core/utc_time.hpp"
#include "riskgate/decision/decision_rules.hpp"
#include "riskgate/decision/explainability.hpp"
#include "riskgate/model/risk_input.hpp"
#include "riskgate/model/risk_types.hpp"
#include "riskgate/policy/policy.hpp"
#include "riskgate/scoring/classifier.hpp"

#include <optional>
#include <string>

namespace riskgate {

class AuditRecord;

AuditRecord seal(const PolicyConfig& policy,
                 const RiskInput& input,
                 const NormalizedScore& normalized,
                 double overall,
                 const BandMatch& band,
                 const DecisionOutcome& decision,
                 const DecisionRationale& rationale,
                 const UtcTimestamp& sealed_at);

class AuditRecord final {
 public:
  AuditRecord(const AuditRecord&) = default;
  AuditRecord& operator=(const AuditRecord&) = delete;
  AuditRecord& operator=(AuditRecord&&) = delete;
  ~AuditRecord() = default;

  const std::string& policy_version() const noexcept { return policy_version_; }
  const std::string& policy_hash() const noexcept { return policy_hash_; }
  const UtcTimestamp& sealed_at() const noexcept { return sealed_at_; }
  const std::string& input_hash() const noexcept { return input_hash_; }

  const RiskInput& input() const noexcept { return input_; }
  const NormalizedScore& normalized() const noexcept { return normalized_; }
  double overall() const noexcept { return overall_; }
  const BandMatch& band() const noexcept { return band_; }
  RiskCategory category() const noexcept { return band_.category; }

  Decision computed_decision() const noexcept { return computed_; }
  Decision applied_decision() const noexcept { return applied_; }
  bool tie_break_applied() const noexcept { return tie_break_applied_; }
  const std::optional<std::string>& override_justification() const noexcept { return override_justification_; }
  bool overridden() const noexcept { return override_justification_.has_value(); }

  const DecisionRationale& rationale() const noexcept { return rationale_; }

  // Digest over every field above, timestamp included.
  const std::string& seal_hash() const noexcept { return seal_hash_; }

 private:
  AuditRecord() = default;

  friend AuditRecord seal(const PolicyConfig&, const RiskInput&, const NormalizedScore&, double,
                          const BandMatch&, const DecisionOutcome&, const DecisionRationale&,
                          const UtcTimestamp&);

  std::string policy_version_;
  std::string policy_hash_;
  UtcTimestamp sealed_at_;
  std::string input_hash_;

  RiskInput input_;
  NormalizedScore normalized_;
  double overall_ = 0.0;
  BandMatch band_;

  Decision computed_ = Decision::Accept;
  Decision applied_ = Decision::Accept;
  bool tie_break_applied_ = false;
  std::optional<std::string> override_justification_;

  DecisionRationale rationale_;

  std::string seal_hash_;
};

// Captures utc_now() exactly once, then seals.
AuditRecord seal_now(const PolicyConfig& policy,
                     const RiskInput& input,
                     const NormalizedScore& normalized,
                     double overall,
                     const BandMatch& band,
                     const DecisionOutcome& decision,
                     const DecisionRationale& rationale);

}  // namespace riskgate
