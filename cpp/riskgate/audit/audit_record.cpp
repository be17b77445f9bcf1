#include "riskgate/audit/audit_record.hpp"

#include "riskgate/audit/fingerprint.hpp"
#include "riskgate/core/error.hpp"
#include "riskgate/core/hashing.hpp"
#include "riskgate/core/logging.hpp"
#include "riskgate/scoring/aggregator.hpp"
#include "riskgate/scoring/scorer.hpp"

namespace riskgate {

namespace {

// Every supplied intermediate must be exactly what (input, policy) produce.
void verify_chain(const PolicyConfig& policy,
                  const RiskInput& input,
                  const NormalizedScore& normalized,
                  double overall,
                  const BandMatch& band,
                  const DecisionOutcome& decision,
                  const DecisionRationale& rationale) {
  const NormalizedScore n = score(input, policy);
  RISKGATE_ENSURE(n.likelihood_norm == normalized.likelihood_norm && n.impact_norm == normalized.impact_norm,
                  ErrorCode::kInternalInvariant, "seal: normalized score does not match input");

  const double o = aggregate(n, policy.aggregation);
  RISKGATE_ENSURE(o == overall, ErrorCode::kInternalInvariant, "seal: overall risk does not match normalized score");

  const BandMatch b = classify(o, policy);
  RISKGATE_ENSURE(b.category == band.category && b.low == band.low && b.high == band.high &&
                      b.closed_high == band.closed_high,
                  ErrorCode::kInternalInvariant, "seal: band match does not match overall risk");

  const Decision computed = baseline_decision(b.category, tie_break_defaults(policy));
  RISKGATE_ENSURE(computed == decision.computed, ErrorCode::kInternalInvariant,
                  "seal: computed decision does not match category");
  RISKGATE_ENSURE(decision.tie_break_applied ==
                      (b.category == RiskCategory::High || b.category == RiskCategory::Critical),
                  ErrorCode::kInternalInvariant, "seal: tie-break flag does not match category");

  if (decision.overridden()) {
    validate_override(Override{decision.applied, *decision.override_justification});
  } else {
    RISKGATE_ENSURE(decision.applied == decision.computed, ErrorCode::kInternalInvariant,
                    "seal: applied decision differs from computed without an override");
  }

  RISKGATE_ENSURE(rationale == explain(input, n, o, b, decision, policy), ErrorCode::kInternalInvariant,
                  "seal: rationale does not match the evaluation");
}

std::string compute_seal_hash(const AuditRecord& r) {
  Sha256Hasher h;
  h.update_tag("AuditRecord/v1");

  h.update_tag("Provenance");
  h.update_string(r.policy_version());
  h.update_string(r.policy_hash());
  h.update_i64(r.sealed_at().epoch_ms);
  h.update_string(r.sealed_at().iso8601);
  h.update_string(r.input_hash());

  h.update_tag("Scores");
  h.update_f64(r.normalized().likelihood_norm);
  h.update_f64(r.normalized().impact_norm);
  h.update_f64(r.overall());

  h.update_tag("Band");
  h.update_enum(r.band().category);
  h.update_f64(r.band().low);
  h.update_f64(r.band().high);
  h.update_bool(r.band().closed_high);

  h.update_tag("Decision");
  h.update_enum(r.computed_decision());
  h.update_enum(r.applied_decision());
  h.update_bool(r.tie_break_applied());
  h.update_bool(r.overridden());
  if (r.overridden()) h.update_string(*r.override_justification());

  h.update_tag("Rationale");
  h.update_u64(static_cast<std::uint64_t>(r.rationale().size()));
  for (const auto& step : r.rationale()) {
    h.update_enum(step.stage);
    h.update_string(step.statement);
  }

  return digest_to_hex(h.finish());
}

}  // namespace

AuditRecord seal(const PolicyConfig& policy,
                 const RiskInput& input,
                 const NormalizedScore& normalized,
                 double overall,
                 const BandMatch& band,
                 const DecisionOutcome& decision,
                 const DecisionRationale& rationale,
                 const UtcTimestamp& sealed_at) {
  policy.validate_or_throw();
  verify_chain(policy, input, normalized, overall, band, decision, rationale);

  AuditRecord r;
  r.policy_version_ = policy.policy_version;
  r.policy_hash_ = policy_fingerprint_hex(policy);
  r.sealed_at_ = utc_from_epoch_ms(sealed_at.epoch_ms);  // text always derived from the epoch
  r.input_hash_ = fingerprint_hex(input);

  r.input_ = input;
  r.normalized_ = normalized;
  r.overall_ = overall;
  r.band_ = band;

  r.computed_ = decision.computed;
  r.applied_ = decision.applied;
  r.tie_break_applied_ = decision.tie_break_applied;
  r.override_justification_ = decision.override_justification;

  r.rationale_ = rationale;
  r.seal_hash_ = compute_seal_hash(r);

  log(LogLevel::INFO, "sealed record policy=" + r.policy_version_ + " input=" + r.input_hash_.substr(0, 16) +
                          " category=" + to_string(r.band_.category) + " computed=" + to_string(r.computed_) +
                          " applied=" + to_string(r.applied_) + " at " + r.sealed_at_.iso8601);
  return r;
}

AuditRecord seal_now(const PolicyConfig& policy,
                     const RiskInput& input,
                     const NormalizedScore& normalized,
                     double overall,
                     const BandMatch& band,
                     const DecisionOutcome& decision,
                     const DecisionRationale& rationale) {
  const UtcTimestamp now = utc_now();
  return seal(policy, input, normalized, overall, band, decision, rationale, now);
}

}  // namespace riskgate
