/*
================================================================================
Fragment 6.5 — Audit: Selftest (Fingerprint / Seal / Compare / JSON)
FILE: cpp/riskgate/audit/audit_selftest.cpp

Checks:
  - SHA-256 backend against a known vector
  - input fingerprint: order-insensitive for sets, sensitive to every field
  - AuditRecord is not assignable and only seal() builds one
  - seal re-derives the chain and refuses tampered values
  - sealed_at text is rebuilt from its epoch
  - compare: versions must match; resealing differs only in time + seal hash
  - JSON: fixed schema, escaped strings, null for a missing override

Exit code:
  0 => all tests passed
  1 => any failure
================================================================================
*/

#include "riskgate/audit/audit_record.hpp"
#include "riskgate/audit/fingerprint.hpp"
#include "riskgate/audit/record_compare.hpp"
#include "riskgate/audit/record_json.hpp"
#include "riskgate/core/hashing.hpp"
#include "riskgate/core/selftest.hpp"
#include "riskgate/core/utc_time.hpp"
#include "riskgate/scoring/aggregator.hpp"
#include "riskgate/scoring/scorer.hpp"

#include <functional>
#include <type_traits>

using namespace riskgate;
using namespace riskgate::selftest;

static_assert(!std::is_copy_assignable_v<AuditRecord>, "AuditRecord must not be copy-assignable");
static_assert(!std::is_move_assignable_v<AuditRecord>, "AuditRecord must not be move-assignable");
static_assert(!std::is_default_constructible_v<AuditRecord>, "AuditRecord is built only by seal()");

namespace {

constexpr std::int64_t kT0 = 1700000000000;  // 2023-11-14T22:13:20.000Z

RiskInput base_input() {
  RiskInput in;
  in.likelihood.raw = 4;
  in.likelihood.confidence = 3;
  in.likelihood.basis = LikelihoodBasis::ExpertJudgement;
  in.likelihood.signals = {"alpha", "beta"};
  in.impact.domains = {ImpactDomain::Operational, ImpactDomain::Financial};
  in.impact.worst_credible_outcome = "line halted two weeks";
  in.impact.reversibility = Reversibility::Partially;
  in.impact.raw_severity = 3;
  in.impact.confidence = 4;
  in.impact.acceptability_hint = AcceptabilityHint::OnlyUnderConditions;
  return in;
}

// Everything seal() needs, computed honestly from (policy, input).
struct Chain {
  NormalizedScore n;
  double overall = 0.0;
  BandMatch band;
  DecisionOutcome decision;
  DecisionRationale rationale;
};

Chain compute_chain(const PolicyConfig& p, const RiskInput& in, const std::optional<Override>& ov = std::nullopt) {
  Chain c;
  c.n = score(in, p);
  c.overall = aggregate(c.n, p.aggregation);
  c.band = classify(c.overall, p);
  c.decision = decide(c.band.category, tie_break_defaults(p), ov);
  c.rationale = explain(in, c.n, c.overall, c.band, c.decision, p);
  return c;
}

AuditRecord seal_chain(const PolicyConfig& p, const RiskInput& in, const Chain& c, std::int64_t ms) {
  return seal(p, in, c.n, c.overall, c.band, c.decision, c.rationale, utc_from_epoch_ms(ms));
}

void test_sha256_backend() {
  expect_eq_str(digest_to_hex(sha256("abc")),
                "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "sha256(\"abc\")");
  expect_eq_str(digest_to_hex(sha256("")),
                "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", "sha256(\"\")");

  Sha256Hasher h;
  h.update_u8(1);
  (void)h.finish();
  expect_error(ErrorCode::kInternalInvariant, [&] { h.update_u8(2); }, "update after finish rejected");
}

void test_fingerprint() {
  const RiskInput a = base_input();
  const std::string ha = fingerprint_hex(a);
  expect_true(ha.size() == 64, "fingerprint is 64 hex chars");
  expect_eq_str(ha, fingerprint_hex(base_input()), "fingerprint stable across calls");

  RiskInput reordered = base_input();
  reordered.likelihood.signals = {"beta", "alpha"};
  reordered.impact.domains.clear();
  reordered.impact.domains.insert(ImpactDomain::Financial);
  reordered.impact.domains.insert(ImpactDomain::Operational);
  expect_eq_str(ha, fingerprint_hex(reordered), "fingerprint ignores signal/domain order");

  struct Mutation {
    const char* name;
    std::function<void(RiskInput&)> apply;
  };
  const Mutation mutations[] = {
      {"likelihood.raw", [](RiskInput& r) { r.likelihood.raw = 5; }},
      {"likelihood.confidence", [](RiskInput& r) { r.likelihood.confidence = 2; }},
      {"likelihood.basis", [](RiskInput& r) { r.likelihood.basis = LikelihoodBasis::MeasuredData; }},
      {"likelihood.signals", [](RiskInput& r) { r.likelihood.signals.push_back("gamma"); }},
      {"impact.domains", [](RiskInput& r) { r.impact.domains.insert(ImpactDomain::Safety); }},
      {"impact.worst_credible_outcome", [](RiskInput& r) { r.impact.worst_credible_outcome += "."; }},
      {"impact.reversibility", [](RiskInput& r) { r.impact.reversibility = Reversibility::NotReversible; }},
      {"impact.raw_severity", [](RiskInput& r) { r.impact.raw_severity = 2; }},
      {"impact.confidence", [](RiskInput& r) { r.impact.confidence = 5; }},
      {"impact.acceptability_hint", [](RiskInput& r) { r.impact.acceptability_hint = AcceptabilityHint::No; }},
  };
  for (const auto& m : mutations) {
    RiskInput changed = base_input();
    m.apply(changed);
    expect_true(fingerprint_hex(changed) != ha, std::string("fingerprint changes with ") + m.name);
  }

  // Signals are length-delimited: ["ab","c"] != ["a","bc"].
  RiskInput s1 = base_input();
  RiskInput s2 = base_input();
  s1.likelihood.signals = {"ab", "c"};
  s2.likelihood.signals = {"a", "bc"};
  expect_true(fingerprint_hex(s1) != fingerprint_hex(s2), "signal boundaries participate");
}

void test_seal() {
  const PolicyConfig p = baseline_policy_v1();
  const RiskInput in = base_input();
  const Chain c = compute_chain(p, in);

  const AuditRecord r = seal_chain(p, in, c, kT0);
  expect_eq_str(r.policy_version(), "v1", "record carries policy_version");
  expect_eq_str(r.policy_hash(), policy_fingerprint_hex(p), "record carries policy hash");
  expect_eq_str(r.input_hash(), fingerprint_hex(in), "record carries input fingerprint");
  expect_eq_str(r.sealed_at().iso8601, "2023-11-14T22:13:20.000Z", "sealed_at rendered in UTC");
  expect_true(r.category() == RiskCategory::Medium && r.applied_decision() == Decision::Reduce,
              "record snapshot: Medium / REDUCE");
  expect_true(!r.overridden(), "record not overridden");
  expect_true(r.seal_hash().size() == 64, "seal hash is 64 hex chars");

  const AuditRecord copy = r;
  expect_eq_str(copy.seal_hash(), r.seal_hash(), "copy preserves seal hash");

  Chain bad_overall = c;
  bad_overall.overall = 0.5;
  expect_error(ErrorCode::kInternalInvariant, [&] { (void)seal_chain(p, in, bad_overall, kT0); },
               "seal refuses wrong overall");

  Chain bad_norm = c;
  bad_norm.n.impact_norm = 0.75;
  expect_error(ErrorCode::kInternalInvariant, [&] { (void)seal_chain(p, in, bad_norm, kT0); },
               "seal refuses wrong normalized score");

  Chain bad_band = c;
  bad_band.band.category = RiskCategory::High;
  expect_error(ErrorCode::kInternalInvariant, [&] { (void)seal_chain(p, in, bad_band, kT0); },
               "seal refuses wrong category");

  Chain silent_change = c;
  silent_change.decision.applied = Decision::Accept;
  expect_error(ErrorCode::kInternalInvariant, [&] { (void)seal_chain(p, in, silent_change, kT0); },
               "seal refuses applied != computed without override");

  Chain bad_rationale = c;
  bad_rationale.rationale.pop_back();
  expect_error(ErrorCode::kInternalInvariant, [&] { (void)seal_chain(p, in, bad_rationale, kT0); },
               "seal refuses incomplete rationale");

  RiskInput bad_in = in;
  bad_in.likelihood.raw = 9;
  expect_error(ErrorCode::kInvalidInput, [&] { (void)seal_chain(p, bad_in, c, kT0); },
               "seal refuses invalid input");
}

void test_sealed_at_canonical() {
  const PolicyConfig p = baseline_policy_v1();
  const RiskInput in = base_input();
  const Chain c = compute_chain(p, in);

  UtcTimestamp forged = utc_from_epoch_ms(kT0);
  forged.iso8601 = "1999-01-01T00:00:00.000Z";
  const AuditRecord honest = seal_chain(p, in, c, kT0);
  const AuditRecord stamped = seal(p, in, c.n, c.overall, c.band, c.decision, c.rationale, forged);

  expect_eq_str(stamped.sealed_at().iso8601, "2023-11-14T22:13:20.000Z", "sealed_at text rebuilt from epoch");
  expect_eq_str(stamped.seal_hash(), honest.seal_hash(), "forged text does not reach the seal hash");
  expect_contains(audit_record_to_json(stamped), "\"sealed_at\": \"2023-11-14T22:13:20.000Z\"",
                  "json prints the canonical sealed_at");
  expect_true(!compare(honest, stamped).sealed_at_differs, "canonical timestamps compare equal");

  expect_true(forged != utc_from_epoch_ms(kT0), "timestamps with different text are not equal");
}

void test_compare() {
  const PolicyConfig p = baseline_policy_v1();
  const RiskInput in = base_input();
  const Chain c = compute_chain(p, in);

  const AuditRecord r1 = seal_chain(p, in, c, kT0);
  const AuditRecord r2 = seal_chain(p, in, c, kT0 + 60000);

  const RecordComparison same = compare(r1, r2);
  expect_true(same.comparable(), "same version comparable");
  expect_true(same.same_content(), "resealed record has same content");
  expect_true(same.sealed_at_differs, "resealed record differs in timestamp");
  expect_true(r1.seal_hash() != r2.seal_hash(), "seal hash covers the timestamp");
  expect_eq_str(r1.input_hash(), r2.input_hash(), "input hash unaffected by timestamp");

  RiskInput conf = in;
  conf.likelihood.confidence = 5;
  const AuditRecord r3 = seal_chain(p, conf, compute_chain(p, conf), kT0);
  const RecordComparison cd = compare(r1, r3);
  bool saw_conf = false;
  bool saw_input_hash = false;
  bool saw_overall = false;
  for (const auto& d : cd.diffs) {
    if (d.field == "likelihood.confidence") saw_conf = true;
    if (d.field == "input_hash") saw_input_hash = true;
    if (d.field == "overall") saw_overall = true;
  }
  expect_true(saw_conf && saw_input_hash, "confidence change reported with input hash");
  expect_true(!saw_overall, "confidence change leaves overall unchanged");

  PolicyConfig p2 = baseline_policy_v1();
  p2.policy_version = "v2";
  p2.high_default = Decision::Reduce;
  const AuditRecord r4 = seal_chain(p2, in, compute_chain(p2, in), kT0);
  const RecordComparison nc = compare(r1, r4);
  expect_true(!nc.comparable() && nc.code == ErrorCode::kNotComparable, "different versions not comparable");
  expect_true(nc.diffs.empty(), "no field diffs across versions");
}

void test_json() {
  const PolicyConfig p = baseline_policy_v1();
  RiskInput in = base_input();
  in.impact.worst_credible_outcome = "say \"halt\"\nthen stop";
  const AuditRecord r = seal_chain(p, in, compute_chain(p, in), kT0);

  const std::string js = audit_record_to_json(r);
  expect_contains(js, "\"schema\": \"riskgate_audit_record_v1\"", "json schema tag");
  expect_contains(js, "\"policy_version\": \"v1\"", "json policy_version");
  expect_contains(js, "\"sealed_at_epoch_ms\": 1700000000000", "json epoch ms");
  expect_contains(js, "\"overall\": 0.375000", "json overall");
  expect_contains(js, "\"override_justification\": null", "json null override");
  expect_contains(js, "say \\\"halt\\\"\\nthen stop", "json escapes strings");
  expect_true(js.find(": nan") == std::string::npos && js.find(": -nan") == std::string::npos &&
                  js.find(": inf") == std::string::npos,
              "json has no non-finite numbers");
  expect_eq_str(js, audit_record_to_json(r), "json deterministic");

  JsonWriteOptions compact;
  compact.pretty = false;
  const std::string jc = audit_record_to_json(r, compact);
  expect_true(jc.find('\n') == std::string::npos, "compact json is one line");
  expect_contains(jc, "\"category\":\"Medium\"", "compact json band category");

  Override ov;
  ov.value = Decision::Accept;
  ov.justification = "owner accepts";
  const AuditRecord ro = seal_chain(p, in, compute_chain(p, in, ov), kT0);
  expect_contains(audit_record_to_json(ro), "\"override_justification\": \"owner accepts\"", "json override text");
}

}  // namespace

int main() {
  std::cerr << "riskgate audit selftest\n\n";
  try {
    test_sha256_backend();
    test_fingerprint();
    test_seal();
    test_sealed_at_canonical();
    test_compare();
    test_json();
  } catch (const Error& e) {
    fail(std::string("unexpected error: ") + e.what());
  }
  return selftest_exit_code();
}
