/*
================================================================================
Fragment 7.2 — Pipeline: Selftest (State Machine / End-to-End / Concurrency)
FILE: cpp/riskgate/pipeline/pipeline_selftest.cpp

Checks:
  - stage order enforced; failures leave the previous stage in place
  - reference evaluations: Medium/REDUCE and High/MITIGATE overridden
  - redraft under a new policy version yields a non-comparable record
  - acceptance authority is advisory and bound to the exact policy configuration
  - records under one version string but two configurations are not comparable
  - concurrent evaluations under different policies match sequential ones
  - logging never lets a sink failure escape

Exit code:
  0 => all tests passed
  1 => any failure
================================================================================
*/

#include "riskgate/audit/record_compare.hpp"
#include "riskgate/core/logging.hpp"
#include "riskgate/core/selftest.hpp"
#include "riskgate/decision/acceptance_authority.hpp"
#include "riskgate/pipeline/evaluation.hpp"

#include <atomic>
#include <streambuf>
#include <thread>
#include <vector>

using namespace riskgate;
using namespace riskgate::selftest;

namespace {

constexpr std::int64_t kT0 = 1700000000000;

RiskInput supplier_input(int likelihood, int severity) {
  RiskInput in;
  in.likelihood.raw = likelihood;
  in.likelihood.confidence = 3;
  in.likelihood.basis = LikelihoodBasis::ExpertJudgement;
  in.likelihood.signals = {"single-source supplier"};
  in.impact.domains = {ImpactDomain::Operational};
  in.impact.worst_credible_outcome = "line halted two weeks";
  in.impact.reversibility = Reversibility::Partially;
  in.impact.raw_severity = severity;
  in.impact.confidence = 4;
  return in;
}

Override make_override(Decision d, const std::string& why) {
  Override ov;
  ov.value = d;
  ov.justification = why;
  return ov;
}

PolicyConfig policy_v2() {
  PolicyConfig p = baseline_policy_v1();
  p.policy_version = "v2";
  p.high_default = Decision::Reduce;
  p.critical_default = Decision::Stop;
  return p;
}

void test_stage_order() {
  Evaluation ev(baseline_policy_v1(), supplier_input(4, 3));
  expect_true(ev.stage() == EvaluationStage::Draft, "new evaluation is Draft");

  expect_error(ErrorCode::kInvalidTransition, [&] { (void)ev.classify(); }, "classify before score rejected");
  expect_error(ErrorCode::kInvalidTransition, [&] { (void)ev.decide(); }, "decide before classify rejected");
  expect_error(ErrorCode::kInvalidTransition, [&] { (void)ev.seal(utc_from_epoch_ms(kT0)); },
               "seal before decide rejected");
  expect_error(ErrorCode::kInvalidTransition, [&] { (void)ev.overall(); }, "overall unavailable in Draft");
  expect_error(ErrorCode::kInvalidTransition, [&] { (void)ev.record(); }, "record unavailable in Draft");
  expect_error(ErrorCode::kInvalidTransition, [&] { (void)ev.redraft(baseline_policy_v1()); },
               "redraft of unsealed evaluation rejected");
  expect_true(ev.stage() == EvaluationStage::Draft, "rejected transitions leave Draft");

  (void)ev.score();
  expect_true(ev.stage() == EvaluationStage::Scored, "score -> Scored");
  expect_error(ErrorCode::kInvalidTransition, [&] { (void)ev.score(); }, "score twice rejected");
  expect_error(ErrorCode::kInvalidTransition, [&] { (void)ev.draft_input(); }, "input frozen after score");

  (void)ev.classify();
  expect_true(ev.stage() == EvaluationStage::Classified, "classify -> Classified");
  (void)ev.decide();
  expect_true(ev.stage() == EvaluationStage::Decided, "decide -> Decided");
  (void)ev.seal(utc_from_epoch_ms(kT0));
  expect_true(ev.stage() == EvaluationStage::Sealed, "seal -> Sealed");
  expect_error(ErrorCode::kInvalidTransition, [&] { (void)ev.seal(utc_from_epoch_ms(kT0)); },
               "seal twice rejected");
}

void test_failed_stages_do_not_advance() {
  Evaluation ev(baseline_policy_v1(), supplier_input(4, 3));
  ev.draft_input().impact.confidence = 0;
  expect_error(ErrorCode::kInvalidInput, [&] { (void)ev.score(); }, "invalid confidence rejected at score");
  expect_true(ev.stage() == EvaluationStage::Draft, "failed score stays Draft");

  ev.draft_input().impact.confidence = 2;
  (void)ev.score();
  (void)ev.classify();
  expect_error(ErrorCode::kInvalidOverride, [&] { (void)ev.decide(make_override(Decision::Accept, "   ")); },
               "blank override rejected at decide");
  expect_true(ev.stage() == EvaluationStage::Classified, "failed decide stays Classified");

  (void)ev.decide(make_override(Decision::Accept, "owner signs off"));
  expect_true(ev.decision().overridden(), "valid override accepted after a rejected one");

  PolicyConfig broken = baseline_policy_v1();
  broken.bands.pop_back();
  expect_error(ErrorCode::kInvalidPolicy, [&] { Evaluation bad(broken, supplier_input(1, 1)); },
               "evaluation refuses a malformed policy");
}

void test_reference_scenarios() {
  const PolicyConfig p = baseline_policy_v1();

  // Scenario 1: 4 x 3.
  Evaluation ev(p, supplier_input(4, 3));
  const NormalizedScore& n = ev.score();
  expect_near(n.likelihood_norm, 0.75, 0.0, "scenario 1 likelihood_norm 0.75");
  expect_near(n.impact_norm, 0.5, 0.0, "scenario 1 impact_norm 0.5");
  const BandMatch& band = ev.classify();
  expect_near(ev.overall(), 0.375, 1e-15, "scenario 1 overall 0.375");
  expect_true(band.category == RiskCategory::Medium, "scenario 1 Medium");
  const DecisionOutcome& d = ev.decide();
  expect_true(d.computed == Decision::Reduce && d.applied == Decision::Reduce, "scenario 1 REDUCE");
  const AuditRecord& r = ev.seal(utc_from_epoch_ms(kT0));
  expect_true(r.rationale().size() == 6, "scenario 1 rationale complete");
  expect_eq_str(r.rationale()[3].statement, "overall 0.375 falls in band Medium [0.2, 0.4) of policy v1",
                "scenario 1 classify statement");

  // Scenario 2: 4 x 4, High, overridden to REDUCE.
  const AuditRecord hi = evaluate_at(p, supplier_input(4, 4), make_override(Decision::Reduce, "insurance already in place"),
                                     utc_from_epoch_ms(kT0));
  expect_near(hi.overall(), 0.5625, 1e-15, "scenario 2 overall 0.5625");
  expect_true(hi.category() == RiskCategory::High, "scenario 2 High");
  expect_true(hi.computed_decision() == Decision::Mitigate, "scenario 2 computed MITIGATE");
  expect_true(hi.applied_decision() == Decision::Reduce, "scenario 2 applied REDUCE");
  expect_true(hi.tie_break_applied(), "scenario 2 tie-break flagged");
  expect_true(hi.overridden() && *hi.override_justification() == "insurance already in place",
              "scenario 2 justification sealed");

  // Same input, same policy, same instant: identical record.
  const AuditRecord r_again = evaluate_at(p, supplier_input(4, 3), std::nullopt, utc_from_epoch_ms(kT0));
  expect_eq_str(r_again.seal_hash(), r.seal_hash(), "evaluation deterministic for a fixed timestamp");

  // evaluate() stamps the current time.
  const AuditRecord live = evaluate(p, supplier_input(1, 1));
  expect_true(live.sealed_at().epoch_ms > kT0, "evaluate stamps current UTC time");
  expect_true(live.category() == RiskCategory::Low && live.applied_decision() == Decision::Accept,
              "1 x 1 -> Low -> ACCEPT");
}

void test_policy_isolation_and_redraft() {
  PolicyConfig p = baseline_policy_v1();
  Evaluation ev(p, supplier_input(4, 4));
  p.high_default = Decision::Reduce;  // caller's copy only
  (void)ev.score();
  (void)ev.classify();
  expect_true(ev.decide().computed == Decision::Mitigate, "evaluation keeps its own policy copy");
  const AuditRecord& v1_record = ev.seal(utc_from_epoch_ms(kT0));

  Evaluation next = ev.redraft(policy_v2());
  expect_true(next.stage() == EvaluationStage::Draft, "redraft starts in Draft");
  expect_true(ev.stage() == EvaluationStage::Sealed, "superseded evaluation stays Sealed");
  (void)next.score();
  (void)next.classify();
  expect_true(next.decide().computed == Decision::Reduce, "redraft follows the new tie-break");
  const AuditRecord& v2_record = next.seal(utc_from_epoch_ms(kT0));

  expect_eq_str(v1_record.input_hash(), v2_record.input_hash(), "redraft keeps the input");
  const RecordComparison cmp = compare(v1_record, v2_record);
  expect_true(cmp.code == ErrorCode::kNotComparable, "records across policy versions not comparable");
}

void test_acceptance_authority() {
  const PolicyConfig p = baseline_policy_v1();
  const AuditRecord medium = evaluate_at(p, supplier_input(4, 3), std::nullopt, utc_from_epoch_ms(kT0));

  const AcceptanceCheck owner = check_acceptance(medium, p, "risk_owner");
  expect_true(owner.code == ErrorCode::kOk && owner.role_known, "risk_owner known");
  expect_true(!owner.role_may_accept, "risk_owner may not accept 0.375");
  expect_true(!owner.requires_escalation, "0.375 below escalation threshold");

  const AcceptanceCheck head = check_acceptance(medium, p, "department_head");
  expect_true(head.role_may_accept, "department_head may accept 0.375");

  const AcceptanceCheck unknown = check_acceptance(medium, p, "intern");
  expect_true(!unknown.role_known && !unknown.role_may_accept, "unknown role may not accept");

  const AuditRecord high = evaluate_at(p, supplier_input(4, 4), std::nullopt, utc_from_epoch_ms(kT0));
  const AcceptanceCheck esc = check_acceptance(high, p, "executive");
  expect_true(esc.requires_escalation && esc.role_may_accept, "0.5625 escalates; executive may accept");
  expect_true(high.applied_decision() == Decision::Mitigate, "acceptance check leaves the decision untouched");

  const AcceptanceCheck other = check_acceptance(medium, policy_v2(), "board");
  expect_true(other.code == ErrorCode::kNotComparable, "acceptance refuses a foreign policy version");

  // Same version string, different thresholds.
  PolicyConfig lax = baseline_policy_v1();
  lax.acceptance_escalation_threshold = 0.9;
  lax.authority_matrix.front().max_overall_to_accept = 0.9;
  const AcceptanceCheck relabelled = check_acceptance(medium, lax, "risk_owner");
  expect_true(relabelled.code == ErrorCode::kNotComparable && !relabelled.role_may_accept,
              "acceptance refuses a same-version policy with another configuration");
}

void test_same_version_other_configuration() {
  const PolicyConfig p = baseline_policy_v1();
  PolicyConfig variant = baseline_policy_v1();
  variant.high_default = Decision::Reduce;  // still "v1"

  const AuditRecord a = evaluate_at(p, supplier_input(4, 4), std::nullopt, utc_from_epoch_ms(kT0));
  const AuditRecord b = evaluate_at(variant, supplier_input(4, 4), std::nullopt, utc_from_epoch_ms(kT0));
  expect_eq_str(a.policy_version(), b.policy_version(), "both records claim v1");

  const RecordComparison cmp = compare(a, b);
  expect_true(cmp.code == ErrorCode::kNotComparable && cmp.diffs.empty(),
              "records under one version string but two configurations not comparable");
}

void test_concurrent_evaluations() {
  const PolicyConfig p1 = baseline_policy_v1();
  const PolicyConfig p2 = policy_v2();
  const UtcTimestamp ts = utc_from_epoch_ms(kT0);

  // Sequential reference for every rating pair under both policies.
  std::vector<std::string> expected;
  for (const PolicyConfig* p : {&p1, &p2}) {
    for (int l = 1; l <= 5; ++l) {
      for (int i = 1; i <= 5; ++i) {
        expected.push_back(evaluate_at(*p, supplier_input(l, i), std::nullopt, ts).seal_hash());
      }
    }
  }

  constexpr int kThreads = 8;
  std::atomic<int> mismatches{0};
  std::atomic<int> errors{0};
  std::vector<std::thread> workers;
  workers.reserve(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t] {
      const PolicyConfig& p = (t % 2 == 0) ? p1 : p2;
      const std::size_t base = (t % 2 == 0) ? 0 : 25;
      for (int round = 0; round < 4; ++round) {
        for (int l = 1; l <= 5; ++l) {
          for (int i = 1; i <= 5; ++i) {
            try {
              const AuditRecord r = evaluate_at(p, supplier_input(l, i), std::nullopt, ts);
              const std::size_t k = base + static_cast<std::size_t>((l - 1) * 5 + (i - 1));
              if (r.seal_hash() != expected[k]) mismatches.fetch_add(1);
            } catch (const Error&) {
              errors.fetch_add(1);
            }
          }
        }
      }
    });
  }
  for (auto& w : workers) w.join();

  expect_true(errors.load() == 0, "concurrent evaluations raise no errors");
  expect_true(mismatches.load() == 0, "concurrent evaluations match sequential results");
}

struct SinkFailure {};

// Fails every write with an exception outside the std::exception hierarchy.
class FailingBuf : public std::streambuf {
 protected:
  int_type overflow(int_type) override { throw SinkFailure{}; }
  std::streamsize xsputn(const char*, std::streamsize) override { throw SinkFailure{}; }
};

void test_log_survives_failing_sink() {
  FailingBuf failing;
  std::streambuf* saved = std::cout.rdbuf();
  std::cout.exceptions(std::ios::badbit);
  std::cout.rdbuf(&failing);

  set_log_level(LogLevel::INFO);
  log(LogLevel::INFO, "written to a failing sink");
  set_log_level(LogLevel::ERROR);

  std::cout.exceptions(std::ios::goodbit);
  std::cout.rdbuf(saved);
  std::cout.clear();
  pass("log swallows a non-standard exception from its sink");
}

}  // namespace

int main() {
  set_log_level(LogLevel::ERROR);
  std::cerr << "riskgate pipeline selftest\n\n";
  try {
    test_stage_order();
    test_failed_stages_do_not_advance();
    test_reference_scenarios();
    test_policy_isolation_and_redraft();
    test_acceptance_authority();
    test_same_version_other_configuration();
    test_concurrent_evaluations();
    test_log_survives_failing_sink();
  } catch (const Error& e) {
    fail(std::string("unexpected error: ") + e.what());
  }
  return selftest_exit_code();
}
