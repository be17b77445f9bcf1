/*
================================================================================
Fragment 5.4 — Decision: Selftest (Rules / Override / Rationale)
FILE: cpp/riskgate/decision/decision_selftest.cpp

Checks:
  - Low -> ACCEPT and Medium -> REDUCE under every tie-break configuration
  - High / Critical follow the configured defaults, flagged as tie-breaks
  - override replaces applied only; blank justification is rejected
  - rationale: six steps in fixed order, deterministic, states the numbers
  - numbers render as the shortest text that round-trips

Exit code:
  0 => all tests passed
  1 => any failure
================================================================================
*/

#include "riskgate/core/selftest.hpp"
#include "riskgate/decision/decision_rules.hpp"
#include "riskgate/decision/explainability.hpp"
#include "riskgate/policy/policy.hpp"
#include "riskgate/scoring/classifier.hpp"

#include <locale>
#include <sstream>

using namespace riskgate;
using namespace riskgate::selftest;

namespace {

RiskInput medium_input() {
  RiskInput in;
  in.likelihood.raw = 4;
  in.likelihood.confidence = 3;
  in.likelihood.basis = LikelihoodBasis::ExpertJudgement;
  in.likelihood.signals = {"single-source supplier", "late deliveries"};
  in.impact.domains = {ImpactDomain::Operational, ImpactDomain::Financial};
  in.impact.worst_credible_outcome = "line halted two weeks";
  in.impact.reversibility = Reversibility::Partially;
  in.impact.raw_severity = 3;
  in.impact.confidence = 4;
  return in;
}

Override make_override(Decision d, const std::string& why) {
  Override ov;
  ov.value = d;
  ov.justification = why;
  return ov;
}

void test_fixed_mapping() {
  const Decision highs[] = {Decision::Reduce, Decision::Mitigate};
  const Decision crits[] = {Decision::Stop, Decision::Escalate};

  bool low_ok = true;
  bool medium_ok = true;
  for (Decision h : highs) {
    for (Decision c : crits) {
      const TieBreakDefaults d{h, c};
      const DecisionOutcome lo = decide(RiskCategory::Low, d);
      const DecisionOutcome me = decide(RiskCategory::Medium, d);
      if (lo.computed != Decision::Accept || lo.tie_break_applied) low_ok = false;
      if (me.computed != Decision::Reduce || me.tie_break_applied) medium_ok = false;
    }
  }
  expect_true(low_ok, "Low -> ACCEPT under every configuration");
  expect_true(medium_ok, "Medium -> REDUCE under every configuration");
}

void test_tie_breaks() {
  const PolicyConfig p = baseline_policy_v1();
  const TieBreakDefaults d = tie_break_defaults(p);

  const DecisionOutcome hi = decide(RiskCategory::High, d);
  expect_true(hi.computed == Decision::Mitigate && hi.applied == Decision::Mitigate && hi.tie_break_applied,
              "High -> MITIGATE under v1 (tie-break)");

  const DecisionOutcome cr = decide(RiskCategory::Critical, d);
  expect_true(cr.computed == Decision::Escalate && cr.tie_break_applied, "Critical -> ESCALATE under v1 (tie-break)");

  const DecisionOutcome hi2 = decide(RiskCategory::High, TieBreakDefaults{Decision::Reduce, Decision::Stop});
  expect_true(hi2.computed == Decision::Reduce, "High -> REDUCE when configured");
  const DecisionOutcome cr2 = decide(RiskCategory::Critical, TieBreakDefaults{Decision::Reduce, Decision::Stop});
  expect_true(cr2.computed == Decision::Stop, "Critical -> STOP when configured");

  expect_error(ErrorCode::kInvalidPolicy,
               [] { (void)baseline_decision(RiskCategory::High, TieBreakDefaults{Decision::Accept, Decision::Stop}); },
               "High tie-break ACCEPT rejected");
  expect_error(ErrorCode::kInvalidPolicy,
               [] { (void)baseline_decision(RiskCategory::Critical, TieBreakDefaults{Decision::Mitigate, Decision::Reduce}); },
               "Critical tie-break REDUCE rejected");
}

void test_override() {
  const TieBreakDefaults d = tie_break_defaults(baseline_policy_v1());

  // overall 0.45 under v1: High -> MITIGATE, human overrides to REDUCE.
  const BandMatch band = classify(0.45, baseline_policy_v1());
  expect_true(band.category == RiskCategory::High, "0.45 falls in High");

  const DecisionOutcome o = decide(band.category, d, make_override(Decision::Reduce, "insurance already in place"));
  expect_true(o.computed == Decision::Mitigate, "override keeps computed MITIGATE");
  expect_true(o.applied == Decision::Reduce, "override sets applied REDUCE");
  expect_true(o.overridden() && *o.override_justification == "insurance already in place",
              "override justification retained");

  // No memoization: the next call without an override is the baseline again.
  const DecisionOutcome again = decide(band.category, d);
  expect_true(!again.overridden() && again.applied == Decision::Mitigate, "decide without override is baseline");

  // Override to the same value as computed is still an override.
  const DecisionOutcome same = decide(RiskCategory::Low, d, make_override(Decision::Accept, "confirmed by owner"));
  expect_true(same.overridden() && same.applied == same.computed, "override equal to computed is recorded");

  expect_error(ErrorCode::kInvalidOverride,
               [&] { (void)decide(RiskCategory::High, d, make_override(Decision::Reduce, "")); },
               "empty justification rejected");
  expect_error(ErrorCode::kInvalidOverride,
               [&] { (void)decide(RiskCategory::High, d, make_override(Decision::Reduce, " \t\n ")); },
               "whitespace-only justification rejected");
}

void test_rationale() {
  const PolicyConfig p = baseline_policy_v1();
  const RiskInput in = medium_input();
  const NormalizedScore n{0.75, 0.5};
  const double overall = 0.375;
  const BandMatch band = classify(overall, p);
  const DecisionOutcome d = decide(band.category, tie_break_defaults(p));

  const DecisionRationale r = explain(in, n, overall, band, d, p);
  expect_true(r.size() == 6, "rationale has six steps");
  expect_true(r.size() == 6 &&
                  r[0].stage == RationaleStage::Likelihood && r[1].stage == RationaleStage::Impact &&
                  r[2].stage == RationaleStage::Aggregate && r[3].stage == RationaleStage::Classify &&
                  r[4].stage == RationaleStage::Decide && r[5].stage == RationaleStage::Override,
              "rationale steps in fixed order");
  if (r.size() != 6) return;

  expect_contains(r[0].statement, "raw 4 (Likely) -> normalized 0.75", "likelihood step states raw and norm");
  expect_contains(r[0].statement, "not scored", "likelihood step marks metadata");
  expect_contains(r[1].statement, "raw 3 (Moderate) -> normalized 0.5", "impact step states raw and norm");
  expect_eq_str(r[2].statement, "overall = likelihood_norm x impact_norm = 0.75 x 0.5 = 0.375 (product)",
                "aggregate step");
  expect_eq_str(r[3].statement, "overall 0.375 falls in band Medium [0.2, 0.4) of policy v1", "classify step");
  expect_eq_str(r[4].statement, "Medium -> REDUCE (fixed mapping)", "decide step");
  expect_eq_str(r[5].statement, "no override; applied decision REDUCE equals computed", "override step");

  const DecisionRationale r2 = explain(in, n, overall, band, d, p);
  expect_true(r == r2, "rationale deterministic");

  // High with override.
  const BandMatch hb = classify(0.5625, p);
  const DecisionOutcome hd = decide(hb.category, tie_break_defaults(p),
                                    make_override(Decision::Reduce, "insurance already in place"));
  RiskInput hin = in;
  hin.impact.raw_severity = 4;
  const DecisionRationale hr = explain(hin, NormalizedScore{0.75, 0.75}, 0.5625, hb, hd, p);
  expect_contains(hr[4].statement, "High -> MITIGATE (policy tie-break default for High",
                  "decide step names tie-break");
  expect_contains(hr[5].statement, "override applied: REDUCE replaces computed MITIGATE",
                  "override step names both decisions");
  expect_contains(hr[5].statement, "insurance already in place", "override step quotes justification");

  const BandMatch top = classify(1.0, p);
  const DecisionRationale tr =
      explain(in, NormalizedScore{1.0, 1.0}, 1.0, top, decide(top.category, tie_break_defaults(p)), p);
  expect_contains(tr[3].statement, "Critical [0.7, 1]", "top band rendered closed");

  const std::string text = render_rationale_text(r);
  expect_contains(text, "1. [LIKELIHOOD] ", "text rendering numbers steps");
  expect_contains(text, "6. [OVERRIDE] ", "text rendering ends with override");
}

void test_format_number() {
  expect_eq_str(format_number(0.375), "0.375", "format_number(0.375)");
  expect_eq_str(format_number(0.0), "0", "format_number(0)");
  expect_eq_str(format_number(-0.0), "0", "format_number(-0) has no sign");
  expect_eq_str(format_number(1.0), "1", "format_number(1)");
  expect_eq_str(format_number(0.5625), "0.5625", "format_number(0.5625)");
  expect_eq_str(format_number(0.2), "0.2", "format_number(0.2) stays short");
  expect_eq_str(format_number(0.4000001), "0.4000001", "format_number keeps the 7th digit");
  expect_true(format_number(0.4000001) != format_number(0.4), "nearby values render differently");

  const double third = 1.0 / 3.0;
  std::istringstream back(format_number(third));
  back.imbue(std::locale::classic());
  double parsed = 0.0;
  back >> parsed;
  expect_true(parsed == third, "format_number round-trips 1/3");

  // Band edges beyond six significant digits stay distinguishable in the rationale.
  PolicyConfig fine = baseline_policy_v1();
  fine.bands[1].high = 0.4000001;
  fine.bands[2].low = 0.4000001;
  const BandMatch band = classify(0.375, fine);
  const DecisionOutcome d = decide(band.category, tie_break_defaults(fine));
  const DecisionRationale r = explain(medium_input(), NormalizedScore{0.75, 0.5}, 0.375, band, d, fine);
  expect_contains(r[3].statement, "Medium [0.2, 0.4000001)", "classify step shows the exact band edge");
}

}  // namespace

int main() {
  std::cerr << "riskgate decision selftest\n\n";
  try {
    test_fixed_mapping();
    test_tie_breaks();
    test_override();
    test_rationale();
    test_format_number();
  } catch (const Error& e) {
    fail(std::string("unexpected error: ") + e.what());
  }
  return selftest_exit_code();
}
