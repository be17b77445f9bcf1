/*
================================================================================
Fragment 4.4 — Scoring: Selftest (Scorer / Aggregator / Classifier / Policy)
FILE: cpp/riskgate/scoring/scoring_selftest.cpp

Checks:
  - normalize: 1..5 maps to 0, .25, .5, .75, 1; out-of-range raw rejected
  - confidence validated but never changes the normalized score
  - aggregate: zero rule, overall == 1 only at (1,1), out-of-range rejected
  - classify: totality over [0,1], monotone, boundaries, top band closed
  - band table / policy validation rejects malformed configurations
  - rating scale bounds are fixed at 1..5; policies may only relabel them

Exit code:
  0 => all tests passed
  1 => any failure
================================================================================
*/

#include "riskgate/core/selftest.hpp"
#include "riskgate/policy/policy.hpp"
#include "riskgate/scoring/aggregator.hpp"
#include "riskgate/scoring/classifier.hpp"
#include "riskgate/scoring/scorer.hpp"

#include <limits>

using namespace riskgate;
using namespace riskgate::selftest;

namespace {

RiskInput make_input(int l, int i) {
  RiskInput in;
  in.likelihood.raw = l;
  in.likelihood.confidence = 3;
  in.impact.raw_severity = i;
  in.impact.confidence = 3;
  in.impact.domains = {ImpactDomain::Operational};
  in.impact.worst_credible_outcome = "line stop";
  return in;
}

void test_normalize() {
  expect_near(normalize(1), 0.0, 0.0, "normalize(1) == 0");
  expect_near(normalize(2), 0.25, 0.0, "normalize(2) == 0.25");
  expect_near(normalize(3), 0.5, 0.0, "normalize(3) == 0.5");
  expect_near(normalize(4), 0.75, 0.0, "normalize(4) == 0.75");
  expect_near(normalize(5), 1.0, 0.0, "normalize(5) == 1");

  bool monotone = true;
  for (int r = kRatingMin; r < kRatingMax; ++r) {
    if (!(normalize(r) < normalize(r + 1))) monotone = false;
  }
  expect_true(monotone, "normalize strictly increasing over 1..5");

  expect_error(ErrorCode::kInvalidInput, [] { (void)normalize(0); }, "normalize(0) rejected");
  expect_error(ErrorCode::kInvalidInput, [] { (void)normalize(6); }, "normalize(6) rejected");
  expect_error(ErrorCode::kInvalidInput, [] { (void)normalize(-3); }, "normalize(-3) rejected");
}

void test_confidence_is_metadata() {
  const PolicyConfig p = baseline_policy_v1();

  expect_error(ErrorCode::kInvalidInput, [] { validate_confidence(0, "likelihood.confidence"); },
               "confidence 0 rejected");
  expect_error(ErrorCode::kInvalidInput, [] { validate_confidence(6, "impact.confidence"); },
               "confidence 6 rejected");

  RiskInput a = make_input(4, 3);
  RiskInput b = a;
  a.likelihood.confidence = 1;
  a.impact.confidence = 5;
  b.likelihood.confidence = 5;
  b.impact.confidence = 1;
  const NormalizedScore sa = score(a, p);
  const NormalizedScore sb = score(b, p);
  expect_true(sa.likelihood_norm == sb.likelihood_norm && sa.impact_norm == sb.impact_norm,
              "confidence does not change the normalized score");

  RiskInput bad = make_input(4, 3);
  bad.impact.confidence = 9;
  expect_error(ErrorCode::kInvalidInput, [&] { (void)score(bad, p); },
               "score rejects out-of-range confidence");

  RiskInput bad_raw = make_input(4, 7);
  expect_error(ErrorCode::kInvalidInput, [&] { (void)score(bad_raw, p); },
               "score rejects out-of-range severity");
}

void test_aggregate() {
  const double grid[] = {0.0, 0.25, 0.5, 0.75, 1.0};

  bool zero_rule = true;
  bool one_only_at_corner = true;
  bool bounded = true;
  for (double l : grid) {
    for (double i : grid) {
      const double o = aggregate(l, i);
      if ((l == 0.0 || i == 0.0) && o != 0.0) zero_rule = false;
      if ((o == 1.0) != (l == 1.0 && i == 1.0)) one_only_at_corner = false;
      if (o < 0.0 || o > 1.0) bounded = false;
    }
  }
  expect_true(zero_rule, "aggregate: either factor 0 => overall 0");
  expect_true(one_only_at_corner, "aggregate: overall 1 only when both are 1");
  expect_true(bounded, "aggregate stays in [0,1]");

  expect_near(aggregate(0.75, 0.5), 0.375, 1e-15, "aggregate(0.75, 0.5) == 0.375");
  expect_near(aggregate(NormalizedScore{0.75, 0.75}, AggregationOp::Product), 0.5625, 1e-15,
              "aggregate(score, Product) == 0.5625");

  expect_error(ErrorCode::kInternalInvariant, [] { (void)aggregate(1.2, 0.5); },
               "aggregate rejects likelihood_norm > 1");
  expect_error(ErrorCode::kInternalInvariant, [] { (void)aggregate(0.5, -0.1); },
               "aggregate rejects impact_norm < 0");
  expect_error(ErrorCode::kInternalInvariant,
               [] { (void)aggregate(std::numeric_limits<double>::quiet_NaN(), 0.5); },
               "aggregate rejects NaN");
}

void test_classify() {
  const PolicyConfig p = baseline_policy_v1();

  expect_true(classify(0.0, p).category == RiskCategory::Low, "classify(0) == Low");
  expect_true(classify(0.1999, p).category == RiskCategory::Low, "classify(0.1999) == Low");
  expect_true(classify(0.2, p).category == RiskCategory::Medium, "classify(0.2) == Medium (lower bound inclusive)");
  expect_true(classify(0.375, p).category == RiskCategory::Medium, "classify(0.375) == Medium");
  expect_true(classify(0.4, p).category == RiskCategory::High, "classify(0.4) == High");
  expect_true(classify(0.45, p).category == RiskCategory::High, "classify(0.45) == High");
  expect_true(classify(0.7, p).category == RiskCategory::Critical, "classify(0.7) == Critical");

  const BandMatch top = classify(1.0, p);
  expect_true(top.category == RiskCategory::Critical && top.closed_high, "classify(1.0) == Critical, closed");

  const BandMatch mid = classify(0.375, p);
  expect_true(mid.low == 0.2 && mid.high == 0.4 && !mid.closed_high, "Medium band reported as [0.2, 0.4)");

  // Totality and monotonicity over a fine sweep.
  bool total = true;
  bool monotone = true;
  int prev = -1;
  for (int k = 0; k <= 1000; ++k) {
    const double o = static_cast<double>(k) / 1000.0;
    try {
      const int cat = static_cast<int>(classify(o, p).category);
      if (cat < prev) monotone = false;
      prev = cat;
    } catch (const Error&) {
      total = false;
    }
  }
  expect_true(total, "classify total over [0,1]");
  expect_true(monotone, "classify monotone non-decreasing");

  // Every reachable product of the 1..5 scale classifies.
  bool reachable_ok = true;
  for (int l = kRatingMin; l <= kRatingMax; ++l) {
    for (int i = kRatingMin; i <= kRatingMax; ++i) {
      const NormalizedScore s = score(make_input(l, i), p);
      try {
        (void)classify(aggregate(s, p.aggregation), p);
      } catch (const Error&) {
        reachable_ok = false;
      }
    }
  }
  expect_true(reachable_ok, "all 25 rating pairs classify");

  expect_error(ErrorCode::kInternalInvariant, [&] { (void)classify(-0.01, p); }, "classify(-0.01) rejected");
  expect_error(ErrorCode::kInternalInvariant, [&] { (void)classify(1.0001, p); }, "classify(1.0001) rejected");
  expect_error(ErrorCode::kInternalInvariant,
               [&] { (void)classify(std::numeric_limits<double>::quiet_NaN(), p); }, "classify(NaN) rejected");
}

void test_band_table_validation() {
  const std::vector<Band> good = baseline_policy_v1().bands;
  validate_band_table(good);
  pass("baseline band table validates");

  std::vector<Band> gap = good;
  gap[1].high = 0.35;
  expect_error(ErrorCode::kInvalidPolicy, [&] { validate_band_table(gap); }, "band gap rejected");

  std::vector<Band> overlap = good;
  overlap[2].low = 0.3;
  expect_error(ErrorCode::kInvalidPolicy, [&] { validate_band_table(overlap); }, "band overlap rejected");

  std::vector<Band> inverted = good;
  inverted[1].low = 0.4;
  inverted[1].high = 0.2;
  expect_error(ErrorCode::kInvalidPolicy, [&] { validate_band_table(inverted); }, "inverted band rejected");

  std::vector<Band> short_top = good;
  short_top[3].high = 0.95;
  expect_error(ErrorCode::kInvalidPolicy, [&] { validate_band_table(short_top); }, "band table ending below 1 rejected");

  std::vector<Band> three(good.begin(), good.begin() + 3);
  expect_error(ErrorCode::kInvalidPolicy, [&] { validate_band_table(three); }, "three-band table rejected");

  std::vector<Band> swapped = good;
  std::swap(swapped[0].category, swapped[1].category);
  expect_error(ErrorCode::kInvalidPolicy, [&] { validate_band_table(swapped); }, "out-of-order categories rejected");

  PolicyConfig p = baseline_policy_v1();
  p.bands = gap;
  expect_error(ErrorCode::kInvalidPolicy, [&] { (void)classify(0.3, p); }, "classify refuses a malformed band table");
}

void test_policy_validation() {
  baseline_policy_v1().validate_or_throw();
  pass("baseline_policy_v1 validates");

  PolicyConfig p = baseline_policy_v1();
  p.policy_version.clear();
  expect_error(ErrorCode::kInvalidPolicy, [&] { p.validate_or_throw(); }, "empty policy_version rejected");

  p = baseline_policy_v1();
  p.high_default = Decision::Stop;
  expect_error(ErrorCode::kInvalidPolicy, [&] { p.validate_or_throw(); }, "High default STOP rejected");

  p = baseline_policy_v1();
  p.critical_default = Decision::Reduce;
  expect_error(ErrorCode::kInvalidPolicy, [&] { p.validate_or_throw(); }, "Critical default REDUCE rejected");

  p = baseline_policy_v1();
  p.likelihood_scale.labels.pop_back();
  expect_error(ErrorCode::kInvalidPolicy, [&] { p.validate_or_throw(); }, "label count mismatch rejected");

  p = baseline_policy_v1();
  p.authority_matrix.push_back(p.authority_matrix.front());
  expect_error(ErrorCode::kInvalidPolicy, [&] { p.validate_or_throw(); }, "duplicate authority role rejected");

  p = baseline_policy_v1();
  p.acceptance_escalation_threshold = 1.5;
  expect_error(ErrorCode::kInvalidPolicy, [&] { p.validate_or_throw(); }, "escalation threshold > 1 rejected");

  // Fingerprint follows content.
  const PolicyConfig a = baseline_policy_v1();
  PolicyConfig b = baseline_policy_v1();
  expect_eq_str(policy_fingerprint_hex(a), policy_fingerprint_hex(b), "policy fingerprint stable");
  b.high_default = Decision::Reduce;
  expect_true(policy_fingerprint_hex(a) != policy_fingerprint_hex(b), "policy fingerprint changes with tie-break");
}

void test_scale_bounds_fixed() {
  PolicyConfig wide = baseline_policy_v1();
  wide.likelihood_scale.raw_min = 0;
  wide.likelihood_scale.raw_max = 10;
  wide.likelihood_scale.labels.clear();
  expect_error(ErrorCode::kInvalidPolicy, [&] { wide.validate_or_throw(); }, "0..10 likelihood scale rejected");
  expect_error(ErrorCode::kInvalidPolicy, [&] { (void)score(make_input(1, 3), wide); },
               "score refuses a 0..10 scale before normalizing");

  ScaleSpec extreme;
  extreme.raw_min = std::numeric_limits<int>::min();
  extreme.raw_max = std::numeric_limits<int>::max();
  expect_error(ErrorCode::kInvalidPolicy, [&] { extreme.validate_or_throw("impact_scale"); },
               "INT_MIN..INT_MAX scale rejected");
  expect_error(ErrorCode::kInvalidPolicy, [&] { (void)normalize(3, extreme); },
               "normalize refuses INT_MIN..INT_MAX scale");

  PolicyConfig extreme_policy = baseline_policy_v1();
  extreme_policy.impact_scale = extreme;
  expect_error(ErrorCode::kInvalidPolicy, [&] { (void)score(make_input(4, 3), extreme_policy); },
               "score refuses INT_MIN..INT_MAX impact scale");

  PolicyConfig relabelled = baseline_policy_v1();
  relabelled.impact_scale.labels = {"1", "2", "3", "4", "5"};
  relabelled.validate_or_throw();
  pass("relabelled 1..5 scale accepted");
  expect_near(score(make_input(1, 5), relabelled).impact_norm, 1.0, 0.0, "raw 5 still normalizes to 1");
}

}  // namespace

int main() {
  std::cerr << "riskgate scoring selftest\n\n";
  try {
    test_normalize();
    test_confidence_is_metadata();
    test_aggregate();
    test_classify();
    test_band_table_validation();
    test_policy_validation();
    test_scale_bounds_fixed();
  } catch (const Error& e) {
    fail(std::string("unexpected error: ") + e.what());
  }
  return selftest_exit_code();
}
