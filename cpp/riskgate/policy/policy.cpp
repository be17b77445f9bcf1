#include "riskgate/policy/policy.hpp"

#include "riskgate/core/error.hpp"

#include <cmath>
#include <sstream>
#include <unordered_set>

namespace riskgate {

namespace {

bool is_finite(double x) noexcept { return std::isfinite(x) != 0; }

bool in_unit_interval(double x) noexcept { return is_finite(x) && x >= 0.0 && x <= 1.0; }

}  // namespace

// ----------------------------- ScaleSpec -------------------------------------

void ScaleSpec::validate_or_throw(const char* scale_name) const {
  const std::string name = scale_name ? scale_name : "scale";
  // Policies relabel the scale; they never move its bounds.
  RISKGATE_ENSURE(raw_min == kRatingMin && raw_max == kRatingMax, ErrorCode::kInvalidPolicy,
                  name + ": scale must be [" + std::to_string(kRatingMin) + "," + std::to_string(kRatingMax) + "]");
  if (!labels.empty()) {
    const auto expected = static_cast<std::size_t>(raw_max - raw_min + 1);
    RISKGATE_ENSURE(labels.size() == expected, ErrorCode::kInvalidPolicy,
                    name + ": labels must have one entry per raw value");
    for (const auto& l : labels) {
      RISKGATE_ENSURE(!l.empty(), ErrorCode::kInvalidPolicy, name + ": empty label");
    }
  }
}

const std::string* ScaleSpec::label_for(int raw) const noexcept {
  if (labels.empty() || raw < raw_min || raw > raw_max) return nullptr;
  return &labels[static_cast<std::size_t>(raw - raw_min)];
}

const char* to_string(AggregationOp op) noexcept {
  switch (op) {
    case AggregationOp::Product: return "product";
    default:                     return "unknown";
  }
}

// ----------------------------- Bands -----------------------------------------

void validate_band_table(const std::vector<Band>& bands) {
  RISKGATE_ENSURE(bands.size() == static_cast<std::size_t>(kRiskCategoryCount), ErrorCode::kInvalidPolicy,
                  "band table must have exactly one band per category");

  for (std::size_t i = 0; i < bands.size(); ++i) {
    const Band& b = bands[i];
    std::ostringstream where;
    where << "band[" << i << "] (" << to_string(b.category) << ")";

    RISKGATE_ENSURE(static_cast<std::size_t>(b.category) == i, ErrorCode::kInvalidPolicy,
                    where.str() + ": categories must ascend Low, Medium, High, Critical");
    RISKGATE_ENSURE(in_unit_interval(b.low) && in_unit_interval(b.high), ErrorCode::kInvalidPolicy,
                    where.str() + ": bounds must be finite and within [0,1]");
    RISKGATE_ENSURE(b.low < b.high, ErrorCode::kInvalidPolicy,
                    where.str() + ": low must be < high");

    if (i > 0) {
      // Exact equality: shared edges make the partition gapless and non-overlapping.
      RISKGATE_ENSURE(bands[i - 1].high == b.low, ErrorCode::kInvalidPolicy,
                      where.str() + ": must start exactly where the previous band ends");
    }
  }

  RISKGATE_ENSURE(bands.front().low == 0.0, ErrorCode::kInvalidPolicy, "band table must start at 0.0");
  RISKGATE_ENSURE(bands.back().high == 1.0, ErrorCode::kInvalidPolicy, "band table must end at 1.0");
}

// ----------------------------- PolicyConfig ----------------------------------

void PolicyConfig::validate_or_throw() const {
  RISKGATE_ENSURE(!policy_version.empty(), ErrorCode::kInvalidPolicy, "policy_version empty");

  likelihood_scale.validate_or_throw("likelihood_scale");
  impact_scale.validate_or_throw("impact_scale");

  RISKGATE_ENSURE(aggregation == AggregationOp::Product, ErrorCode::kInvalidPolicy,
                  "unsupported aggregation operator");

  validate_band_table(bands);

  RISKGATE_ENSURE(high_default == Decision::Reduce || high_default == Decision::Mitigate,
                  ErrorCode::kInvalidPolicy, "high_default must be REDUCE or MITIGATE");
  RISKGATE_ENSURE(critical_default == Decision::Stop || critical_default == Decision::Escalate,
                  ErrorCode::kInvalidPolicy, "critical_default must be STOP or ESCALATE");

  RISKGATE_ENSURE(in_unit_interval(acceptance_escalation_threshold), ErrorCode::kInvalidPolicy,
                  "acceptance_escalation_threshold must be within [0,1]");

  std::unordered_set<std::string> roles;
  for (const auto& a : authority_matrix) {
    RISKGATE_ENSURE(!a.role.empty(), ErrorCode::kInvalidPolicy, "authority_matrix: empty role");
    RISKGATE_ENSURE(in_unit_interval(a.max_overall_to_accept), ErrorCode::kInvalidPolicy,
                    "authority_matrix: limit for '" + a.role + "' must be within [0,1]");
    RISKGATE_ENSURE(roles.insert(a.role).second, ErrorCode::kInvalidPolicy,
                    "authority_matrix: duplicate role '" + a.role + "'");
  }
}

PolicyConfig baseline_policy_v1() {
  PolicyConfig p;
  p.policy_version = "v1";

  p.likelihood_scale.raw_min = 1;
  p.likelihood_scale.raw_max = 5;
  p.likelihood_scale.labels = {"Rare", "Unlikely", "Possible", "Likely", "Almost certain"};

  p.impact_scale.raw_min = 1;
  p.impact_scale.raw_max = 5;
  p.impact_scale.labels = {"Negligible", "Minor", "Moderate", "Major", "Severe"};

  p.aggregation = AggregationOp::Product;

  p.bands = {
      {RiskCategory::Low,      0.0, 0.2},
      {RiskCategory::Medium,   0.2, 0.4},
      {RiskCategory::High,     0.4, 0.7},
      {RiskCategory::Critical, 0.7, 1.0},
  };

  p.high_default = Decision::Mitigate;
  p.critical_default = Decision::Escalate;

  p.acceptance_escalation_threshold = 0.4;
  p.authority_matrix = {
      {"risk_owner",      0.2},
      {"department_head", 0.4},
      {"executive",       0.7},
      {"board",           1.0},
  };
  return p;
}

Digest256 policy_fingerprint(const PolicyConfig& p) {
  p.validate_or_throw();

  Sha256Hasher h;
  h.update_tag("PolicyConfig/v1");

  h.update_tag("Identity");
  h.update_string(p.policy_version);

  auto add_scale = [&h](const char* tag, const ScaleSpec& s) {
    h.update_tag(tag);
    h.update_i32(s.raw_min);
    h.update_i32(s.raw_max);
    h.update_u64(static_cast<std::uint64_t>(s.labels.size()));
    for (const auto& l : s.labels) h.update_string(l);
  };
  add_scale("LikelihoodScale", p.likelihood_scale);
  add_scale("ImpactScale", p.impact_scale);

  h.update_tag("Aggregation");
  h.update_enum(p.aggregation);

  h.update_tag("Bands");
  h.update_u64(static_cast<std::uint64_t>(p.bands.size()));
  for (const auto& b : p.bands) {
    h.update_enum(b.category);
    h.update_f64(b.low);
    h.update_f64(b.high);
    h.update_u8(0x1E);
  }

  h.update_tag("TieBreak");
  h.update_enum(p.high_default);
  h.update_enum(p.critical_default);

  h.update_tag("Acceptance");
  h.update_f64(p.acceptance_escalation_threshold);
  h.update_u64(static_cast<std::uint64_t>(p.authority_matrix.size()));
  for (const auto& a : p.authority_matrix) {
    h.update_string(a.role);
    h.update_f64(a.max_overall_to_accept);
    h.update_u8(0x1E);
  }

  return h.finish();
}

std::string policy_fingerprint_hex(const PolicyConfig& p) {
  return digest_to_hex(policy_fingerprint(p));
}

}  // namespace riskgate
