#include "riskgate/decision/explainability.hpp"

#include <limits>
#include <locale>
#include <sstream>

namespace riskgate {

namespace {

std::ostringstream classic_stream() {
  std::ostringstream os;
  os.imbue(std::locale::classic());
  return os;
}

std::string raw_with_label(int raw, const ScaleSpec& scale) {
  auto os = classic_stream();
  os << raw;
  if (const std::string* label = scale.label_for(raw)) os << " (" << *label << ")";
  return os.str();
}

std::string domain_list(const ImpactInput& impact) {
  std::string out = "[";
  bool first = true;
  for (const auto d : impact.domains) {  // std::set: enum order
    if (!first) out += ", ";
    out += to_string(d);
    first = false;
  }
  out += "]";
  return out;
}

std::string band_text(const BandMatch& b) {
  auto os = classic_stream();
  os << to_string(b.category) << " [" << format_number(b.low) << ", " << format_number(b.high)
     << (b.closed_high ? "]" : ")");
  return os.str();
}

RationaleStep likelihood_step(const RiskInput& in, const NormalizedScore& n, const PolicyConfig& p) {
  const ScaleSpec& s = p.likelihood_scale;
  auto os = classic_stream();
  os << "likelihood raw " << raw_with_label(in.likelihood.raw, s)
     << " -> normalized " << format_number(n.likelihood_norm)
     << " = (" << in.likelihood.raw << " - " << s.raw_min << ") / (" << s.raw_max << " - " << s.raw_min << ")"
     << "; confidence " << in.likelihood.confidence << "/5, basis " << to_string(in.likelihood.basis)
     << ", " << in.likelihood.signals.size() << " signal(s) recorded as metadata, not scored";
  return {RationaleStage::Likelihood, os.str()};
}

RationaleStep impact_step(const RiskInput& in, const NormalizedScore& n, const PolicyConfig& p) {
  const ScaleSpec& s = p.impact_scale;
  auto os = classic_stream();
  os << "impact raw " << raw_with_label(in.impact.raw_severity, s)
     << " -> normalized " << format_number(n.impact_norm)
     << " = (" << in.impact.raw_severity << " - " << s.raw_min << ") / (" << s.raw_max << " - " << s.raw_min << ")"
     << "; confidence " << in.impact.confidence << "/5, reversibility " << to_string(in.impact.reversibility)
     << ", domains " << domain_list(in.impact)
     << ", acceptability hint " << to_string(in.impact.acceptability_hint)
     << " recorded as metadata, not scored";
  return {RationaleStage::Impact, os.str()};
}

RationaleStep aggregate_step(const NormalizedScore& n, double overall, const PolicyConfig& p) {
  auto os = classic_stream();
  os << "overall = likelihood_norm x impact_norm = " << format_number(n.likelihood_norm)
     << " x " << format_number(n.impact_norm) << " = " << format_number(overall)
     << " (" << to_string(p.aggregation) << ")";
  return {RationaleStage::Aggregate, os.str()};
}

RationaleStep classify_step(double overall, const BandMatch& b, const PolicyConfig& p) {
  auto os = classic_stream();
  os << "overall " << format_number(overall) << " falls in band " << band_text(b)
     << " of policy " << p.policy_version;
  return {RationaleStage::Classify, os.str()};
}

RationaleStep decide_step(const BandMatch& b, const DecisionOutcome& d) {
  auto os = classic_stream();
  os << to_string(b.category) << " -> " << to_string(d.computed);
  if (!d.tie_break_applied) {
    os << " (fixed mapping)";
  } else if (b.category == RiskCategory::High) {
    os << " (policy tie-break default for High; admissible REDUCE | MITIGATE)";
  } else {
    os << " (policy tie-break default for Critical; admissible STOP | ESCALATE)";
  }
  return {RationaleStage::Decide, os.str()};
}

RationaleStep override_step(const DecisionOutcome& d) {
  auto os = classic_stream();
  if (d.overridden()) {
    os << "override applied: " << to_string(d.applied) << " replaces computed " << to_string(d.computed)
       << "; justification: \"" << *d.override_justification << "\"";
  } else {
    os << "no override; applied decision " << to_string(d.applied) << " equals computed";
  }
  return {RationaleStage::Override, os.str()};
}

}  // namespace

const char* to_string(RationaleStage s) noexcept {
  switch (s) {
    case RationaleStage::Likelihood: return "LIKELIHOOD";
    case RationaleStage::Impact:     return "IMPACT";
    case RationaleStage::Aggregate:  return "AGGREGATE";
    case RationaleStage::Classify:   return "CLASSIFY";
    case RationaleStage::Decide:     return "DECIDE";
    case RationaleStage::Override:   return "OVERRIDE";
    default:                         return "UNKNOWN";
  }
}

// Shortest decimal that parses back to exactly v.
std::string format_number(double v) {
  if (v == 0.0) v = 0.0;  // no "-0"
  std::string text;
  for (int digits = 6; digits <= std::numeric_limits<double>::max_digits10; ++digits) {
    auto os = classic_stream();
    os.precision(digits);
    os << v;
    text = os.str();

    std::istringstream back(text);
    back.imbue(std::locale::classic());
    double parsed = 0.0;
    if ((back >> parsed) && parsed == v) break;
  }
  return text;
}

DecisionRationale explain(const RiskInput& input,
                          const NormalizedScore& normalized,
                          double overall,
                          const BandMatch& band,
                          const DecisionOutcome& decision,
                          const PolicyConfig& policy) {
  DecisionRationale r;
  r.reserve(6);
  r.push_back(likelihood_step(input, normalized, policy));
  r.push_back(impact_step(input, normalized, policy));
  r.push_back(aggregate_step(normalized, overall, policy));
  r.push_back(classify_step(overall, band, policy));
  r.push_back(decide_step(band, decision));
  r.push_back(override_step(decision));
  return r;
}

std::string render_rationale_text(const DecisionRationale& r) {
  std::ostringstream os;
  for (std::size_t i = 0; i < r.size(); ++i) {
    os << (i + 1) << ". [" << to_string(r[i].stage) << "] " << r[i].statement << "\n";
  }
  return os.str();
}

}  // namespace riskgate
