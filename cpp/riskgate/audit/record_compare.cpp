#include "riskgate/audit/record_compare.hpp"

#include <algorithm>
#include <locale>
#include <sstream>

namespace riskgate {

namespace {

std::string num(double v) {
  std::ostringstream os;
  os.imbue(std::locale::classic());
  os.precision(17);
  os << v;
  return os.str();
}

std::string list(std::vector<std::string> v) {
  std::sort(v.begin(), v.end());
  std::string out = "[";
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (i) out += ", ";
    out += v[i];
  }
  return out + "]";
}

std::string domains(const ImpactInput& in) {
  std::vector<std::string> v;
  for (const auto d : in.domains) v.emplace_back(to_string(d));
  return list(std::move(v));
}

std::string justification(const AuditRecord& r) {
  return r.overridden() ? *r.override_justification() : std::string("<none>");
}

class DiffBuilder {
 public:
  explicit DiffBuilder(std::vector<FieldDiff>& out) : out_(out) {}

  void str(const char* field, const std::string& a, const std::string& b) {
    if (a != b) out_.push_back({field, a, b});
  }
  void i(const char* field, int a, int b) {
    if (a != b) out_.push_back({field, std::to_string(a), std::to_string(b)});
  }
  void d(const char* field, double a, double b) {
    if (a != b) out_.push_back({field, num(a), num(b)});
  }

 private:
  std::vector<FieldDiff>& out_;
};

}  // namespace

RecordComparison compare(const AuditRecord& a, const AuditRecord& b) {
  RecordComparison out;

  if (a.policy_version() != b.policy_version()) {
    out.code = ErrorCode::kNotComparable;
    out.message = "records sealed under different policy versions ('" + a.policy_version() + "' vs '" +
                  b.policy_version() + "')";
    return out;
  }
  if (a.policy_hash() != b.policy_hash()) {
    out.code = ErrorCode::kNotComparable;
    out.message = "records share policy version '" + a.policy_version() + "' but not its configuration";
    return out;
  }

  DiffBuilder db(out.diffs);

  db.str("input_hash", a.input_hash(), b.input_hash());

  const LikelihoodInput& la = a.input().likelihood;
  const LikelihoodInput& lb = b.input().likelihood;
  db.i("likelihood.raw", la.raw, lb.raw);
  db.i("likelihood.confidence", la.confidence, lb.confidence);
  db.str("likelihood.basis", to_string(la.basis), to_string(lb.basis));
  db.str("likelihood.signals", list(la.signals), list(lb.signals));

  const ImpactInput& ia = a.input().impact;
  const ImpactInput& ib = b.input().impact;
  db.str("impact.domains", domains(ia), domains(ib));
  db.str("impact.worst_credible_outcome", ia.worst_credible_outcome, ib.worst_credible_outcome);
  db.str("impact.reversibility", to_string(ia.reversibility), to_string(ib.reversibility));
  db.i("impact.raw_severity", ia.raw_severity, ib.raw_severity);
  db.i("impact.confidence", ia.confidence, ib.confidence);
  db.str("impact.acceptability_hint", to_string(ia.acceptability_hint), to_string(ib.acceptability_hint));

  db.d("likelihood_norm", a.normalized().likelihood_norm, b.normalized().likelihood_norm);
  db.d("impact_norm", a.normalized().impact_norm, b.normalized().impact_norm);
  db.d("overall", a.overall(), b.overall());
  db.str("category", to_string(a.category()), to_string(b.category()));

  db.str("computed_decision", to_string(a.computed_decision()), to_string(b.computed_decision()));
  db.str("applied_decision", to_string(a.applied_decision()), to_string(b.applied_decision()));
  db.str("override_justification", justification(a), justification(b));

  const std::size_t n = std::max(a.rationale().size(), b.rationale().size());
  for (std::size_t k = 0; k < n; ++k) {
    const std::string sa = k < a.rationale().size() ? a.rationale()[k].statement : std::string("<missing>");
    const std::string sb = k < b.rationale().size() ? b.rationale()[k].statement : std::string("<missing>");
    const std::string field = "rationale[" + std::to_string(k) + "]";
    db.str(field.c_str(), sa, sb);
  }

  out.sealed_at_differs = (a.sealed_at() != b.sealed_at());
  return out;
}

}  // namespace riskgate
