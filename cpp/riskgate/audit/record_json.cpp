#include "riskgate/audit/record_json.hpp"

#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>

namespace riskgate {

static std::string json_escape(const std::string& s) {
  std::ostringstream o;
  o << '"';
  for (char c : s) {
    switch (c) {
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\b': o << "\\b";  break;
      case '\f': o << "\\f";  break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          o << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
        } else {
          o << c;
        }
    }
  }
  o << '"';
  return o.str();
}

namespace {

struct J {
  std::ostringstream out;
  bool pretty = true;
  int indent = 2;
  int level = 0;

  J() { out.imbue(std::locale::classic()); }

  void nl() {
    if (pretty) out << "\n" << std::string(static_cast<std::size_t>(level * indent), ' ');
  }

  void obj_begin() { out << "{"; level++; }
  void obj_end()   { level--; nl(); out << "}"; }

  void arr_begin() { out << "["; level++; }
  void arr_end()   { level--; nl(); out << "]"; }

  void key(const std::string& k) {
    out << json_escape(k) << (pretty ? ": " : ":");
  }

  void comma() { out << ","; }

  void str(const std::string& v) { out << json_escape(v); }
  void b(bool v) { out << (v ? "true" : "false"); }
  void n_null() { out << "null"; }

  void num(double v) {
    if (!std::isfinite(v)) { n_null(); return; }
    out << std::fixed << std::setprecision(6) << (v == 0.0 ? 0.0 : v);
  }

  void num_i(long long v) { out << v; }

  // First member: newline + key. Later members: comma, newline + key.
  void member(bool& first, const std::string& k) {
    if (!first) comma();
    first = false;
    nl();
    key(k);
  }
};

void emit_input(J& j, const RiskInput& in) {
  bool first = true;
  j.obj_begin();

  j.member(first, "likelihood");
  {
    bool f = true;
    j.obj_begin();
    j.member(f, "raw"); j.num_i(in.likelihood.raw);
    j.member(f, "confidence"); j.num_i(in.likelihood.confidence);
    j.member(f, "basis"); j.str(to_string(in.likelihood.basis));
    j.member(f, "signals");
    j.arr_begin();
    for (std::size_t i = 0; i < in.likelihood.signals.size(); ++i) {
      if (i) j.comma();
      j.nl(); j.str(in.likelihood.signals[i]);
    }
    j.arr_end();
    j.obj_end();
  }

  j.member(first, "impact");
  {
    bool f = true;
    j.obj_begin();
    j.member(f, "domains");
    j.arr_begin();
    bool fd = true;
    for (const auto d : in.impact.domains) {
      if (!fd) j.comma();
      fd = false;
      j.nl(); j.str(to_string(d));
    }
    j.arr_end();
    j.member(f, "worst_credible_outcome"); j.str(in.impact.worst_credible_outcome);
    j.member(f, "reversibility"); j.str(to_string(in.impact.reversibility));
    j.member(f, "raw_severity"); j.num_i(in.impact.raw_severity);
    j.member(f, "confidence"); j.num_i(in.impact.confidence);
    j.member(f, "acceptability_hint"); j.str(to_string(in.impact.acceptability_hint));
    j.obj_end();
  }

  j.obj_end();
}

}  // namespace

std::string audit_record_to_json(const AuditRecord& r, const JsonWriteOptions& opt) {
  J j;
  j.pretty = opt.pretty;

  bool first = true;
  j.obj_begin();

  j.member(first, "schema"); j.str("riskgate_audit_record_v1");
  j.member(first, "policy_version"); j.str(r.policy_version());
  j.member(first, "policy_hash"); j.str(r.policy_hash());
  j.member(first, "sealed_at"); j.str(r.sealed_at().iso8601);
  j.member(first, "sealed_at_epoch_ms"); j.num_i(static_cast<long long>(r.sealed_at().epoch_ms));
  j.member(first, "input_hash"); j.str(r.input_hash());

  j.member(first, "input"); emit_input(j, r.input());

  j.member(first, "likelihood_norm"); j.num(r.normalized().likelihood_norm);
  j.member(first, "impact_norm"); j.num(r.normalized().impact_norm);
  j.member(first, "overall"); j.num(r.overall());

  j.member(first, "band");
  {
    bool f = true;
    j.obj_begin();
    j.member(f, "category"); j.str(to_string(r.band().category));
    j.member(f, "low"); j.num(r.band().low);
    j.member(f, "high"); j.num(r.band().high);
    j.member(f, "closed_high"); j.b(r.band().closed_high);
    j.obj_end();
  }

  j.member(first, "computed_decision"); j.str(to_string(r.computed_decision()));
  j.member(first, "applied_decision"); j.str(to_string(r.applied_decision()));
  j.member(first, "tie_break_applied"); j.b(r.tie_break_applied());
  j.member(first, "override_justification");
  if (r.overridden()) j.str(*r.override_justification());
  else j.n_null();

  j.member(first, "rationale");
  j.arr_begin();
  for (std::size_t i = 0; i < r.rationale().size(); ++i) {
    const auto& step = r.rationale()[i];
    if (i) j.comma();
    j.nl();
    bool f = true;
    j.obj_begin();
    j.member(f, "stage"); j.str(to_string(step.stage));
    j.member(f, "statement"); j.str(step.statement);
    j.obj_end();
  }
  j.arr_end();

  j.member(first, "seal_hash"); j.str(r.seal_hash());

  j.obj_end();
  return j.out.str();
}

}  // namespace riskgate
