/*
================================================================================
Fragment 8.1 — CLI: Risk Evaluation Demo Harness (End-to-End Smoke Test)
FILE: cpp/cli/riskgate_demo_main.cpp

Purpose:
  - Run the two reference evaluations under the baseline v1 policy:
      1) likelihood 4 / impact 3 -> overall 0.375 -> Medium -> REDUCE
      2) likelihood 4 / impact 4 -> overall 0.5625 -> High -> MITIGATE,
         overridden to REDUCE with a justification
  - Print rationale + record JSON to stdout.

Usage:
  riskgate_demo

Hardening:
  - No silent success: any engine error prints and returns non-zero.
================================================================================
*/

#include "riskgate/audit/record_json.hpp"
#include "riskgate/core/error.hpp"
#include "riskgate/core/logging.hpp"
#include "riskgate/decision/acceptance_authority.hpp"
#include "riskgate/pipeline/evaluation.hpp"

#include <iostream>

static riskgate::RiskInput supplier_outage_input() {
  riskgate::RiskInput in;
  in.likelihood.raw = 4;
  in.likelihood.confidence = 3;
  in.likelihood.basis = riskgate::LikelihoodBasis::ExpertJudgement;
  in.likelihood.signals = {"single-source supplier", "two late deliveries this quarter"};

  in.impact.domains = {riskgate::ImpactDomain::Operational, riskgate::ImpactDomain::Financial};
  in.impact.worst_credible_outcome = "Production line halted for up to two weeks";
  in.impact.reversibility = riskgate::Reversibility::Partially;
  in.impact.raw_severity = 3;
  in.impact.confidence = 4;
  in.impact.acceptability_hint = riskgate::AcceptabilityHint::OnlyUnderConditions;
  return in;
}

static void print_record(const char* title, const riskgate::AuditRecord& rec) {
  std::cout << "==== " << title << " ====\n";
  std::cout << riskgate::render_rationale_text(rec.rationale());
  std::cout << riskgate::audit_record_to_json(rec) << "\n\n";
}

int main() {
  using namespace riskgate;

  try {
    const PolicyConfig policy = baseline_policy_v1();

    // Scenario 1: Medium, no override.
    const AuditRecord medium = evaluate(policy, supplier_outage_input());
    print_record("supplier outage (no override)", medium);

    // Scenario 2: High, overridden by a human with justification.
    RiskInput high_in = supplier_outage_input();
    high_in.impact.raw_severity = 4;
    Override ov;
    ov.value = Decision::Reduce;
    ov.justification = "insurance already in place";
    const AuditRecord high = evaluate(policy, high_in, ov);
    print_record("supplier outage, major impact (override)", high);

    const AcceptanceCheck chk = check_acceptance(high, policy, "department_head");
    std::cout << "acceptance: requires_escalation=" << (chk.requires_escalation ? "yes" : "no")
              << " department_head_may_accept=" << (chk.role_may_accept ? "yes" : "no") << "\n";
  } catch (const Error& e) {
    log(LogLevel::ERROR, e.what());
    return 1;
  }
  return 0;
}
