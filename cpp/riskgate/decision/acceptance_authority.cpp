#include "riskgate/decision/acceptance_authority.hpp"

namespace riskgate {

AcceptanceCheck check_acceptance(const AuditRecord& record,
                                 const PolicyConfig& policy,
                                 std::string_view role) {
  AcceptanceCheck out;

  if (record.policy_version() != policy.policy_version) {
    out.code = ErrorCode::kNotComparable;
    out.message = "record sealed under policy '" + record.policy_version() + "', not '" +
                  policy.policy_version + "'";
    return out;
  }
  if (record.policy_hash() != policy_fingerprint_hex(policy)) {
    out.code = ErrorCode::kNotComparable;
    out.message = "record sealed under a different configuration of policy '" + policy.policy_version + "'";
    return out;
  }
  policy.validate_or_throw();

  const double overall = record.overall();
  out.requires_escalation = overall >= policy.acceptance_escalation_threshold;

  for (const auto& a : policy.authority_matrix) {
    if (a.role == role) {
      out.role_known = true;
      out.role_limit = a.max_overall_to_accept;
      break;
    }
  }
  out.role_may_accept = out.role_known && overall <= out.role_limit;
  return out;
}

}  // namespace riskgate
