#pragma once
/*
================================================================================
Fragment 5.3 — Decision: Acceptance Authority (Advisory)
FILE: cpp/riskgate/decision/acceptance_authority.hpp

Answers, for a sealed record and a role:
  - does accepting this risk need escalation?  (overall >= policy threshold)
  - may this role accept it on its own?        (overall <= role limit)

Never alters a record's computed or applied decision. Refuses records sealed
under a different policy version, or under a different configuration carrying
the same version (code == kNotComparable).
================================================================================
*/

#include "riskgate/audit/audit_record.hpp"
#include "riskgate/core/error.hpp"
#include "riskgate/policy/policy.hpp"

#include <string>
#include <string_view>

namespace riskgate {

struct AcceptanceCheck {
  ErrorCode code = ErrorCode::kOk;
  std::string message;

  bool requires_escalation = false;
  bool role_known = false;
  double role_limit = 0.0;  // 0 for unknown roles
  bool role_may_accept = false;
};

AcceptanceCheck check_acceptance(const AuditRecord& record,
                                 const PolicyConfig& policy,
                                 std::string_view role);

}  // namespace riskgate
