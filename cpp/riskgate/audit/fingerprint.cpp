#include "riskgate/audit/fingerprint.hpp"

#include <algorithm>
#include <vector>

namespace riskgate {

Digest256 fingerprint(const RiskInput& input) {
  Sha256Hasher h;
  h.update_tag("RiskInput/v1");

  // Likelihood
  h.update_tag("Likelihood");
  h.update_i32(input.likelihood.raw);
  h.update_i32(input.likelihood.confidence);
  h.update_enum(input.likelihood.basis);

  std::vector<std::string> signals = input.likelihood.signals;
  std::sort(signals.begin(), signals.end());
  h.update_u64(static_cast<std::uint64_t>(signals.size()));
  for (const auto& s : signals) h.update_string(s);

  // Impact
  h.update_tag("Impact");
  h.update_u64(static_cast<std::uint64_t>(input.impact.domains.size()));
  for (const auto d : input.impact.domains) h.update_enum(d);
  h.update_string(input.impact.worst_credible_outcome);
  h.update_enum(input.impact.reversibility);
  h.update_i32(input.impact.raw_severity);
  h.update_i32(input.impact.confidence);
  h.update_enum(input.impact.acceptability_hint);

  return h.finish();
}

std::string fingerprint_hex(const RiskInput& input) {
  return digest_to_hex(fingerprint(input));
}

}  // namespace riskgate
