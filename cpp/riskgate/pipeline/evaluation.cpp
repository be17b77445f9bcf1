#include "riskgate/pipeline/evaluation.hpp"

#include "riskgate/core/error.hpp"
#include "riskgate/core/logging.hpp"
#include "riskgate/scoring/aggregator.hpp"
#include "riskgate/scoring/scorer.hpp"

#include <utility>

namespace riskgate {

const char* to_string(EvaluationStage s) noexcept {
  switch (s) {
    case EvaluationStage::Draft:      return "Draft";
    case EvaluationStage::Scored:     return "Scored";
    case EvaluationStage::Classified: return "Classified";
    case EvaluationStage::Decided:    return "Decided";
    case EvaluationStage::Sealed:     return "Sealed";
    default:                          return "Unknown";
  }
}

Evaluation::Evaluation(PolicyConfig policy, RiskInput input)
    : policy_(std::move(policy)), input_(std::move(input)) {
  policy_.validate_or_throw();
}

void Evaluation::require_stage(EvaluationStage expected, const char* op) const {
  if (stage_ != expected) {
    RISKGATE_THROW(ErrorCode::kInvalidTransition,
                   std::string(op) + " requires stage " + to_string(expected) + ", evaluation is " +
                       to_string(stage_));
  }
}

void Evaluation::require_reached(EvaluationStage needed, const char* what) const {
  if (static_cast<int>(stage_) < static_cast<int>(needed)) {
    RISKGATE_THROW(ErrorCode::kInvalidTransition,
                   std::string(what) + " not available before stage " + to_string(needed) +
                       ", evaluation is " + to_string(stage_));
  }
}

RiskInput& Evaluation::draft_input() {
  require_stage(EvaluationStage::Draft, "draft_input");
  return input_;
}

const NormalizedScore& Evaluation::score() {
  require_stage(EvaluationStage::Draft, "score");
  try {
    normalized_ = riskgate::score(input_, policy_);
  } catch (const Error& e) {
    log(LogLevel::WARN, std::string("score rejected input: ") + e.message());
    throw;
  }
  stage_ = EvaluationStage::Scored;
  log(LogLevel::DEBUG, "evaluation -> Scored");
  return normalized_;
}

const BandMatch& Evaluation::classify() {
  require_stage(EvaluationStage::Scored, "classify");
  const double overall = aggregate(normalized_, policy_.aggregation);
  const BandMatch band = riskgate::classify(overall, policy_);
  overall_ = overall;
  band_ = band;
  stage_ = EvaluationStage::Classified;
  log(LogLevel::DEBUG, std::string("evaluation -> Classified (") + to_string(band_.category) + ")");
  return band_;
}

const DecisionOutcome& Evaluation::decide(const std::optional<Override>& ov) {
  require_stage(EvaluationStage::Classified, "decide");
  DecisionOutcome outcome;
  try {
    outcome = riskgate::decide(band_.category, tie_break_defaults(policy_), ov);
  } catch (const Error& e) {
    if (e.code() == ErrorCode::kInvalidOverride) {
      log(LogLevel::WARN, std::string("decide rejected override: ") + e.message());
    }
    throw;
  }
  DecisionRationale rationale = explain(input_, normalized_, overall_, band_, outcome, policy_);

  decision_ = std::move(outcome);
  rationale_ = std::move(rationale);
  stage_ = EvaluationStage::Decided;
  log(LogLevel::DEBUG, std::string("evaluation -> Decided (") + to_string(decision_.applied) + ")");
  return decision_;
}

const AuditRecord& Evaluation::seal(const UtcTimestamp& sealed_at) {
  require_stage(EvaluationStage::Decided, "seal");
  record_.emplace(riskgate::seal(policy_, input_, normalized_, overall_, band_, decision_, rationale_, sealed_at));
  stage_ = EvaluationStage::Sealed;
  return *record_;
}

const AuditRecord& Evaluation::seal() {
  require_stage(EvaluationStage::Decided, "seal");
  const UtcTimestamp now = utc_now();
  return seal(now);
}

const NormalizedScore& Evaluation::normalized() const {
  require_reached(EvaluationStage::Scored, "normalized score");
  return normalized_;
}

double Evaluation::overall() const {
  require_reached(EvaluationStage::Classified, "overall risk");
  return overall_;
}

const BandMatch& Evaluation::band() const {
  require_reached(EvaluationStage::Classified, "band match");
  return band_;
}

const DecisionOutcome& Evaluation::decision() const {
  require_reached(EvaluationStage::Decided, "decision");
  return decision_;
}

const DecisionRationale& Evaluation::rationale() const {
  require_reached(EvaluationStage::Decided, "rationale");
  return rationale_;
}

const AuditRecord& Evaluation::record() const {
  require_reached(EvaluationStage::Sealed, "audit record");
  return *record_;
}

Evaluation Evaluation::redraft(PolicyConfig policy) const {
  require_stage(EvaluationStage::Sealed, "redraft");
  return Evaluation(std::move(policy), input_);
}

AuditRecord evaluate_at(const PolicyConfig& policy,
                        const RiskInput& input,
                        const std::optional<Override>& ov,
                        const UtcTimestamp& sealed_at) {
  Evaluation ev(policy, input);
  ev.score();
  ev.classify();
  ev.decide(ov);
  return ev.seal(sealed_at);
}

AuditRecord evaluate(const PolicyConfig& policy,
                     const RiskInput& input,
                     const std::optional<Override>& ov) {
  Evaluation ev(policy, input);
  ev.score();
  ev.classify();
  ev.decide(ov);
  return ev.seal();
}

}  // namespace riskgate
