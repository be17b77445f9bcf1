#pragma once
/*
================================================================================
Fragment 7.1 — Pipeline: Evaluation State Machine
FILE: cpp/riskgate/pipeline/evaluation.hpp

Stages (forward only, none skipped):
  Draft -> Scored -> Classified -> Decided -> Sealed

  Draft       input editable via draft_input()
  score()     validate input + normalize          -> Scored
  classify()  aggregate + band match              -> Classified
  decide()    decision (+ override) + rationale   -> Decided
  seal()      immutable AuditRecord               -> Sealed (terminal)

Rules:
  - Calling a stage out of order throws kInvalidTransition.
  - A failing stage leaves the evaluation in its previous stage; nothing
    partial becomes observable.
  - The Evaluation owns a private copy of the policy and the input, so
    concurrent evaluations never share mutable state.
  - A Sealed evaluation is superseded via redraft(), never edited.
================================================================================
*/

#include "riskgate/audit/audit_record.hpp"
#include "riskgate/core/utc_time.hpp"
#include "riskgate/decision/decision_rules.hpp"
#include "riskgate/decision/explainability.hpp"
#include "riskgate/model/risk_input.hpp"
#include "riskgate/policy/policy.hpp"
#include "riskgate/scoring/classifier.hpp"

#include <cstdint>
#include <optional>

namespace riskgate {

enum class EvaluationStage : std::uint8_t {
  Draft      = 0,
  Scored     = 1,
  Classified = 2,
  Decided    = 3,
  Sealed     = 4,
};

const char* to_string(EvaluationStage s) noexcept;

class Evaluation {
 public:
  // Validates the policy (kInvalidPolicy) and starts in Draft.
  Evaluation(PolicyConfig policy, RiskInput input);

  EvaluationStage stage() const noexcept { return stage_; }
  const PolicyConfig& policy() const noexcept { return policy_; }
  const RiskInput& input() const noexcept { return input_; }

  // Draft only.
  RiskInput& draft_input();

  const NormalizedScore& score();
  const BandMatch& classify();
  const DecisionOutcome& decide(const std::optional<Override>& ov = std::nullopt);
  const AuditRecord& seal(const UtcTimestamp& sealed_at);
  const AuditRecord& seal();

  // Stage results; each throws kInvalidTransition before its stage is reached.
  const NormalizedScore& normalized() const;
  double overall() const;
  const BandMatch& band() const;
  const DecisionOutcome& decision() const;
  const DecisionRationale& rationale() const;
  const AuditRecord& record() const;

  // Sealed only: a new Draft over the same input under `policy`.
  Evaluation redraft(PolicyConfig policy) const;

 private:
  void require_stage(EvaluationStage expected, const char* op) const;
  void require_reached(EvaluationStage needed, const char* what) const;

  PolicyConfig policy_;
  RiskInput input_;
  EvaluationStage stage_ = EvaluationStage::Draft;

  NormalizedScore normalized_;
  double overall_ = 0.0;
  BandMatch band_;
  DecisionOutcome decision_;
  DecisionRationale rationale_;
  std::optional<AuditRecord> record_;
};

// Whole pipeline in one call; the timestamp is captured once at seal.
AuditRecord evaluate(const PolicyConfig& policy,
                     const RiskInput& input,
                     const std::optional<Override>& ov = std::nullopt);

AuditRecord evaluate_at(const PolicyConfig& policy,
                        const RiskInput& input,
                        const std::optional<Override>& ov,
                        const UtcTimestamp& sealed_at);

}  // namespace riskgate
