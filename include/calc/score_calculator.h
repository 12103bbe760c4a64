#pragma once

#include "calc/decomposer.h"
#include "calc/hand.h"
#include "calc/rule_set.h"
#include "calc/score_breakdown.h"
#include "calc/score_selector.h"
#include "calc/scoring_error.h"
#include "calc/yaku_evaluator.h"
#include <string>
#include <vector>

namespace riichi {
namespace calc {

struct ScoringResult {
  bool success       = false;
  ScoringError error = ScoringError::None;
  std::string error_message;
  ScoreBreakdown breakdown;
};

// Decompose, evaluate every reading, pick the best and settle payments.
class ScoreCalculator {
public:
  explicit ScoreCalculator(const RuleSet& rules = RuleSet());

  // Never throws; failures come back in the result.
  ScoringResult Score(const Hand& hand, const Context& context) const;

  // Every decomposition with its yaku and fu. Throws ScoringException.
  std::vector<Candidate> Evaluate(const Hand& hand,
                                  const Context& context) const;

  const RuleSet& rules() const { return rules_; }

private:
  RuleSet rules_;
  Decomposer decomposer_;
  YakuEvaluator evaluator_;
  ScoreSelector selector_;
};

} // namespace calc
} // namespace riichi
