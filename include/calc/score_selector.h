#pragma once

#include "calc/decomposition.h"
#include "calc/fu_calculator.h"
#include "calc/payment_translator.h"
#include "calc/yaku.h"
#include <vector>

namespace riichi {
namespace calc {

// One scored reading of the hand.
struct Candidate {
  Decomposition decomposition;
  YakuResult yaku;
  FuDetail fu; // untouched for yakuman
};

class ScoreSelector {
public:
  explicit ScoreSelector(const RuleSet& rules = RuleSet());

  // Best-scoring candidate, settled into payments. Candidates without a
  // yaku are skipped; throws ScoringException(NoYakuFound) when none is left.
  ScoreBreakdown SelectBest(const std::vector<Candidate>& candidates,
                            const Context& context) const;

  // Yakuman first (by multiple), then base points, han and fu.
  static bool Outranks(const ScoreBreakdown& a, const ScoreBreakdown& b);

private:
  PaymentTranslator translator_;
};

} // namespace calc
} // namespace riichi
