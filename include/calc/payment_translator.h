#pragma once

#include "calc/hand.h"
#include "calc/rule_set.h"
#include "calc/score_breakdown.h"

namespace riichi {
namespace calc {

// Turns han/fu or a yakuman multiple into base points and the payments owed
// by each opponent, honba and riichi deposits included.
class PaymentTranslator {
public:
  explicit PaymentTranslator(const RuleSet& rules = RuleSet());

  // Base points for a non-yakuman hand after the scoring-table cap.
  int BasePoints(int han, int fu, LimitKind* limit) const;

  int YakumanBasePoints(int multiple) const;

  ScoreBreakdown Translate(const YakuResult& yaku,
                           int fu,
                           const Context& context) const;

  // Fills base points, limit, payments and totals from han/fu (or the
  // yakuman multiple) already stored in `breakdown`.
  void Settle(ScoreBreakdown& breakdown, const Context& context) const;

  static int RoundUpHundred(int points);

private:
  RuleSet rules_;
};

} // namespace calc
} // namespace riichi
