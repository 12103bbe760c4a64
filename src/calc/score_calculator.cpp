#include "calc/score_calculator.h"
#include "calc/fu_calculator.h"
#include <glog/logging.h>

namespace riichi {
namespace calc {

ScoreCalculator::ScoreCalculator(const RuleSet& rules)
    : rules_(rules), evaluator_(rules), selector_(rules) {}

std::vector<Candidate> ScoreCalculator::Evaluate(const Hand& hand,
                                                 const Context& context) const {
  std::string conflict = FindContextConflict(hand, context);
  if (!conflict.empty()) {
    throw ScoringException(ScoringError::AmbiguousConfiguration, conflict);
  }

  std::vector<Candidate> candidates;
  for (const auto& decomposition : decomposer_.Decompose(hand)) {
    Candidate candidate{decomposition,
                        evaluator_.Evaluate(decomposition, hand, context),
                        FuDetail()};
    if (!candidate.yaku.is_yakuman) {
      candidate.fu = ComputeFuDetail(decomposition, hand, context,
                                     candidate.yaku.Has(Yaku::Pinfu));
    }
    candidates.push_back(std::move(candidate));
  }
  return candidates;
}

ScoringResult ScoreCalculator::Score(const Hand& hand,
                                     const Context& context) const {
  ScoringResult result;
  try {
    result.breakdown = selector_.SelectBest(Evaluate(hand, context), context);
    result.success   = true;
    LOG(INFO) << "Scored " << result.breakdown.total_points << " points ("
              << result.breakdown.han << " han " << result.breakdown.fu
              << " fu)";
  } catch (const ScoringException& e) {
    result.error         = e.error();
    result.error_message = e.what();
    if (e.error() == ScoringError::NoYakuFound) {
      LOG(WARNING) << e.what();
    } else {
      LOG(ERROR) << ScoringErrorName(e.error()) << ": " << e.what();
    }
  } catch (const std::exception& e) {
    LOG(ERROR) << "Unexpected failure while scoring: " << e.what();
    result.error         = ScoringError::InvalidHandShape;
    result.error_message = e.what();
  }
  return result;
}

} // namespace calc
} // namespace riichi
