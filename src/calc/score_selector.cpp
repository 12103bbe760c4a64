#include "calc/score_selector.h"
#include "calc/scoring_error.h"
#include <glog/logging.h>
#include <optional>
#include <tuple>

namespace riichi {
namespace calc {

namespace {

Wait WaitOf(const Decomposition& decomposition) {
  if (const auto* form = std::get_if<StandardForm>(&decomposition)) {
    return form->wait;
  }
  if (const auto* form = std::get_if<ThirteenOrphansForm>(&decomposition)) {
    return form->wait;
  }
  return Wait::Pair;
}

} // namespace

ScoreSelector::ScoreSelector(const RuleSet& rules) : translator_(rules) {}

bool ScoreSelector::Outranks(const ScoreBreakdown& a, const ScoreBreakdown& b) {
  bool a_yakuman = a.limit == LimitKind::Yakuman;
  bool b_yakuman = b.limit == LimitKind::Yakuman;
  if (a_yakuman != b_yakuman) {
    return a_yakuman;
  }
  if (a_yakuman) {
    return a.yakuman_multiple > b.yakuman_multiple;
  }
  return std::tie(a.base_points, a.han, a.fu) >
         std::tie(b.base_points, b.han, b.fu);
}

ScoreBreakdown ScoreSelector::SelectBest(
    const std::vector<Candidate>& candidates, const Context& context) const {
  std::optional<ScoreBreakdown> best;

  for (const auto& candidate : candidates) {
    if (!candidate.yaku.HasYaku()) {
      VLOG(1) << "No yaku under "
              << DescribeDecomposition(candidate.decomposition);
      continue;
    }

    ScoreBreakdown breakdown =
        translator_.Translate(candidate.yaku, candidate.fu.total, context);
    if (!candidate.yaku.is_yakuman) {
      breakdown.fu_detail = candidate.fu;
    }
    breakdown.decomposition = DescribeDecomposition(candidate.decomposition);
    breakdown.wait          = WaitName(WaitOf(candidate.decomposition));

    VLOG(1) << "Candidate " << breakdown.decomposition << ": "
            << breakdown.han << " han " << breakdown.fu << " fu, base "
            << breakdown.base_points;

    if (!best || Outranks(breakdown, *best)) {
      best = std::move(breakdown);
    }
  }

  if (!best) {
    throw ScoringException(ScoringError::NoYakuFound, kNoYakuMessage);
  }
  return *best;
}

} // namespace calc
} // namespace riichi
