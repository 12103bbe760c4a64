#include "calc/fu_calculator.h"
#include "calc/yaku_evaluator.h"
#include <glog/logging.h>

namespace riichi {
namespace calc {

int RoundUpFu(int fu) { return (fu + 9) / 10 * 10; }

int GroupFu(const Group& group, bool concealed) {
  if (!group.IsTripletLike()) {
    return 0;
  }
  int fu = group.tile.IsTerminalOrHonor() ? 4 : 2;
  if (concealed) {
    fu *= 2;
  }
  if (group.kind == GroupKind::Quad) {
    fu *= 4;
  }
  return fu;
}

int PairFu(const Tile& pair, const Context& context) {
  int fu = 0;
  if (pair.IsDragon()) {
    fu += 2;
  }
  if (pair.Is(context.seat_wind)) {
    fu += 2;
  }
  if (pair.Is(context.round_wind)) {
    fu += 2;
  }
  return fu;
}

FuDetail ComputeFuDetail(const Decomposition& decomposition,
                         const Hand& hand,
                         const Context& context,
                         bool pinfu) {
  FuDetail detail;

  if (std::holds_alternative<SevenPairsForm>(decomposition)) {
    detail.base  = kSevenPairsFu;
    detail.raw   = kSevenPairsFu;
    detail.total = kSevenPairsFu;
    return detail;
  }

  const auto* form = std::get_if<StandardForm>(&decomposition);
  if (!form) {
    // Thirteen orphans only ever scores as yakuman; keep the floor value.
    detail.raw   = detail.base;
    detail.total = RoundUpFu(detail.base);
    return detail;
  }

  bool closed = hand.IsClosed();
  if (closed && !context.IsTsumo()) {
    detail.menzen = 10;
  }
  if (context.IsTsumo() && !pinfu) {
    detail.tsumo = 2;
  }
  for (size_t i = 0; i < form->groups.size(); ++i) {
    detail.groups += GroupFu(
        form->groups[i],
        IsConcealedTriplet(*form, static_cast<int>(i), context));
  }
  if (form->wait == Wait::Edge || form->wait == Wait::Closed ||
      form->wait == Wait::Pair) {
    detail.wait = 2;
  }
  detail.pair = PairFu(form->pair.tile, context);

  detail.raw = detail.base + detail.menzen + detail.tsumo + detail.groups +
               detail.wait + detail.pair;
  detail.total = RoundUpFu(detail.raw);
  if (!closed && detail.total == 20) {
    detail.total = 30;
  }

  VLOG(1) << "Fu " << detail.raw << " -> " << detail.total << " for "
          << DescribeDecomposition(decomposition);
  return detail;
}

int ComputeFu(const Decomposition& decomposition,
              const Hand& hand,
              const Context& context,
              bool pinfu) {
  return ComputeFuDetail(decomposition, hand, context, pinfu).total;
}

} // namespace calc
} // namespace riichi
