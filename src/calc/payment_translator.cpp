#include "calc/payment_translator.h"
#include "base/mahjong_constants.h"
#include <glog/logging.h>

namespace riichi {
namespace calc {

std::string LimitName(LimitKind limit) {
  switch (limit) {
  case LimitKind::None:
    return "";
  case LimitKind::Mangan:
    return "Mangan";
  case LimitKind::Haneman:
    return "Haneman";
  case LimitKind::Baiman:
    return "Baiman";
  case LimitKind::Sanbaiman:
    return "Sanbaiman";
  case LimitKind::KazoeYakuman:
    return "Kazoe Yakuman";
  case LimitKind::Yakuman:
    return "Yakuman";
  }
  return "";
}

PaymentTranslator::PaymentTranslator(const RuleSet& rules) : rules_(rules) {}

int PaymentTranslator::RoundUpHundred(int points) {
  return (points + 99) / 100 * 100;
}

int PaymentTranslator::BasePoints(int han, int fu, LimitKind* limit) const {
  *limit = LimitKind::None;

  if (han >= 13) {
    if (rules_.kazoe_yakuman) {
      *limit = LimitKind::KazoeYakuman;
      return base::kBasePointsYakuman;
    }
    *limit = LimitKind::Sanbaiman;
    return base::kBasePointsSanbaiman;
  }
  if (han >= 11) {
    *limit = LimitKind::Sanbaiman;
    return base::kBasePointsSanbaiman;
  }
  if (han >= 8) {
    *limit = LimitKind::Baiman;
    return base::kBasePointsBaiman;
  }
  if (han >= 6) {
    *limit = LimitKind::Haneman;
    return base::kBasePointsHaneman;
  }
  if (han >= 5) {
    *limit = LimitKind::Mangan;
    return base::kBasePointsMangan;
  }

  int points = fu * (1 << (2 + han));
  bool kiriage = rules_.kiriage_mangan &&
                 ((han == 4 && fu == 30) || (han == 3 && fu == 60));
  if (points >= base::kBasePointsMangan || kiriage) {
    *limit = LimitKind::Mangan;
    return base::kBasePointsMangan;
  }
  return points;
}

int PaymentTranslator::YakumanBasePoints(int multiple) const {
  return base::kBasePointsYakuman * multiple;
}

ScoreBreakdown PaymentTranslator::Translate(const YakuResult& yaku,
                                            int fu,
                                            const Context& context) const {
  ScoreBreakdown breakdown;
  breakdown.yaku = yaku.entries;
  if (yaku.is_yakuman) {
    breakdown.yakuman_multiple = yaku.yakuman_multiple;
  } else {
    breakdown.han = yaku.TotalHan();
    breakdown.fu  = fu;
  }
  Settle(breakdown, context);
  return breakdown;
}

void PaymentTranslator::Settle(ScoreBreakdown& breakdown,
                               const Context& context) const {
  if (breakdown.yakuman_multiple > 0 &&
      breakdown.limit != LimitKind::KazoeYakuman) {
    breakdown.limit       = LimitKind::Yakuman;
    breakdown.base_points = YakumanBasePoints(breakdown.yakuman_multiple);
  } else {
    breakdown.base_points =
        BasePoints(breakdown.han, breakdown.fu, &breakdown.limit);
    if (breakdown.limit == LimitKind::KazoeYakuman) {
      breakdown.yakuman_multiple = 1;
    }
  }

  breakdown.is_dealer = context.is_dealer;
  breakdown.tsumo     = context.IsTsumo();
  breakdown.payments.clear();
  breakdown.hand_points = 0;
  breakdown.honba_bonus = 0;

  int points = breakdown.base_points;
  if (context.IsTsumo()) {
    for (int w = 0; w < 4; ++w) {
      auto payer = static_cast<Wind>(w);
      if (payer == context.seat_wind) {
        continue;
      }
      bool dealer_pays = context.is_dealer || payer == Wind::East;
      int amount       = RoundUpHundred(points * (dealer_pays ? 2 : 1));
      int honba        = context.honba * base::kHonbaTsumoBonus;
      breakdown.payments.push_back({payer, amount + honba});
      breakdown.hand_points += amount;
      breakdown.honba_bonus += honba;
    }
  } else {
    int amount = RoundUpHundred(points * (context.is_dealer ? 6 : 4));
    int honba  = context.honba * base::kHonbaRonBonus;
    breakdown.payments.push_back({context.discarder, amount + honba});
    breakdown.hand_points = amount;
    breakdown.honba_bonus = honba;
  }

  breakdown.riichi_bonus = context.riichi_sticks * base::kRiichiStickValue;
  breakdown.total_points =
      breakdown.hand_points + breakdown.honba_bonus + breakdown.riichi_bonus;

  VLOG(1) << "Settled base " << points << " into " << breakdown.total_points
          << " points";
}

} // namespace calc
} // namespace riichi
