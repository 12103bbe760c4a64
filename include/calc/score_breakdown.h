#pragma once

#include "calc/fu_calculator.h"
#include "calc/yaku.h"
#include "utils/tile.h"
#include <optional>
#include <string>
#include <vector>

namespace riichi {
namespace calc {

enum class LimitKind {
  None,
  Mangan,
  Haneman,
  Baiman,
  Sanbaiman,
  KazoeYakuman,
  Yakuman,
};

std::string LimitName(LimitKind limit);

struct Payment {
  // Empty on a ron whose discarder was not named.
  std::optional<utils::Wind> payer;
  int amount = 0; // honba included
};

struct ScoreBreakdown {
  int han              = 0;
  int fu               = 0; // 0 for yakuman
  int base_points      = 0;
  LimitKind limit      = LimitKind::None;
  int yakuman_multiple = 0;
  bool is_dealer       = false;
  bool tsumo           = false;

  int hand_points  = 0; // payments before honba and riichi sticks
  int honba_bonus  = 0;
  int riichi_bonus = 0;
  int total_points = 0;
  std::vector<Payment> payments;

  std::vector<YakuEntry> yaku;
  FuDetail fu_detail;
  std::string decomposition;
  std::string wait;
};

} // namespace calc
} // namespace riichi
