#pragma once

namespace riichi {
namespace calc {

enum class YakumanStacking { Sum, Max };

struct RuleSet {
  bool open_tanyao                 = true;
  bool double_yakuman              = true;
  bool kazoe_yakuman               = true;
  bool kiriage_mangan              = false;
  YakumanStacking yakuman_stacking = YakumanStacking::Sum;
  bool aka_dora                    = true;
  bool renhou                      = true;
};

} // namespace calc
} // namespace riichi
