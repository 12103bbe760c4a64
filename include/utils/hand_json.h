#pragma once

#include "calc/hand.h"
#include "calc/score_calculator.h"
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace riichi {
namespace utils {

// Request documents look like
//   {"hand": "234m567p789s11z5p",
//    "context": {"seat_wind": "South", "round_wind": "East",
//                "win_method": "ron", "riichi": "riichi",
//                "dora": "4m", "honba": 1}}
class HandJson {
public:
  static bool ParseRequest(const json& document,
                           calc::Hand* hand,
                           calc::Context* context);

  static bool ParseContext(const json& object, calc::Context* context);

  static json ContextToJson(const calc::Context& context);
  static json BreakdownToJson(const calc::ScoreBreakdown& breakdown);
  static json ResultToJson(const calc::ScoringResult& result);
};

} // namespace utils
} // namespace riichi
