#include "utils/hand_json.h"
#include "utils/hand_notation.h"
#include <glog/logging.h>

namespace riichi {
namespace utils {

namespace {

const char* kFlagKeys[] = {"ippatsu", "haitei", "houtei", "rinshan",
                           "chankan", "tenhou", "chiihou", "renhou"};

template <typename ContextT>
auto FlagField(ContextT* context, const std::string& key)
    -> decltype(&context->ippatsu) {
  if (key == "ippatsu")
    return &context->ippatsu;
  if (key == "haitei")
    return &context->haitei;
  if (key == "houtei")
    return &context->houtei;
  if (key == "rinshan")
    return &context->rinshan;
  if (key == "chankan")
    return &context->chankan;
  if (key == "tenhou")
    return &context->tenhou;
  if (key == "chiihou")
    return &context->chiihou;
  if (key == "renhou")
    return &context->renhou;
  return nullptr;
}

std::string RiichiName(calc::RiichiType riichi) {
  switch (riichi) {
  case calc::RiichiType::Riichi:
    return "riichi";
  case calc::RiichiType::DoubleRiichi:
    return "double";
  default:
    return "none";
  }
}

bool ParseIndicators(const json& value,
                     const char* key,
                     std::vector<Tile>* tiles) {
  if (!value.is_string()) {
    LOG(ERROR) << key << " must be a tile string";
    return false;
  }
  return HandNotation::ParseTiles(value.get<std::string>(), tiles);
}

} // namespace

bool HandJson::ParseContext(const json& object, calc::Context* context) {
  if (!object.is_object()) {
    LOG(ERROR) << "context must be a JSON object";
    return false;
  }

  try {
    calc::Context parsed;

    if (object.contains("seat_wind") &&
        !HandNotation::ParseWind(object["seat_wind"].get<std::string>(),
                                 &parsed.seat_wind)) {
      return false;
    }
    if (object.contains("round_wind") &&
        !HandNotation::ParseWind(object["round_wind"].get<std::string>(),
                                 &parsed.round_wind)) {
      return false;
    }
    parsed.is_dealer = object.value("is_dealer",
                                    parsed.seat_wind == utils::Wind::East);

    std::string method = object.value("win_method", "ron");
    if (method == "tsumo") {
      parsed.win_method = calc::WinMethod::Tsumo;
    } else if (method != "ron") {
      LOG(ERROR) << "win_method must be \"ron\" or \"tsumo\", got " << method;
      return false;
    }

    std::string riichi = object.value("riichi", "none");
    if (riichi == "riichi") {
      parsed.riichi = calc::RiichiType::Riichi;
    } else if (riichi == "double") {
      parsed.riichi = calc::RiichiType::DoubleRiichi;
    } else if (riichi != "none") {
      LOG(ERROR) << "riichi must be none, riichi or double, got " << riichi;
      return false;
    }

    for (const char* key : kFlagKeys) {
      *FlagField(&parsed, key) = object.value(key, false);
    }

    if (object.contains("dora") &&
        !ParseIndicators(object["dora"], "dora", &parsed.dora_indicators)) {
      return false;
    }
    if (object.contains("ura_dora") &&
        !ParseIndicators(object["ura_dora"], "ura_dora",
                         &parsed.ura_dora_indicators)) {
      return false;
    }

    parsed.honba         = object.value("honba", 0);
    parsed.riichi_sticks = object.value("riichi_sticks", 0);

    if (object.contains("discarder")) {
      Wind discarder;
      if (!HandNotation::ParseWind(object["discarder"].get<std::string>(),
                                   &discarder)) {
        return false;
      }
      parsed.discarder = discarder;
    }

    *context = parsed;
    return true;
  } catch (const json::exception& e) {
    LOG(ERROR) << "Invalid context field: " << e.what();
    return false;
  }
}

bool HandJson::ParseRequest(const json& document,
                            calc::Hand* hand,
                            calc::Context* context) {
  if (!document.is_object() || !document.contains("hand") ||
      !document["hand"].is_string()) {
    LOG(ERROR) << "Request needs a \"hand\" string";
    return false;
  }
  if (!HandNotation::Parse(document["hand"].get<std::string>(), hand)) {
    return false;
  }
  if (document.contains("context")) {
    return ParseContext(document["context"], context);
  }
  *context = calc::Context();
  return true;
}

json HandJson::ContextToJson(const calc::Context& context) {
  json j;
  j["seat_wind"]  = WindName(context.seat_wind);
  j["round_wind"] = WindName(context.round_wind);
  j["is_dealer"]  = context.is_dealer;
  j["win_method"] = context.IsTsumo() ? "tsumo" : "ron";
  j["riichi"]     = RiichiName(context.riichi);
  for (const char* key : kFlagKeys) {
    j[key] = *FlagField(&context, key);
  }
  j["dora"]          = HandNotation::FormatTiles(context.dora_indicators);
  j["ura_dora"]      = HandNotation::FormatTiles(context.ura_dora_indicators);
  j["honba"]         = context.honba;
  j["riichi_sticks"] = context.riichi_sticks;
  if (context.discarder) {
    j["discarder"] = WindName(*context.discarder);
  }
  return j;
}

json HandJson::BreakdownToJson(const calc::ScoreBreakdown& breakdown) {
  json j;
  j["han"]              = breakdown.han;
  j["fu"]               = breakdown.fu;
  j["base_points"]      = breakdown.base_points;
  j["limit"]            = calc::LimitName(breakdown.limit);
  j["yakuman_multiple"] = breakdown.yakuman_multiple;
  j["dealer"]           = breakdown.is_dealer;
  j["win_method"]       = breakdown.tsumo ? "tsumo" : "ron";
  j["hand_points"]      = breakdown.hand_points;
  j["honba_bonus"]      = breakdown.honba_bonus;
  j["riichi_bonus"]     = breakdown.riichi_bonus;
  j["total_points"]     = breakdown.total_points;
  j["decomposition"]    = breakdown.decomposition;
  j["wait"]             = breakdown.wait;

  j["payments"] = json::array();
  for (const auto& payment : breakdown.payments) {
    json p;
    p["payer"]  = payment.payer ? json(WindName(*payment.payer)) : json();
    p["amount"] = payment.amount;
    j["payments"].push_back(p);
  }

  j["yaku"] = json::array();
  for (const auto& entry : breakdown.yaku) {
    json y;
    y["name"]    = calc::YakuName(entry.yaku);
    y["han"]     = entry.han;
    y["yakuman"] = entry.yakuman;
    j["yaku"].push_back(y);
  }
  return j;
}

json HandJson::ResultToJson(const calc::ScoringResult& result) {
  json j;
  j["success"] = result.success;
  if (result.success) {
    j["score"] = BreakdownToJson(result.breakdown);
  } else {
    j["error"]   = calc::ScoringErrorName(result.error);
    j["message"] = result.error_message;
  }
  return j;
}

} // namespace utils
} // namespace riichi
