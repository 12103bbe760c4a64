#include <fstream>
#include <iostream>
#include <string>
#include <glog/logging.h>
#include <cxxopts.hpp>
#include "calc/score_calculator.h"
#include "calc/score_printer.h"
#include "config/rule_config.h"
#include "utils/hand_json.h"
#include "utils/hand_notation.h"

using namespace riichi;

void PrintUsageExamples() {
  std::cout << "Examples:\n";
  std::cout << "  1. Pinfu ron as South:\n";
  std::cout << "     riichi_calc \"234m567m789s33z34p5p\" --seat S\n\n";
  std::cout << "  2. Riichi tsumo with dora and a honba:\n";
  std::cout << "     riichi_calc \"123m456m789p2267s8s\" --seat W --tsumo "
               "--riichi --dora 1s --honba 1\n\n";
  std::cout << "  3. Open hand with a called pon:\n";
  std::cout << "     riichi_calc \"[555p,2]234m678s234s33m\" --seat N\n\n";
  std::cout << "  4. JSON request and output:\n";
  std::cout << "     riichi_calc --input request.json --json\n";
}

void PrintHandFormat() {
  std::cout << "\nHand string format:\n";
  std::cout << "  Number tiles: [0-9]+[mps], 0 is a red five\n";
  std::cout << "  Honor tiles: [1-7]z or letters ESWN (winds) PFC (white, "
               "green, red)\n";
  std::cout << "  Melds: [XXX] chi/pon, [XXXX] open kan, [XXXX,0] concealed "
               "kan, [XXX,N] called from direction N (1-3)\n";
  std::cout << "  The last loose tile is the winning tile\n";
}

bool BuildContext(const cxxopts::ParseResult& result, calc::Context* context) {
  if (result.count("seat") &&
      !utils::HandNotation::ParseWind(result["seat"].as<std::string>(),
                                      &context->seat_wind)) {
    return false;
  }
  if (result.count("round") &&
      !utils::HandNotation::ParseWind(result["round"].as<std::string>(),
                                      &context->round_wind)) {
    return false;
  }
  context->is_dealer = context->seat_wind == utils::Wind::East;

  if (result.count("tsumo")) {
    context->win_method = calc::WinMethod::Tsumo;
  }
  if (result.count("double-riichi")) {
    context->riichi = calc::RiichiType::DoubleRiichi;
  } else if (result.count("riichi")) {
    context->riichi = calc::RiichiType::Riichi;
  }
  context->ippatsu = result.count("ippatsu") > 0;
  context->haitei  = result.count("haitei") > 0;
  context->houtei  = result.count("houtei") > 0;
  context->rinshan = result.count("rinshan") > 0;
  context->chankan = result.count("chankan") > 0;
  context->tenhou  = result.count("tenhou") > 0;
  context->chiihou = result.count("chiihou") > 0;
  context->renhou  = result.count("renhou") > 0;

  if (result.count("dora") &&
      !utils::HandNotation::ParseTiles(result["dora"].as<std::string>(),
                                       &context->dora_indicators)) {
    return false;
  }
  if (result.count("ura") &&
      !utils::HandNotation::ParseTiles(result["ura"].as<std::string>(),
                                       &context->ura_dora_indicators)) {
    return false;
  }
  context->honba         = result["honba"].as<int>();
  context->riichi_sticks = result["sticks"].as<int>();

  if (result.count("discarder")) {
    utils::Wind discarder;
    if (!utils::HandNotation::ParseWind(result["discarder"].as<std::string>(),
                                        &discarder)) {
      return false;
    }
    context->discarder = discarder;
  }
  return true;
}

bool LoadRequest(const std::string& path,
                 calc::Hand* hand,
                 calc::Context* context) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG(ERROR) << "Cannot open request file: " << path;
    return false;
  }
  try {
    json document;
    file >> document;
    return utils::HandJson::ParseRequest(document, hand, context);
  } catch (const json::exception& e) {
    LOG(ERROR) << "Failed to parse request " << path << ": " << e.what();
    return false;
  }
}

int main(int argc, char* argv[]) {
  google::InitGoogleLogging(argv[0]);

  cxxopts::Options options("riichi_calc",
                           "Riichi Mahjong hand scoring calculator");

  options.add_options()("h,help", "Print help information")(
      "v,verbose", "Enable verbose logging output")(
      "example", "Show usage examples")(
      "hand", "Hand string", cxxopts::value<std::string>())(
      "input", "JSON request file", cxxopts::value<std::string>())(
      "rules", "Rule configuration JSON file", cxxopts::value<std::string>())(
      "json", "Print the result as JSON");

  options.add_options("Context")(
      "seat", "Seat wind (E/S/W/N)", cxxopts::value<std::string>())(
      "round", "Round wind (E/S/W/N)", cxxopts::value<std::string>())(
      "tsumo", "Won by self-draw")("riichi", "Riichi declared")(
      "double-riichi", "Double riichi declared")("ippatsu", "Ippatsu")(
      "haitei", "Won on the last draw")("houtei", "Won on the last discard")(
      "rinshan", "Won on a kan replacement draw")(
      "chankan", "Won by robbing a kan")("tenhou", "Tenhou")(
      "chiihou", "Chiihou")("renhou", "Renhou")(
      "dora", "Dora indicators, e.g. 3m5z", cxxopts::value<std::string>())(
      "ura", "Ura dora indicators", cxxopts::value<std::string>())(
      "honba", "Honba count", cxxopts::value<int>()->default_value("0"))(
      "sticks", "Riichi sticks on the table",
      cxxopts::value<int>()->default_value("0"))(
      "discarder", "Seat wind of the player who dealt in",
      cxxopts::value<std::string>());

  options.parse_positional({"hand"});
  options.positional_help("<hand_string>");

  try {
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      std::cout << options.help({"", "Context"});
      PrintHandFormat();
      return 0;
    }

    if (result.count("example")) {
      PrintUsageExamples();
      return 0;
    }

    if (result.count("verbose")) {
      FLAGS_logtostderr = 1;
      FLAGS_v           = 1;
    }

    auto& rule_config = config::RuleConfig::instance();
    if (result.count("rules") &&
        !rule_config.load(result["rules"].as<std::string>())) {
      std::cerr << "Error: Invalid rule configuration\n";
      return 1;
    }

    calc::Hand hand;
    calc::Context context;
    if (result.count("input")) {
      if (!LoadRequest(result["input"].as<std::string>(), &hand, &context)) {
        std::cerr << "Error: Invalid request file\n";
        return 1;
      }
    } else if (result.count("hand")) {
      if (!utils::HandNotation::Parse(result["hand"].as<std::string>(),
                                      &hand)) {
        std::cerr << "Error: Invalid hand string\n";
        return 1;
      }
      if (!BuildContext(result, &context)) {
        std::cerr << "Error: Invalid context options\n";
        return 1;
      }
    } else {
      std::cerr << "Error: a hand string or --input is required\n";
      std::cout << "\n" << options.help({"", "Context"});
      return 1;
    }

    LOG(INFO) << "Scoring hand " << utils::HandNotation::Format(hand)
              << " for " << utils::WindName(context.seat_wind) << " seat";

    calc::ScoreCalculator calculator(rule_config.rule_set());
    calc::ScoringResult scoring = calculator.Score(hand, context);

    if (result.count("json")) {
      std::cout << utils::HandJson::ResultToJson(scoring).dump(2) << "\n";
    } else {
      std::cout << "Hand: " << utils::HandNotation::Format(hand) << "\n";
      calc::ScorePrinter::PrintResult(scoring);
    }

    return scoring.success ? 0 : 1;

  } catch (const cxxopts::exceptions::exception& e) {
    LOG(ERROR) << "Command line parsing error: " << e.what();
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    LOG(ERROR) << "Exception occurred: " << e.what();
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
