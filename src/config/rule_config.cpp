#include "config/rule_config.h"
#include <algorithm>
#include <array>
#include <fstream>
#include <glog/logging.h>

namespace riichi {
namespace config {

namespace {

const std::array<const char*, 6> FLAG_KEYS = {
    "open_tanyao", "double_yakuman", "kazoe_yakuman",
    "kiriage_mangan", "aka_dora", "renhou",
};

bool IsFlagKey(const std::string& key) {
  return std::find(FLAG_KEYS.begin(), FLAG_KEYS.end(), key) != FLAG_KEYS.end();
}

} // namespace

RuleConfig::RuleConfig() : loaded_(false) {}

RuleConfig& RuleConfig::instance() {
  static RuleConfig config;
  return config;
}

bool RuleConfig::load(const std::string& config_file) {
  std::ifstream file(config_file);
  if (!file.is_open()) {
    LOG(ERROR) << "Cannot open rule config: " << config_file;
    return false;
  }

  try {
    json document;
    file >> document;
    return apply(document);
  } catch (const json::exception& e) {
    LOG(ERROR) << "Failed to parse rule config " << config_file << ": "
               << e.what();
    return false;
  }
}

bool RuleConfig::load_from_string(const std::string& content) {
  try {
    return apply(json::parse(content));
  } catch (const json::exception& e) {
    LOG(ERROR) << "Failed to parse rule config: " << e.what();
    return false;
  }
}

void RuleConfig::reset() {
  config_ = json();
  loaded_ = false;
}

bool RuleConfig::apply(const json& document) {
  if (!document.is_object()) {
    LOG(ERROR) << "Rule config must be a JSON object";
    return false;
  }
  if (document.contains("rules") && !document["rules"].is_object()) {
    LOG(ERROR) << "\"rules\" must be an object";
    return false;
  }
  if (document.contains("rules")) {
    const auto& rules = document["rules"];
    if (rules.contains("yakuman_stacking")) {
      const auto& stacking = rules["yakuman_stacking"];
      if (!stacking.is_string() ||
          (stacking != "sum" && stacking != "max")) {
        LOG(ERROR) << "yakuman_stacking must be \"sum\" or \"max\"";
        return false;
      }
    }
    for (const auto& item : rules.items()) {
      if (item.key() == "yakuman_stacking") {
        continue;
      }
      if (!IsFlagKey(item.key())) {
        LOG(ERROR) << "Unknown rule " << item.key();
        return false;
      }
      if (!item.value().is_boolean()) {
        LOG(ERROR) << "Rule " << item.key() << " must be true or false";
        return false;
      }
    }
  }

  config_ = document;
  loaded_ = true;
  LOG(INFO) << "Loaded rule config";
  return true;
}

bool RuleConfig::get_flag(const char* key, bool fallback) const {
  if (!loaded_ || !config_.contains("rules"))
    return fallback;
  return config_["rules"].value(key, fallback);
}

bool RuleConfig::open_tanyao() const { return get_flag("open_tanyao", true); }

bool RuleConfig::double_yakuman() const {
  return get_flag("double_yakuman", true);
}

bool RuleConfig::kazoe_yakuman() const {
  return get_flag("kazoe_yakuman", true);
}

bool RuleConfig::kiriage_mangan() const {
  return get_flag("kiriage_mangan", false);
}

calc::YakumanStacking RuleConfig::yakuman_stacking() const {
  if (!loaded_ || !config_.contains("rules"))
    return calc::YakumanStacking::Sum;
  std::string stacking = config_["rules"].value("yakuman_stacking", "sum");
  return stacking == "max" ? calc::YakumanStacking::Max
                           : calc::YakumanStacking::Sum;
}

bool RuleConfig::aka_dora() const { return get_flag("aka_dora", true); }

bool RuleConfig::renhou() const { return get_flag("renhou", true); }

calc::RuleSet RuleConfig::rule_set() const {
  calc::RuleSet rules;
  rules.open_tanyao      = open_tanyao();
  rules.double_yakuman   = double_yakuman();
  rules.kazoe_yakuman    = kazoe_yakuman();
  rules.kiriage_mangan   = kiriage_mangan();
  rules.yakuman_stacking = yakuman_stacking();
  rules.aka_dora         = aka_dora();
  rules.renhou           = renhou();
  return rules;
}

} // namespace config
} // namespace riichi
