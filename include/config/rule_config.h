#pragma once

#include "calc/rule_set.h"
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace riichi {
namespace config {

class RuleConfig {
public:
  static RuleConfig& instance();

  bool load(const std::string& config_file);
  bool load_from_string(const std::string& content);
  void reset();

  bool open_tanyao() const;
  bool double_yakuman() const;
  bool kazoe_yakuman() const;
  bool kiriage_mangan() const;
  calc::YakumanStacking yakuman_stacking() const;
  bool aka_dora() const;
  bool renhou() const;

  calc::RuleSet rule_set() const;

private:
  RuleConfig();

  bool apply(const json& document);
  bool get_flag(const char* key, bool fallback) const;

  json config_;
  bool loaded_;
};

} // namespace config
} // namespace riichi
