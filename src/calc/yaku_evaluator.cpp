#include "calc/yaku_evaluator.h"
#include <algorithm>
#include <array>
#include <glog/logging.h>
#include <map>
#include <set>
#include <utility>

namespace riichi {
namespace calc {

namespace {

using utils::Dragon;
using utils::Suit;

bool IsValueTile(const Tile& tile, const Context& context) {
  return tile.IsDragon() || tile.Is(context.seat_wind) ||
         tile.Is(context.round_wind);
}

bool HasTripletOf(const HandView& view, const Tile& tile) {
  if (!view.standard) {
    return false;
  }
  const auto& groups = view.standard->groups;
  return std::any_of(groups.begin(), groups.end(), [&tile](const Group& g) {
    return g.IsTripletLike() && g.tile == tile;
  });
}

int CountTriplets(const HandView& view, Suit suit) {
  if (!view.standard) {
    return 0;
  }
  const auto& groups = view.standard->groups;
  return static_cast<int>(
      std::count_if(groups.begin(), groups.end(), [suit](const Group& g) {
        return g.IsTripletLike() && g.tile.suit() == suit;
      }));
}

bool PairIs(const HandView& view, Suit suit) {
  return view.standard && view.standard->pair.tile.suit() == suit;
}

int IdenticalRunPairs(const HandView& view) {
  if (!view.standard || !view.closed) {
    return 0;
  }
  std::map<int, int> runs;
  for (const auto& group : view.standard->groups) {
    if (group.kind == GroupKind::Run) {
      runs[group.tile.Index()]++;
    }
  }
  int pairs = 0;
  for (const auto& entry : runs) {
    pairs += entry.second / 2;
  }
  return pairs;
}

// True when some rank appears as `kind` in all three number suits.
bool SameRankInThreeSuits(const HandView& view, bool runs) {
  if (!view.standard) {
    return false;
  }
  std::map<int, std::set<Suit>> suits_by_rank;
  for (const auto& group : view.standard->groups) {
    bool matches = runs ? group.kind == GroupKind::Run
                        : (group.IsTripletLike() && group.tile.IsNumber());
    if (matches) {
      suits_by_rank[group.tile.rank()].insert(group.tile.suit());
    }
  }
  for (const auto& entry : suits_by_rank) {
    if (entry.second.size() == 3) {
      return true;
    }
  }
  return false;
}

bool PureStraight(const HandView& view) {
  if (!view.standard) {
    return false;
  }
  std::map<Suit, std::set<int>> starts;
  for (const auto& group : view.standard->groups) {
    if (group.kind == GroupKind::Run) {
      starts[group.tile.suit()].insert(group.tile.rank());
    }
  }
  for (const auto& entry : starts) {
    const auto& ranks = entry.second;
    if (ranks.count(1) && ranks.count(4) && ranks.count(7)) {
      return true;
    }
  }
  return false;
}

bool HasRun(const HandView& view) {
  const auto& groups = view.standard->groups;
  return std::any_of(groups.begin(), groups.end(), [](const Group& g) {
    return g.kind == GroupKind::Run;
  });
}

// Every group, pair included, touches a terminal (or an honor when allowed).
bool AllGroupsOutside(const HandView& view, bool allow_honors) {
  if (!view.standard) {
    return false;
  }
  std::vector<Group> groups(view.standard->groups.begin(),
                            view.standard->groups.end());
  groups.push_back(view.standard->pair);
  for (const auto& group : groups) {
    if (!group.HasTerminalOrHonor()) {
      return false;
    }
    if (!allow_honors && group.tile.IsHonor()) {
      return false;
    }
  }
  return HasRun(view);
}

bool AnyHonor(const HandView& view) {
  return std::any_of(view.tiles.begin(), view.tiles.end(),
                     [](const Tile& t) { return t.IsHonor(); });
}

// Number of distinct number suits present.
int NumberSuitCount(const HandView& view) {
  std::set<Suit> suits;
  for (const auto& tile : view.tiles) {
    if (tile.IsNumber()) {
      suits.insert(tile.suit());
    }
  }
  return static_cast<int>(suits.size());
}

template <typename Pred>
bool AllTiles(const HandView& view, Pred pred) {
  return std::all_of(view.tiles.begin(), view.tiles.end(), pred);
}

// Nine gates: 1112345678999 of one suit plus any tile of that suit, fully
// closed with no calls. `pure` is set when the extra tile is the winning one.
bool IsNineGates(const HandView& view, bool* pure) {
  if (!view.standard || !view.hand->melds.empty() ||
      NumberSuitCount(view) != 1 || AnyHonor(view)) {
    return false;
  }
  std::array<int, 10> ranks{};
  for (const auto& tile : view.tiles) {
    ranks[tile.rank()]++;
  }
  int extra_rank = 0;
  for (int rank = 1; rank <= 9; ++rank) {
    int required = (rank == 1 || rank == 9) ? 3 : 1;
    if (ranks[rank] < required) {
      return false;
    }
    if (ranks[rank] == required + 1) {
      extra_rank = rank;
    } else if (ranks[rank] != required) {
      return false;
    }
  }
  if (extra_rank == 0) {
    return false;
  }
  *pure = view.hand->winning_tile.rank() == extra_rank;
  return true;
}

const std::vector<std::pair<Yaku, Yaku>> SUPERSEDED = {
    {Yaku::DoubleRiichi, Yaku::Riichi},
    {Yaku::Ryanpeikou, Yaku::Iipeikou},
    {Yaku::Junchan, Yaku::Chanta},
    {Yaku::Honroutou, Yaku::Chanta},
    {Yaku::Chinitsu, Yaku::Honitsu},
    {Yaku::SanshokuDoujun, Yaku::SanshokuDoukou},
    {Yaku::SuuankouTanki, Yaku::Suuankou},
    {Yaku::KokushiMusou13Sided, Yaku::KokushiMusou},
    {Yaku::JunseiChuurenPoutou, Yaku::ChuurenPoutou},
};

void DropSuperseded(std::vector<YakuEntry>& entries) {
  auto has = [&entries](Yaku yaku) {
    return std::any_of(entries.begin(), entries.end(),
                       [yaku](const YakuEntry& e) { return e.yaku == yaku; });
  };
  for (const auto& rule : SUPERSEDED) {
    if (has(rule.first)) {
      entries.erase(std::remove_if(entries.begin(), entries.end(),
                                   [&rule](const YakuEntry& e) {
                                     return e.yaku == rule.second;
                                   }),
                    entries.end());
    }
  }
}

} // namespace

bool IsConcealedTriplet(const StandardForm& form,
                        int group_index,
                        const Context& context) {
  const Group& group = form.groups[group_index];
  if (!group.IsTripletLike() || !group.concealed) {
    return false;
  }
  bool ron_completed = group_index == form.winning_group &&
                       group.kind == GroupKind::Triplet && !context.IsTsumo();
  return !ron_completed;
}

HandView MakeHandView(const Decomposition& decomposition,
                      const Hand& hand,
                      const Context& context,
                      const RuleSet& rules) {
  HandView view;
  view.hand             = &hand;
  view.context          = &context;
  view.rules            = &rules;
  view.standard         = std::get_if<StandardForm>(&decomposition);
  view.seven_pairs      = std::get_if<SevenPairsForm>(&decomposition);
  view.thirteen_orphans = std::get_if<ThirteenOrphansForm>(&decomposition);
  view.closed           = hand.IsClosed();
  view.tiles            = DecompositionTiles(decomposition);

  if (view.standard) {
    for (size_t i = 0; i < view.standard->groups.size(); ++i) {
      const Group& group = view.standard->groups[i];
      if (group.IsTripletLike()) {
        view.triplets++;
      }
      if (group.kind == GroupKind::Quad) {
        view.quads++;
      }
      if (IsConcealedTriplet(*view.standard, static_cast<int>(i), context)) {
        view.concealed_triplets++;
      }
    }
  }
  return view;
}

const std::vector<YakuRule>& RegularYakuRules() {
  static const std::vector<YakuRule> rules = {
      {Yaku::Riichi,
       [](const HandView& v) {
         return v.context->riichi == RiichiType::Riichi;
       }},
      {Yaku::DoubleRiichi,
       [](const HandView& v) {
         return v.context->riichi == RiichiType::DoubleRiichi;
       }},
      {Yaku::Ippatsu, [](const HandView& v) { return v.context->ippatsu; }},
      {Yaku::MenzenTsumo,
       [](const HandView& v) { return v.closed && v.context->IsTsumo(); }},
      {Yaku::Haitei,
       [](const HandView& v) {
         return v.context->haitei && v.context->IsTsumo();
       }},
      {Yaku::Houtei,
       [](const HandView& v) {
         return v.context->houtei && !v.context->IsTsumo();
       }},
      {Yaku::Rinshan, [](const HandView& v) { return v.context->rinshan; }},
      {Yaku::Chankan, [](const HandView& v) { return v.context->chankan; }},
      {Yaku::Pinfu,
       [](const HandView& v) {
         if (!v.standard || !v.closed || v.standard->wait != Wait::TwoSided) {
           return false;
         }
         return v.triplets == 0 &&
                !IsValueTile(v.standard->pair.tile, *v.context);
       }},
      {Yaku::Tanyao,
       [](const HandView& v) {
         if (!v.closed && !v.rules->open_tanyao) {
           return false;
         }
         return AllTiles(v, [](const Tile& t) { return t.IsSimple(); });
       }},
      {Yaku::Iipeikou,
       [](const HandView& v) { return IdenticalRunPairs(v) == 1; }},
      {Yaku::Ryanpeikou,
       [](const HandView& v) { return IdenticalRunPairs(v) == 2; }},
      {Yaku::YakuhaiSeatWind,
       [](const HandView& v) {
         return HasTripletOf(v, Tile::OfWind(v.context->seat_wind));
       }},
      {Yaku::YakuhaiRoundWind,
       [](const HandView& v) {
         return HasTripletOf(v, Tile::OfWind(v.context->round_wind));
       }},
      {Yaku::YakuhaiWhite,
       [](const HandView& v) {
         return HasTripletOf(v, Tile::OfDragon(Dragon::White));
       }},
      {Yaku::YakuhaiGreen,
       [](const HandView& v) {
         return HasTripletOf(v, Tile::OfDragon(Dragon::Green));
       }},
      {Yaku::YakuhaiRed,
       [](const HandView& v) {
         return HasTripletOf(v, Tile::OfDragon(Dragon::Red));
       }},
      {Yaku::SanshokuDoujun,
       [](const HandView& v) { return SameRankInThreeSuits(v, true); }},
      {Yaku::SanshokuDoukou,
       [](const HandView& v) { return SameRankInThreeSuits(v, false); }},
      {Yaku::Ittsu, [](const HandView& v) { return PureStraight(v); }},
      {Yaku::Chanta,
       [](const HandView& v) {
         return AnyHonor(v) && AllGroupsOutside(v, true);
       }},
      {Yaku::Junchan,
       [](const HandView& v) { return AllGroupsOutside(v, false); }},
      {Yaku::Toitoi,
       [](const HandView& v) { return v.standard && v.triplets == 4; }},
      {Yaku::Sanankou,
       [](const HandView& v) { return v.concealed_triplets == 3; }},
      {Yaku::Sankantsu, [](const HandView& v) { return v.quads == 3; }},
      {Yaku::Shousangen,
       [](const HandView& v) {
         return CountTriplets(v, Suit::Dragon) == 2 &&
                PairIs(v, Suit::Dragon);
       }},
      {Yaku::Honroutou,
       [](const HandView& v) {
         if (v.thirteen_orphans) {
           return false;
         }
         return AllTiles(v,
                         [](const Tile& t) { return t.IsTerminalOrHonor(); }) &&
                AnyHonor(v) &&
                !AllTiles(v, [](const Tile& t) { return t.IsHonor(); });
       }},
      {Yaku::Honitsu,
       [](const HandView& v) {
         return NumberSuitCount(v) == 1 && AnyHonor(v);
       }},
      {Yaku::Chinitsu,
       [](const HandView& v) {
         return NumberSuitCount(v) == 1 && !AnyHonor(v);
       }},
      {Yaku::Chiitoitsu,
       [](const HandView& v) { return v.seven_pairs != nullptr; }},
  };
  return rules;
}

const std::vector<YakuRule>& YakumanRules() {
  static const std::vector<YakuRule> rules = {
      {Yaku::Tenhou, [](const HandView& v) { return v.context->tenhou; }},
      {Yaku::Chiihou, [](const HandView& v) { return v.context->chiihou; }},
      {Yaku::Renhou,
       [](const HandView& v) {
         return v.context->renhou && v.rules->renhou;
       }},
      {Yaku::KokushiMusou,
       [](const HandView& v) { return v.thirteen_orphans != nullptr; }},
      {Yaku::KokushiMusou13Sided,
       [](const HandView& v) {
         return v.thirteen_orphans && v.rules->double_yakuman &&
                v.thirteen_orphans->wait == Wait::ThirteenSided;
       }},
      {Yaku::Suuankou,
       [](const HandView& v) { return v.concealed_triplets == 4; }},
      {Yaku::SuuankouTanki,
       [](const HandView& v) {
         return v.concealed_triplets == 4 && v.rules->double_yakuman &&
                v.standard->wait == Wait::Pair;
       }},
      {Yaku::Daisangen,
       [](const HandView& v) { return CountTriplets(v, Suit::Dragon) == 3; }},
      {Yaku::Shousuushii,
       [](const HandView& v) {
         return CountTriplets(v, Suit::Wind) == 3 && PairIs(v, Suit::Wind);
       }},
      {Yaku::Daisuushii,
       [](const HandView& v) { return CountTriplets(v, Suit::Wind) == 4; }},
      {Yaku::Tsuuiisou,
       [](const HandView& v) {
         return AllTiles(v, [](const Tile& t) { return t.IsHonor(); });
       }},
      {Yaku::Chinroutou,
       [](const HandView& v) {
         return AllTiles(v, [](const Tile& t) { return t.IsTerminal(); });
       }},
      {Yaku::Ryuuiisou,
       [](const HandView& v) {
         return AllTiles(v, [](const Tile& t) { return t.IsGreen(); });
       }},
      {Yaku::Suukantsu, [](const HandView& v) { return v.quads == 4; }},
      {Yaku::ChuurenPoutou,
       [](const HandView& v) {
         bool pure = false;
         return IsNineGates(v, &pure);
       }},
      {Yaku::JunseiChuurenPoutou,
       [](const HandView& v) {
         bool pure = false;
         return IsNineGates(v, &pure) && pure && v.rules->double_yakuman;
       }},
  };
  return rules;
}

YakuEvaluator::YakuEvaluator(const RuleSet& rules) : rules_(rules) {}

YakuResult YakuEvaluator::Evaluate(const Decomposition& decomposition,
                                   const Hand& hand,
                                   const Context& context) const {
  HandView view = MakeHandView(decomposition, hand, context, rules_);
  YakuResult result;

  for (const auto& rule : YakumanRules()) {
    if (rule.applies(view)) {
      result.entries.push_back({rule.yaku, 0, GetYakuInfo(rule.yaku).yakuman});
    }
  }
  DropSuperseded(result.entries);

  if (!result.entries.empty()) {
    result.is_yakuman = true;
    if (rules_.yakuman_stacking == YakumanStacking::Max) {
      auto best = std::max_element(
          result.entries.begin(), result.entries.end(),
          [](const YakuEntry& a, const YakuEntry& b) {
            return a.yakuman < b.yakuman;
          });
      result.entries = {*best};
    }
    for (const auto& entry : result.entries) {
      result.yakuman_multiple += entry.yakuman;
    }
    VLOG(1) << "Yakuman x" << result.yakuman_multiple << " for "
            << DescribeDecomposition(decomposition);
    return result;
  }

  for (const auto& rule : RegularYakuRules()) {
    if (!rule.applies(view)) {
      continue;
    }
    const YakuInfo& info = GetYakuInfo(rule.yaku);
    int han              = view.closed ? info.closed_han : info.open_han;
    if (han > 0) {
      result.entries.push_back({rule.yaku, han, 0});
    }
  }
  DropSuperseded(result.entries);

  if (result.HasYaku()) {
    auto dora = CountDora(hand, context);
    result.entries.insert(result.entries.end(), dora.begin(), dora.end());
  }

  VLOG(1) << result.YakuHan() << " yaku han, " << result.DoraHan()
          << " dora han for " << DescribeDecomposition(decomposition);
  return result;
}

std::vector<YakuEntry> YakuEvaluator::CountDora(const Hand& hand,
                                                const Context& context) const {
  std::vector<Tile> tiles = hand.AllTiles();
  auto count_indicated    = [&tiles](const std::vector<Tile>& indicators) {
    int count = 0;
    for (const auto& indicator : indicators) {
      Tile dora = indicator.DoraSuccessor();
      count += static_cast<int>(std::count(tiles.begin(), tiles.end(), dora));
    }
    return count;
  };

  std::vector<YakuEntry> entries;
  int dora = count_indicated(context.dora_indicators);
  if (dora > 0) {
    entries.push_back({Yaku::Dora, dora, 0});
  }
  if (rules_.aka_dora) {
    int aka = static_cast<int>(std::count_if(
        tiles.begin(), tiles.end(), [](const Tile& t) { return t.is_red(); }));
    if (aka > 0) {
      entries.push_back({Yaku::AkaDora, aka, 0});
    }
  }
  if (context.IsRiichi()) {
    int ura = count_indicated(context.ura_dora_indicators);
    if (ura > 0) {
      entries.push_back({Yaku::UraDora, ura, 0});
    }
  }
  return entries;
}

} // namespace calc
} // namespace riichi
