#pragma once

#include "calc/decomposition.h"
#include "calc/hand.h"
#include "calc/rule_set.h"
#include "calc/yaku.h"
#include <vector>

namespace riichi {
namespace calc {

// Everything a yaku predicate may look at, computed once per decomposition.
struct HandView {
  const Hand* hand;
  const Context* context;
  const RuleSet* rules;
  const StandardForm* standard;
  const SevenPairsForm* seven_pairs;
  const ThirteenOrphansForm* thirteen_orphans;

  bool closed;
  std::vector<Tile> tiles;
  int concealed_triplets = 0;
  int triplets           = 0; // quads included
  int quads              = 0;
};

HandView MakeHandView(const Decomposition& decomposition,
                      const Hand& hand,
                      const Context& context,
                      const RuleSet& rules);

// A triplet counts as concealed unless it was called, or completed by the
// ron tile.
bool IsConcealedTriplet(const StandardForm& form,
                        int group_index,
                        const Context& context);

struct YakuRule {
  Yaku yaku;
  bool (*applies)(const HandView& view);
};

const std::vector<YakuRule>& RegularYakuRules();
const std::vector<YakuRule>& YakumanRules();

class YakuEvaluator {
public:
  explicit YakuEvaluator(const RuleSet& rules = RuleSet());

  YakuResult Evaluate(const Decomposition& decomposition,
                      const Hand& hand,
                      const Context& context) const;

  // Dora, aka dora and ura dora entries for the whole hand.
  std::vector<YakuEntry> CountDora(const Hand& hand,
                                   const Context& context) const;

private:
  RuleSet rules_;
};

} // namespace calc
} // namespace riichi
