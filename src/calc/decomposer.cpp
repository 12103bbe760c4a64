#include "calc/decomposer.h"
#include "calc/scoring_error.h"
#include <algorithm>
#include <glog/logging.h>
#include <set>
#include <sstream>

namespace riichi {
namespace calc {

namespace {

struct SearchState {
  TileCounts counts;
  std::vector<Group> groups;
};

Group MeldToGroup(const Meld& meld) {
  Group group;
  switch (meld.type) {
  case MeldType::Chi:
    group.kind = GroupKind::Run;
    break;
  case MeldType::Pon:
    group.kind = GroupKind::Triplet;
    break;
  case MeldType::Kan:
    group.kind = GroupKind::Quad;
    break;
  }
  group.tile      = Tile::FromIndex(meld.Head().Index());
  group.concealed = meld.concealed;
  group.declared  = true;
  return group;
}

std::string FormKey(const StandardForm& form) {
  std::ostringstream oss;
  for (const auto& group : form.groups) {
    oss << static_cast<int>(group.kind) << ":" << group.tile.Index() << ":"
        << group.concealed << group.declared << ";";
  }
  oss << "p" << form.pair.tile.Index() << "|";
  if (form.winning_group < 0) {
    oss << "pair";
  } else {
    const Group& won = form.groups[form.winning_group];
    oss << static_cast<int>(won.kind) << ":" << won.tile.Index();
  }
  oss << "|" << static_cast<int>(form.wait);
  return oss.str();
}

} // namespace

Wait ClassifyWait(const Group& group, const Tile& winning_tile) {
  switch (group.kind) {
  case GroupKind::Pair:
    return Wait::Pair;
  case GroupKind::Triplet:
  case GroupKind::Quad:
    return Wait::DualTriplet;
  case GroupKind::Run:
    break;
  }

  int start = group.tile.rank();
  int won   = winning_tile.rank();
  if (won == start + 1) {
    return Wait::Closed;
  }
  if (won == start) {
    return start == 7 ? Wait::Edge : Wait::TwoSided;
  }
  return start == 1 ? Wait::Edge : Wait::TwoSided;
}

Decomposer::Decomposer(int max_expansions) : max_expansions_(max_expansions) {}

TileCounts Decomposer::CountTiles(const std::vector<Tile>& tiles) {
  TileCounts counts{};
  for (const auto& tile : tiles) {
    counts[tile.Index()]++;
  }
  return counts;
}

std::vector<Decomposition> Decomposer::Decompose(const Hand& hand) const {
  std::string defect = FindHandDefect(hand);
  if (!defect.empty()) {
    LOG(ERROR) << "Rejecting hand: " << defect;
    throw ScoringException(ScoringError::InvalidHandShape, defect);
  }

  std::vector<Decomposition> decompositions;

  for (auto& form : FindStandardForms(hand)) {
    decompositions.emplace_back(std::move(form));
  }
  if (auto seven_pairs = FindSevenPairs(hand)) {
    decompositions.emplace_back(*seven_pairs);
  }
  if (auto orphans = FindThirteenOrphans(hand)) {
    decompositions.emplace_back(*orphans);
  }

  if (decompositions.empty()) {
    LOG(ERROR) << "No winning shape fits the hand";
    throw ScoringException(ScoringError::InvalidHandShape,
                           "Hand does not form a winning shape");
  }

  LOG(INFO) << "Found " << decompositions.size() << " decomposition(s)";
  for (const auto& decomposition : decompositions) {
    VLOG(1) << "  " << DescribeDecomposition(decomposition);
  }
  return decompositions;
}

std::vector<std::vector<Group>> Decomposer::PartitionIntoGroups(
    const TileCounts& counts, int* expansions) const {
  std::vector<std::vector<Group>> partitions;
  std::set<TileCounts> dead;
  std::vector<SearchState> stack;
  stack.push_back({counts, {}});

  while (!stack.empty()) {
    if (++(*expansions) > max_expansions_) {
      throw ScoringException(ScoringError::InvalidHandShape,
                             "Decomposition search exceeded its budget");
    }

    SearchState state = std::move(stack.back());
    stack.pop_back();

    int i = 0;
    while (i < base::kTileKinds && state.counts[i] == 0) {
      ++i;
    }
    if (i == base::kTileKinds) {
      partitions.push_back(std::move(state.groups));
      continue;
    }

    bool branched = false;
    Tile head     = Tile::FromIndex(i);

    // The lowest remaining tile is either the start of a triplet or the
    // start of a run; every partition is reached through exactly one path.
    if (state.counts[i] >= 3) {
      SearchState child = state;
      child.counts[i] -= 3;
      if (dead.count(child.counts) == 0) {
        child.groups.push_back({GroupKind::Triplet, head, true});
        stack.push_back(std::move(child));
        branched = true;
      }
    }

    if (head.IsNumber() && head.rank() <= 7 && state.counts[i + 1] > 0 &&
        state.counts[i + 2] > 0) {
      SearchState child = state;
      child.counts[i]--;
      child.counts[i + 1]--;
      child.counts[i + 2]--;
      if (dead.count(child.counts) == 0) {
        child.groups.push_back({GroupKind::Run, head, true});
        stack.push_back(std::move(child));
        branched = true;
      }
    }

    if (!branched) {
      dead.insert(state.counts);
    }
  }

  return partitions;
}

void Decomposer::AppendWinningPlacements(const std::vector<Group>& declared,
                                         const std::vector<Group>& found,
                                         const Group& pair,
                                         const Tile& winning_tile,
                                         std::vector<StandardForm>& forms)
    const {
  std::vector<Group> all = declared;
  all.insert(all.end(), found.begin(), found.end());
  std::sort(all.begin(), all.end());

  StandardForm base_form;
  std::copy(all.begin(), all.end(), base_form.groups.begin());
  base_form.pair = pair;

  if (pair.tile == winning_tile) {
    StandardForm form  = base_form;
    form.winning_group = -1;
    form.wait          = Wait::Pair;
    forms.push_back(form);
  }

  for (size_t g = 0; g < base_form.groups.size(); ++g) {
    const Group& group = base_form.groups[g];
    if (group.declared || !group.Contains(winning_tile)) {
      continue;
    }
    StandardForm form  = base_form;
    form.winning_group = static_cast<int>(g);
    form.wait          = ClassifyWait(group, winning_tile);
    forms.push_back(form);
  }
}

std::vector<StandardForm>
Decomposer::FindStandardForms(const Hand& hand) const {
  std::vector<Group> declared;
  for (const auto& meld : hand.melds) {
    declared.push_back(MeldToGroup(meld));
  }
  int needed = base::kGroupsPerHand - static_cast<int>(declared.size());

  TileCounts counts = CountTiles(hand.concealed);
  std::vector<StandardForm> forms;
  int expansions = 0;

  for (int i = 0; i < base::kTileKinds; ++i) {
    if (counts[i] < 2) {
      continue;
    }
    TileCounts remainder = counts;
    remainder[i] -= 2;
    Group pair{GroupKind::Pair, Tile::FromIndex(i), true};

    for (const auto& found : PartitionIntoGroups(remainder, &expansions)) {
      if (static_cast<int>(found.size()) != needed) {
        continue;
      }
      AppendWinningPlacements(declared, found, pair, hand.winning_tile, forms);
    }
  }

  std::vector<StandardForm> unique;
  std::set<std::string> seen;
  for (const auto& form : forms) {
    if (seen.insert(FormKey(form)).second) {
      unique.push_back(form);
    }
  }
  return unique;
}

std::optional<SevenPairsForm>
Decomposer::FindSevenPairs(const Hand& hand) const {
  if (!hand.melds.empty()) {
    return std::nullopt;
  }

  SevenPairsForm form;
  int pairs         = 0;
  TileCounts counts = CountTiles(hand.concealed);
  for (int i = 0; i < base::kTileKinds; ++i) {
    if (counts[i] == 0) {
      continue;
    }
    if (counts[i] != 2 || pairs == 7) {
      return std::nullopt;
    }
    form.pairs[pairs++] = Tile::FromIndex(i);
  }
  if (pairs != 7) {
    return std::nullopt;
  }
  return form;
}

std::optional<ThirteenOrphansForm>
Decomposer::FindThirteenOrphans(const Hand& hand) const {
  if (!hand.melds.empty()) {
    return std::nullopt;
  }

  TileCounts counts = CountTiles(hand.concealed);
  int orphan_tiles  = 0;
  std::optional<Tile> duplicate;
  for (int index : base::TERMINAL_HONOR_INDICES) {
    if (counts[index] == 0 || counts[index] > 2) {
      return std::nullopt;
    }
    if (counts[index] == 2) {
      if (duplicate) {
        return std::nullopt;
      }
      duplicate = Tile::FromIndex(index);
    }
    orphan_tiles += counts[index];
  }
  if (!duplicate || orphan_tiles != base::kHandSize) {
    return std::nullopt;
  }

  ThirteenOrphansForm form;
  form.duplicate = *duplicate;
  form.wait      = (*duplicate == hand.winning_tile) ? Wait::ThirteenSided
                                                     : Wait::Single;
  return form;
}

} // namespace calc
} // namespace riichi
