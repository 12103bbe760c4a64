#pragma once

#include "base/mahjong_constants.h"
#include "calc/decomposition.h"
#include "calc/hand.h"
#include <array>
#include <optional>
#include <vector>

namespace riichi {
namespace calc {

using TileCounts = std::array<int, base::kTileKinds>;

// Enumerates every way a winning hand can be read: four groups plus a pair
// (one entry per placement of the winning tile), seven pairs and thirteen
// orphans. Throws ScoringException(InvalidHandShape) when nothing fits.
class Decomposer {
public:
  static constexpr int kDefaultMaxExpansions = 20000;

  explicit Decomposer(int max_expansions = kDefaultMaxExpansions);

  std::vector<Decomposition> Decompose(const Hand& hand) const;

  std::vector<StandardForm> FindStandardForms(const Hand& hand) const;
  std::optional<SevenPairsForm> FindSevenPairs(const Hand& hand) const;
  std::optional<ThirteenOrphansForm>
  FindThirteenOrphans(const Hand& hand) const;

  // All partitions of `counts` into runs and triplets. Each partition lists
  // its groups in the order they were consumed (lowest tile first).
  std::vector<std::vector<Group>> PartitionIntoGroups(
      const TileCounts& counts, int* expansions) const;

  static TileCounts CountTiles(const std::vector<Tile>& tiles);

private:
  int max_expansions_;

  void AppendWinningPlacements(const std::vector<Group>& declared,
                               const std::vector<Group>& found,
                               const Group& pair,
                               const Tile& winning_tile,
                               std::vector<StandardForm>& forms) const;
};

// Wait shape when `winning_tile` completes `group`.
Wait ClassifyWait(const Group& group, const Tile& winning_tile);

} // namespace calc
} // namespace riichi
