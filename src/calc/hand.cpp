#include "calc/hand.h"
#include "base/mahjong_constants.h"
#include <algorithm>
#include <array>
#include <sstream>

namespace riichi {
namespace calc {

Tile Meld::Head() const {
  return *std::min_element(tiles.begin(), tiles.end());
}

bool Meld::IsWellFormed() const {
  std::vector<Tile> sorted = tiles;
  std::sort(sorted.begin(), sorted.end());

  switch (type) {
  case MeldType::Chi:
    if (concealed || sorted.size() != 3 || !sorted[0].IsNumber()) {
      return false;
    }
    if (sorted[0].rank() > 7) {
      return false;
    }
    return sorted[1] == sorted[0].Next() && sorted[2] == sorted[1].Next();
  case MeldType::Pon:
    return !concealed && sorted.size() == 3 && sorted[0] == sorted[2];
  case MeldType::Kan:
    return sorted.size() == 4 && sorted[0] == sorted[3];
  }
  return false;
}

std::string Meld::ToString() const {
  std::vector<Tile> sorted = tiles;
  std::sort(sorted.begin(), sorted.end());

  std::ostringstream oss;
  oss << "[";
  for (const auto& tile : sorted) {
    oss << tile.ToString().front();
  }
  if (!sorted.empty()) {
    oss << sorted.front().ToString().back();
  }
  if (type == MeldType::Kan && concealed) {
    oss << ",0";
  } else if (offer_direction > 0) {
    oss << "," << offer_direction;
  }
  oss << "]";
  return oss.str();
}

bool Hand::IsClosed() const {
  return std::all_of(melds.begin(), melds.end(), [](const Meld& meld) {
    return meld.concealed;
  });
}

int Hand::KanCount() const {
  return static_cast<int>(
      std::count_if(melds.begin(), melds.end(), [](const Meld& meld) {
        return meld.type == MeldType::Kan;
      }));
}

std::vector<Tile> Hand::AllTiles() const {
  std::vector<Tile> tiles = concealed;
  for (const auto& meld : melds) {
    tiles.insert(tiles.end(), meld.tiles.begin(), meld.tiles.end());
  }
  return tiles;
}

std::string FindHandDefect(const Hand& hand) {
  if (hand.melds.size() > static_cast<size_t>(base::kGroupsPerHand)) {
    return "More than 4 declared melds";
  }

  for (const auto& meld : hand.melds) {
    if (!meld.IsWellFormed()) {
      return "Malformed declared meld " + meld.ToString();
    }
  }

  size_t expected = base::kHandSize - 3 * hand.melds.size();
  if (hand.concealed.size() != expected) {
    return "Expected " + std::to_string(expected) + " concealed tiles, got " +
           std::to_string(hand.concealed.size());
  }

  if (std::find(hand.concealed.begin(), hand.concealed.end(),
                hand.winning_tile) == hand.concealed.end()) {
    return "Winning tile " + hand.winning_tile.ToString() +
           " is not among the concealed tiles";
  }

  std::array<int, base::kTileKinds> counts{};
  for (const auto& tile : hand.AllTiles()) {
    if (++counts[tile.Index()] > base::kCopiesPerTile) {
      return "More than 4 copies of " + Tile::ToString(tile.Index());
    }
  }

  return "";
}

std::string FindContextConflict(const Hand& hand, const Context& context) {
  bool tsumo  = context.IsTsumo();
  bool closed = hand.IsClosed();

  if (context.is_dealer != (context.seat_wind == Wind::East)) {
    return "Dealer flag disagrees with seat wind";
  }
  if (context.ippatsu && !context.IsRiichi()) {
    return "Ippatsu requires riichi";
  }
  if (context.IsRiichi() && !closed) {
    return "Riichi declared with an open meld";
  }
  if (context.haitei && !tsumo) {
    return "Haitei (last draw) cannot be a ron win";
  }
  if (context.houtei && tsumo) {
    return "Houtei (last discard) cannot be a tsumo win";
  }
  if (context.haitei && context.houtei) {
    return "Cannot be both haitei and houtei";
  }
  if (context.rinshan && !tsumo) {
    return "Rinshan (replacement draw) cannot be a ron win";
  }
  if (context.rinshan && hand.KanCount() == 0) {
    return "Rinshan requires a declared kan";
  }
  if (context.rinshan && context.haitei) {
    return "Cannot be both rinshan and haitei";
  }
  if (context.chankan && tsumo) {
    return "Chankan (robbing a kan) cannot be a tsumo win";
  }
  if (context.tenhou &&
      (!context.is_dealer || !tsumo || !hand.melds.empty())) {
    return "Tenhou requires a dealer tsumo with no calls";
  }
  if (context.chiihou &&
      (context.is_dealer || !tsumo || !hand.melds.empty())) {
    return "Chiihou requires a non-dealer tsumo with no calls";
  }
  if (context.renhou && (context.is_dealer || tsumo)) {
    return "Renhou requires a non-dealer ron";
  }
  if (context.honba < 0 || context.riichi_sticks < 0) {
    return "Honba and riichi stick counts cannot be negative";
  }
  if (context.discarder) {
    if (tsumo) {
      return "A discarder was named for a tsumo win";
    }
    if (*context.discarder == context.seat_wind) {
      return "The winner cannot be the discarder";
    }
  }
  return "";
}

} // namespace calc
} // namespace riichi
