#pragma once

#include "utils/tile.h"
#include <optional>
#include <string>
#include <vector>

namespace riichi {
namespace calc {

using utils::Tile;
using utils::Wind;

enum class MeldType { Chi, Pon, Kan };

struct Meld {
  MeldType type;
  bool concealed; // only a kan may be concealed
  std::vector<Tile> tiles;
  int offer_direction = 0;

  // Lowest tile of the meld.
  Tile Head() const;
  bool IsWellFormed() const;
  std::string ToString() const;
};

struct Hand {
  // Tiles outside declared melds, including the winning tile.
  std::vector<Tile> concealed;
  std::vector<Meld> melds;
  Tile winning_tile;

  bool IsClosed() const; // no open meld; concealed kans allowed
  int KanCount() const;
  std::vector<Tile> AllTiles() const;
};

enum class WinMethod { Ron, Tsumo };

enum class RiichiType { None, Riichi, DoubleRiichi };

struct Context {
  Wind seat_wind         = Wind::East;
  Wind round_wind        = Wind::East;
  bool is_dealer         = true;
  RiichiType riichi      = RiichiType::None;
  bool ippatsu           = false;
  WinMethod win_method   = WinMethod::Ron;
  bool haitei            = false;
  bool houtei            = false;
  bool rinshan           = false;
  bool chankan           = false;
  bool tenhou            = false;
  bool chiihou           = false;
  bool renhou            = false;
  std::vector<Tile> dora_indicators;
  std::vector<Tile> ura_dora_indicators;
  int honba              = 0;
  int riichi_sticks      = 0;
  std::optional<Wind> discarder;

  bool IsRiichi() const { return riichi != RiichiType::None; }
  bool IsTsumo() const { return win_method == WinMethod::Tsumo; }
};

// Returns an empty string when the flags are consistent with each other and
// with the hand, otherwise the first contradiction found.
std::string FindContextConflict(const Hand& hand, const Context& context);

// Structural hand checks: tile counts, meld shapes, winning tile presence.
std::string FindHandDefect(const Hand& hand);

} // namespace calc
} // namespace riichi
