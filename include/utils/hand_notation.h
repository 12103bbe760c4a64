#pragma once

#include "calc/hand.h"
#include "utils/tile.h"
#include <string>
#include <vector>

namespace riichi {
namespace utils {

// Compact hand strings such as "234m567p789s11z5p" or "[555p][123s,3]...".
//
//   1-9 + m/p/s     number tiles, 0 is a red five
//   1-7 + z         honors in the order E S W N white green red
//   E S W N P F C   honors by letter (P white, F green, C red)
//   [...]           declared meld; ",0" marks a concealed kan and ",1".."3"
//                   the offering direction
//
// The last loose tile of the string is the winning tile.
class HandNotation {
public:
  static bool Parse(const std::string& text, calc::Hand* hand);

  // Loose tiles only, e.g. dora indicators.
  static bool ParseTiles(const std::string& text, std::vector<Tile>* tiles);

  static bool ParseWind(const std::string& text, Wind* wind);

  static std::string Format(const calc::Hand& hand);
  static std::string FormatTiles(const std::vector<Tile>& tiles);

private:
  static bool ParseMeld(const std::string& body, calc::Meld* meld);
  static bool FlushDigits(std::string& digits,
                          char suit,
                          std::vector<Tile>* tiles);
};

} // namespace utils
} // namespace riichi
