#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace riichi {
namespace utils {

enum class Suit : std::uint8_t { Manzu, Pinzu, Souzu, Wind, Dragon };

enum class Wind : std::uint8_t { East, South, West, North };

enum class Dragon : std::uint8_t { White, Green, Red };

// A tile identity plus the red-five flag. Equality and ordering ignore the
// flag: a red 5p and a plain 5p are the same tile for shape purposes.
class Tile {
public:
  Tile();
  Tile(Suit suit, int rank, bool red = false);

  static Tile FromIndex(int index, bool red = false);
  static Tile OfWind(Wind wind);
  static Tile OfDragon(Dragon dragon);

  static bool IsValid(int index);
  static std::string ToString(int index);

  Suit suit() const { return suit_; }
  int rank() const { return rank_; }
  bool is_red() const { return red_; }

  int Index() const;

  bool IsNumber() const;
  bool IsHonor() const;
  bool IsWind() const { return suit_ == Suit::Wind; }
  bool IsDragon() const { return suit_ == Suit::Dragon; }
  bool IsTerminal() const;
  bool IsTerminalOrHonor() const;
  bool IsSimple() const;
  bool IsGreen() const;
  bool Is(Wind wind) const;

  // Tile indicated as dora when this tile is the indicator.
  Tile DoraSuccessor() const;

  // Next tile of the same number suit; only valid for ranks 1-8.
  Tile Next() const;

  std::string ToString() const;

  bool operator==(const Tile& other) const {
    return suit_ == other.suit_ && rank_ == other.rank_;
  }
  bool operator!=(const Tile& other) const { return !(*this == other); }
  bool operator<(const Tile& other) const {
    return Index() < other.Index();
  }

private:
  Suit suit_;
  int rank_;
  bool red_;
};

std::ostream& operator<<(std::ostream& os, const Tile& tile);

std::string WindName(Wind wind);

} // namespace utils
} // namespace riichi
