#include "utils/tile.h"
#include "base/mahjong_constants.h"
#include <algorithm>
#include <stdexcept>

namespace riichi {
namespace utils {

Tile::Tile() : suit_(Suit::Manzu), rank_(1), red_(false) {}

Tile::Tile(Suit suit, int rank, bool red)
    : suit_(suit), rank_(rank), red_(red) {
  int max_rank = 9;
  if (suit == Suit::Wind) {
    max_rank = 4;
  } else if (suit == Suit::Dragon) {
    max_rank = 3;
  }
  if (rank < 1 || rank > max_rank) {
    throw std::invalid_argument("Tile rank out of range: " +
                                std::to_string(rank));
  }
  if (red && (!IsNumber() || rank != 5)) {
    throw std::invalid_argument("Only a number-suit five can be red");
  }
}

Tile Tile::FromIndex(int index, bool red) {
  if (!IsValid(index)) {
    throw std::invalid_argument("Invalid tile index: " + std::to_string(index));
  }
  if (index < 9) {
    return Tile(Suit::Manzu, index + 1, red);
  } else if (index < 18) {
    return Tile(Suit::Pinzu, index - 8, red);
  } else if (index < 27) {
    return Tile(Suit::Souzu, index - 17, red);
  } else if (index < 31) {
    return Tile(Suit::Wind, index - 26);
  }
  return Tile(Suit::Dragon, index - 30);
}

Tile Tile::OfWind(Wind wind) {
  return Tile(Suit::Wind, static_cast<int>(wind) + 1);
}

Tile Tile::OfDragon(Dragon dragon) {
  return Tile(Suit::Dragon, static_cast<int>(dragon) + 1);
}

bool Tile::IsValid(int index) { return index >= 0 && index < base::kTileKinds; }

std::string Tile::ToString(int index) {
  if (IsValid(index)) {
    return base::TILE_IDENTITY[index];
  }
  return "??";
}

int Tile::Index() const {
  switch (suit_) {
  case Suit::Manzu:
    return rank_ - 1;
  case Suit::Pinzu:
    return rank_ + 8;
  case Suit::Souzu:
    return rank_ + 17;
  case Suit::Wind:
    return rank_ + 26;
  case Suit::Dragon:
    return rank_ + 30;
  }
  return -1;
}

bool Tile::IsNumber() const {
  return suit_ == Suit::Manzu || suit_ == Suit::Pinzu || suit_ == Suit::Souzu;
}

bool Tile::IsHonor() const { return !IsNumber(); }

bool Tile::IsTerminal() const {
  return IsNumber() && (rank_ == 1 || rank_ == 9);
}

bool Tile::IsTerminalOrHonor() const { return IsTerminal() || IsHonor(); }

bool Tile::IsSimple() const { return IsNumber() && rank_ >= 2 && rank_ <= 8; }

bool Tile::IsGreen() const {
  const auto& green = base::GREEN_TILE_INDICES;
  return std::find(green.begin(), green.end(), Index()) != green.end();
}

bool Tile::Is(Wind wind) const {
  return suit_ == Suit::Wind && rank_ == static_cast<int>(wind) + 1;
}

Tile Tile::DoraSuccessor() const {
  switch (suit_) {
  case Suit::Wind:
    return Tile(suit_, rank_ % 4 + 1);
  case Suit::Dragon:
    return Tile(suit_, rank_ % 3 + 1);
  default:
    return Tile(suit_, rank_ % 9 + 1);
  }
}

Tile Tile::Next() const {
  if (!IsNumber() || rank_ >= 9) {
    throw std::logic_error("No successor for tile " + ToString());
  }
  return Tile(suit_, rank_ + 1);
}

std::string Tile::ToString() const {
  if (red_) {
    return std::string("0") + base::TILE_IDENTITY[Index()].back();
  }
  return base::TILE_IDENTITY[Index()];
}

std::ostream& operator<<(std::ostream& os, const Tile& tile) {
  return os << tile.ToString();
}

std::string WindName(Wind wind) {
  return base::WIND[static_cast<int>(wind)];
}

} // namespace utils
} // namespace riichi
