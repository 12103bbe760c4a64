#pragma once

#include "utils/tile.h"
#include <array>
#include <string>
#include <variant>
#include <vector>

namespace riichi {
namespace calc {

using utils::Tile;

enum class GroupKind { Run, Triplet, Quad, Pair };

enum class Wait {
  TwoSided,
  Edge,
  Closed,
  Pair,
  DualTriplet,
  Single,       // thirteen orphans waiting on the pair tile
  ThirteenSided // thirteen orphans waiting on any of the 13
};

struct Group {
  GroupKind kind;
  Tile tile;      // lowest tile of the group
  bool concealed; // false only for groups declared by an open call
  bool declared = false;

  bool Contains(const Tile& t) const;
  bool HasTerminalOrHonor() const;
  bool IsTripletLike() const {
    return kind == GroupKind::Triplet || kind == GroupKind::Quad;
  }
  int TileCount() const;
  std::vector<Tile> Tiles() const;

  bool operator==(const Group& other) const;
  bool operator<(const Group& other) const;
};

struct StandardForm {
  std::array<Group, 4> groups;
  Group pair;
  int winning_group; // index into groups, -1 when the pair was completed
  Wait wait;

  std::vector<Tile> Tiles() const;
};

struct SevenPairsForm {
  std::array<Tile, 7> pairs;

  std::vector<Tile> Tiles() const;
};

struct ThirteenOrphansForm {
  Tile duplicate;
  Wait wait;

  std::vector<Tile> Tiles() const;
};

using Decomposition =
    std::variant<StandardForm, SevenPairsForm, ThirteenOrphansForm>;

std::vector<Tile> DecompositionTiles(const Decomposition& decomposition);
std::string DescribeDecomposition(const Decomposition& decomposition);
std::string WaitName(Wait wait);

} // namespace calc
} // namespace riichi
