#include "calc/decomposition.h"
#include "base/mahjong_constants.h"
#include <sstream>
#include <tuple>

namespace riichi {
namespace calc {

bool Group::Contains(const Tile& t) const {
  if (kind == GroupKind::Run) {
    return t.suit() == tile.suit() && t.rank() >= tile.rank() &&
           t.rank() <= tile.rank() + 2;
  }
  return t == tile;
}

bool Group::HasTerminalOrHonor() const {
  if (kind == GroupKind::Run) {
    return tile.rank() == 1 || tile.rank() == 7;
  }
  return tile.IsTerminalOrHonor();
}

int Group::TileCount() const {
  switch (kind) {
  case GroupKind::Pair:
    return 2;
  case GroupKind::Quad:
    return 4;
  default:
    return 3;
  }
}

std::vector<Tile> Group::Tiles() const {
  std::vector<Tile> tiles;
  if (kind == GroupKind::Run) {
    tiles.push_back(tile);
    tiles.push_back(tile.Next());
    tiles.push_back(tile.Next().Next());
    return tiles;
  }
  tiles.assign(TileCount(), Tile::FromIndex(tile.Index()));
  return tiles;
}

bool Group::operator==(const Group& other) const {
  return kind == other.kind && tile == other.tile &&
         concealed == other.concealed && declared == other.declared;
}

bool Group::operator<(const Group& other) const {
  return std::make_tuple(tile.Index(), static_cast<int>(kind), concealed,
                         declared) <
         std::make_tuple(other.tile.Index(), static_cast<int>(other.kind),
                         other.concealed, other.declared);
}

std::vector<Tile> StandardForm::Tiles() const {
  std::vector<Tile> tiles = pair.Tiles();
  for (const auto& group : groups) {
    auto group_tiles = group.Tiles();
    tiles.insert(tiles.end(), group_tiles.begin(), group_tiles.end());
  }
  return tiles;
}

std::vector<Tile> SevenPairsForm::Tiles() const {
  std::vector<Tile> tiles;
  for (const auto& tile : pairs) {
    tiles.push_back(tile);
    tiles.push_back(tile);
  }
  return tiles;
}

std::vector<Tile> ThirteenOrphansForm::Tiles() const {
  std::vector<Tile> tiles;
  for (int index : base::TERMINAL_HONOR_INDICES) {
    tiles.push_back(Tile::FromIndex(index));
  }
  tiles.push_back(duplicate);
  return tiles;
}

std::vector<Tile> DecompositionTiles(const Decomposition& decomposition) {
  return std::visit([](const auto& form) { return form.Tiles(); },
                    decomposition);
}

std::string WaitName(Wait wait) {
  switch (wait) {
  case Wait::TwoSided:
    return "two-sided";
  case Wait::Edge:
    return "edge";
  case Wait::Closed:
    return "closed";
  case Wait::Pair:
    return "pair";
  case Wait::DualTriplet:
    return "dual-triplet";
  case Wait::Single:
    return "single";
  case Wait::ThirteenSided:
    return "thirteen-sided";
  }
  return "unknown";
}

namespace {

std::string GroupString(const Group& group) {
  std::ostringstream oss;
  bool open = !group.concealed;
  oss << (open ? "[" : "");
  for (const auto& tile : group.Tiles()) {
    oss << tile.ToString().front();
  }
  oss << group.tile.ToString().back() << (open ? "]" : "");
  return oss.str();
}

} // namespace

std::string DescribeDecomposition(const Decomposition& decomposition) {
  std::ostringstream oss;
  if (const auto* standard = std::get_if<StandardForm>(&decomposition)) {
    oss << "standard:";
    for (const auto& group : standard->groups) {
      oss << " " << GroupString(group);
    }
    oss << " " << GroupString(standard->pair)
        << " wait=" << WaitName(standard->wait);
  } else if (const auto* pairs = std::get_if<SevenPairsForm>(&decomposition)) {
    oss << "seven-pairs:";
    for (const auto& tile : pairs->pairs) {
      oss << " " << tile.ToString() << tile.ToString();
    }
  } else if (const auto* orphans =
                 std::get_if<ThirteenOrphansForm>(&decomposition)) {
    oss << "thirteen-orphans: duplicate=" << orphans->duplicate.ToString()
        << " wait=" << WaitName(orphans->wait);
  }
  return oss.str();
}

} // namespace calc
} // namespace riichi
