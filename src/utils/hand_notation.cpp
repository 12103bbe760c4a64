#include "utils/hand_notation.h"
#include <algorithm>
#include <cctype>
#include <glog/logging.h>
#include <sstream>

namespace riichi {
namespace utils {

namespace {

bool HonorFromLetter(char c, Tile* tile) {
  switch (c) {
  case 'E':
    *tile = Tile::OfWind(Wind::East);
    return true;
  case 'S':
    *tile = Tile::OfWind(Wind::South);
    return true;
  case 'W':
    *tile = Tile::OfWind(Wind::West);
    return true;
  case 'N':
    *tile = Tile::OfWind(Wind::North);
    return true;
  case 'P':
    *tile = Tile::OfDragon(Dragon::White);
    return true;
  case 'F':
    *tile = Tile::OfDragon(Dragon::Green);
    return true;
  case 'C':
    *tile = Tile::OfDragon(Dragon::Red);
    return true;
  default:
    return false;
  }
}

char SuitLetter(Suit suit) {
  switch (suit) {
  case Suit::Manzu:
    return 'm';
  case Suit::Pinzu:
    return 'p';
  case Suit::Souzu:
    return 's';
  default:
    return 'z';
  }
}

} // namespace

bool HandNotation::FlushDigits(std::string& digits,
                               char suit,
                               std::vector<Tile>* tiles) {
  if (digits.empty()) {
    LOG(ERROR) << "Suit letter '" << suit << "' without any digits";
    return false;
  }
  for (char d : digits) {
    int rank = d - '0';
    if (suit == 'z') {
      if (rank < 1 || rank > 7) {
        LOG(ERROR) << "Honor tiles are numbered 1-7, got " << d << "z";
        return false;
      }
      tiles->push_back(rank <= 4 ? Tile::OfWind(static_cast<Wind>(rank - 1))
                                 : Tile::OfDragon(
                                       static_cast<Dragon>(rank - 5)));
      continue;
    }
    Suit s = Suit::Souzu;
    if (suit == 'm') {
      s = Suit::Manzu;
    } else if (suit == 'p') {
      s = Suit::Pinzu;
    }
    if (rank == 0) {
      tiles->push_back(Tile(s, 5, true));
    } else {
      tiles->push_back(Tile(s, rank));
    }
  }
  digits.clear();
  return true;
}

bool HandNotation::ParseTiles(const std::string& text,
                              std::vector<Tile>* tiles) {
  std::string digits;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      continue;
    }
    if (c >= '0' && c <= '9') {
      digits += c;
      continue;
    }
    if (c == 'm' || c == 'p' || c == 's' || c == 'z') {
      if (!FlushDigits(digits, c, tiles)) {
        return false;
      }
      continue;
    }
    Tile honor;
    if (digits.empty() && HonorFromLetter(c, &honor)) {
      tiles->push_back(honor);
      continue;
    }
    LOG(ERROR) << "Unexpected character '" << c << "' in tiles: " << text;
    return false;
  }
  if (!digits.empty()) {
    LOG(ERROR) << "Digits '" << digits << "' are missing a suit letter";
    return false;
  }
  return true;
}

bool HandNotation::ParseMeld(const std::string& body, calc::Meld* meld) {
  std::string tiles_part = body;
  int direction          = -1;

  auto comma = body.find(',');
  if (comma != std::string::npos) {
    tiles_part       = body.substr(0, comma);
    std::string flag = body.substr(comma + 1);
    if (flag.size() != 1 || flag[0] < '0' || flag[0] > '3') {
      LOG(ERROR) << "Meld flag must be 0-3, got '" << flag << "'";
      return false;
    }
    direction = flag[0] - '0';
  }

  std::vector<Tile> tiles;
  if (!ParseTiles(tiles_part, &tiles)) {
    return false;
  }

  std::vector<Tile> sorted = tiles;
  std::sort(sorted.begin(), sorted.end());
  bool same = !sorted.empty() && sorted.front() == sorted.back();

  if (sorted.size() == 4 && same) {
    meld->type = calc::MeldType::Kan;
  } else if (sorted.size() == 3 && same) {
    meld->type = calc::MeldType::Pon;
  } else if (sorted.size() == 3) {
    meld->type = calc::MeldType::Chi;
  } else {
    LOG(ERROR) << "Meld [" << body << "] is not a run, triplet or quad";
    return false;
  }

  meld->tiles           = tiles;
  meld->concealed       = direction == 0;
  meld->offer_direction = direction > 0 ? direction : 0;
  if (meld->concealed && meld->type != calc::MeldType::Kan) {
    LOG(ERROR) << "Only a kan can be concealed: [" << body << "]";
    return false;
  }
  if (!meld->IsWellFormed()) {
    LOG(ERROR) << "Malformed meld [" << body << "]";
    return false;
  }
  return true;
}

bool HandNotation::Parse(const std::string& text, calc::Hand* hand) {
  calc::Hand parsed;
  std::string loose;

  size_t pos = 0;
  while (pos < text.size()) {
    if (text[pos] == '[') {
      auto close = text.find(']', pos);
      if (close == std::string::npos) {
        LOG(ERROR) << "Unclosed meld bracket in: " << text;
        return false;
      }
      calc::Meld meld;
      if (!ParseMeld(text.substr(pos + 1, close - pos - 1), &meld)) {
        return false;
      }
      parsed.melds.push_back(meld);
      pos = close + 1;
      continue;
    }
    if (text[pos] == ']') {
      LOG(ERROR) << "Unmatched ']' in: " << text;
      return false;
    }
    // Loose tiles between melds keep their relative order.
    auto next = text.find('[', pos);
    if (next == std::string::npos) {
      next = text.size();
    }
    std::string chunk = text.substr(pos, next - pos);
    if (chunk.find(']') != std::string::npos) {
      LOG(ERROR) << "Unmatched ']' in: " << text;
      return false;
    }
    loose += chunk;
    pos = next;
  }

  if (!ParseTiles(loose, &parsed.concealed)) {
    return false;
  }
  if (parsed.concealed.empty()) {
    LOG(ERROR) << "Hand has no concealed tiles: " << text;
    return false;
  }
  parsed.winning_tile = parsed.concealed.back();

  *hand = parsed;
  return true;
}

bool HandNotation::ParseWind(const std::string& text, Wind* wind) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  static const std::pair<const char*, Wind> names[] = {
      {"e", Wind::East},  {"east", Wind::East},   {"1", Wind::East},
      {"s", Wind::South}, {"south", Wind::South}, {"2", Wind::South},
      {"w", Wind::West},  {"west", Wind::West},   {"3", Wind::West},
      {"n", Wind::North}, {"north", Wind::North}, {"4", Wind::North},
  };
  for (const auto& entry : names) {
    if (lower == entry.first) {
      *wind = entry.second;
      return true;
    }
  }
  LOG(ERROR) << "Unknown wind: " << text;
  return false;
}

std::string HandNotation::FormatTiles(const std::vector<Tile>& tiles) {
  std::ostringstream oss;
  for (size_t i = 0; i < tiles.size(); ++i) {
    std::string name = tiles[i].ToString();
    oss << name.front();
    bool last = i + 1 == tiles.size() ||
                SuitLetter(tiles[i + 1].suit()) != SuitLetter(tiles[i].suit());
    if (last) {
      oss << SuitLetter(tiles[i].suit());
    }
  }
  return oss.str();
}

std::string HandNotation::Format(const calc::Hand& hand) {
  std::ostringstream oss;
  for (const auto& meld : hand.melds) {
    oss << meld.ToString();
  }

  std::vector<Tile> rest = hand.concealed;
  auto won = std::find_if(rest.begin(), rest.end(), [&hand](const Tile& t) {
    return t == hand.winning_tile && t.is_red() == hand.winning_tile.is_red();
  });
  if (won == rest.end()) {
    won = std::find(rest.begin(), rest.end(), hand.winning_tile);
  }
  if (won != rest.end()) {
    rest.erase(won);
  }
  std::stable_sort(rest.begin(), rest.end());

  oss << FormatTiles(rest) << FormatTiles({hand.winning_tile});
  return oss.str();
}

} // namespace utils
} // namespace riichi
