#pragma once

#include <array>
#include <string>

namespace riichi {
namespace base {

constexpr int kTileKinds     = 34;
constexpr int kCopiesPerTile = 4;
constexpr int kHandSize      = 14;
constexpr int kGroupsPerHand = 4;

// 0-8 manzu, 9-17 pinzu, 18-26 souzu, 27-30 winds (ESWN), 31-33 dragons
// (white, green, red).
const std::array<std::string, kTileKinds> TILE_IDENTITY = {
    "1m", "2m", "3m", "4m", "5m", "6m", "7m", "8m", "9m",
    "1p", "2p", "3p", "4p", "5p", "6p", "7p", "8p", "9p",
    "1s", "2s", "3s", "4s", "5s", "6s", "7s", "8s", "9s",
    "1z", "2z", "3z", "4z", "5z", "6z", "7z"};

const std::array<std::string, 4> WIND = {"East", "South", "West", "North"};

const std::array<std::string, 3> DRAGON = {"White", "Green", "Red"};

// Terminal and honor tiles required by thirteen orphans.
const std::array<int, 13> TERMINAL_HONOR_INDICES = {
    0, 8, 9, 17, 18, 26, 27, 28, 29, 30, 31, 32, 33};

// 2s 3s 4s 6s 8s and the green dragon.
const std::array<int, 6> GREEN_TILE_INDICES = {19, 20, 21, 23, 25, 32};

constexpr int kBasePointsMangan    = 2000;
constexpr int kBasePointsHaneman   = 3000;
constexpr int kBasePointsBaiman    = 4000;
constexpr int kBasePointsSanbaiman = 6000;
constexpr int kBasePointsYakuman   = 8000;

constexpr int kHonbaRonBonus    = 300;
constexpr int kHonbaTsumoBonus  = 100;
constexpr int kRiichiStickValue = 1000;

} // namespace base
} // namespace riichi
