#include <gtest/gtest.h>
#include <glog/logging.h>
#include <stdexcept>
#include "base/mahjong_constants.h"
#include "utils/tile.h"

using namespace riichi::base;
using riichi::utils::Dragon;
using riichi::utils::Suit;
using riichi::utils::Tile;
using riichi::utils::Wind;

TEST(MahjongConstantsTest, TileIdentity) {
  EXPECT_EQ(TILE_IDENTITY.size(), 34);
  EXPECT_EQ(TILE_IDENTITY[0], "1m");
  EXPECT_EQ(TILE_IDENTITY[9], "1p");
  EXPECT_EQ(TILE_IDENTITY[18], "1s");
  EXPECT_EQ(TILE_IDENTITY[27], "1z");
  EXPECT_EQ(TILE_IDENTITY[33], "7z");
}

TEST(MahjongConstantsTest, WindNames) {
  EXPECT_EQ(WIND.size(), 4);
  EXPECT_EQ(WIND[0], "East");
  EXPECT_EQ(WIND[3], "North");
}

TEST(MahjongConstantsTest, TerminalHonorIndices) {
  EXPECT_EQ(TERMINAL_HONOR_INDICES.size(), 13);
  for (int index : TERMINAL_HONOR_INDICES) {
    EXPECT_TRUE(Tile::FromIndex(index).IsTerminalOrHonor());
  }
}

TEST(TileTest, FromIndexRoundTrip) {
  for (int i = 0; i < kTileKinds; ++i) {
    Tile tile = Tile::FromIndex(i);
    EXPECT_EQ(tile.Index(), i);
    EXPECT_EQ(tile.ToString(), TILE_IDENTITY[i]);
  }
}

TEST(TileTest, InvalidTilesThrow) {
  EXPECT_THROW(Tile::FromIndex(34), std::invalid_argument);
  EXPECT_THROW(Tile(Suit::Wind, 5), std::invalid_argument);
  EXPECT_THROW(Tile(Suit::Manzu, 0), std::invalid_argument);
  EXPECT_THROW(Tile(Suit::Manzu, 4, true), std::invalid_argument);
  EXPECT_THROW(Tile(Suit::Dragon, 1, true), std::invalid_argument);
}

TEST(TileTest, RedFiveIsAFlag) {
  Tile red(Suit::Pinzu, 5, true);
  Tile plain(Suit::Pinzu, 5);

  EXPECT_TRUE(red.is_red());
  EXPECT_EQ(red, plain);
  EXPECT_EQ(red.Index(), plain.Index());
  EXPECT_EQ(red.ToString(), "0p");
  EXPECT_EQ(plain.ToString(), "5p");
}

TEST(TileTest, Classification) {
  EXPECT_TRUE(Tile(Suit::Souzu, 1).IsTerminal());
  EXPECT_FALSE(Tile(Suit::Souzu, 2).IsTerminal());
  EXPECT_TRUE(Tile(Suit::Souzu, 2).IsSimple());
  EXPECT_TRUE(Tile::OfDragon(Dragon::Red).IsHonor());
  EXPECT_TRUE(Tile::OfDragon(Dragon::Red).IsDragon());
  EXPECT_TRUE(Tile::OfWind(Wind::West).IsWind());
  EXPECT_TRUE(Tile::OfWind(Wind::West).Is(Wind::West));
  EXPECT_FALSE(Tile::OfWind(Wind::West).Is(Wind::East));
  EXPECT_TRUE(Tile::OfWind(Wind::North).IsTerminalOrHonor());
}

TEST(TileTest, GreenTiles) {
  EXPECT_TRUE(Tile(Suit::Souzu, 2).IsGreen());
  EXPECT_TRUE(Tile(Suit::Souzu, 8).IsGreen());
  EXPECT_TRUE(Tile::OfDragon(Dragon::Green).IsGreen());
  EXPECT_FALSE(Tile(Suit::Souzu, 1).IsGreen());
  EXPECT_FALSE(Tile(Suit::Souzu, 5).IsGreen());
  EXPECT_FALSE(Tile(Suit::Pinzu, 2).IsGreen());
}

TEST(TileTest, DoraSuccessorWraps) {
  EXPECT_EQ(Tile(Suit::Manzu, 9).DoraSuccessor(), Tile(Suit::Manzu, 1));
  EXPECT_EQ(Tile(Suit::Pinzu, 4).DoraSuccessor(), Tile(Suit::Pinzu, 5));
  EXPECT_EQ(Tile::OfWind(Wind::North).DoraSuccessor(),
            Tile::OfWind(Wind::East));
  EXPECT_EQ(Tile::OfDragon(Dragon::Red).DoraSuccessor(),
            Tile::OfDragon(Dragon::White));
  EXPECT_EQ(Tile(Suit::Souzu, 5, true).DoraSuccessor(), Tile(Suit::Souzu, 6));
}

TEST(TileTest, Next) {
  EXPECT_EQ(Tile(Suit::Manzu, 8).Next(), Tile(Suit::Manzu, 9));
  EXPECT_THROW(Tile(Suit::Manzu, 9).Next(), std::logic_error);
  EXPECT_THROW(Tile::OfWind(Wind::East).Next(), std::logic_error);
}

TEST(TileTest, Ordering) {
  EXPECT_LT(Tile(Suit::Manzu, 9), Tile(Suit::Pinzu, 1));
  EXPECT_LT(Tile(Suit::Souzu, 9), Tile::OfWind(Wind::East));
  EXPECT_LT(Tile::OfWind(Wind::North), Tile::OfDragon(Dragon::White));
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);

  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = 0;

  return RUN_ALL_TESTS();
}
