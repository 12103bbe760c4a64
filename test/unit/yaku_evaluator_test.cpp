#include <gtest/gtest.h>
#include <glog/logging.h>
#include "calc/decomposer.h"
#include "calc/yaku_evaluator.h"
#include "utils/hand_notation.h"

using namespace riichi;
using namespace riichi::calc;
using utils::Suit;
using utils::Wind;

class YakuEvaluatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    context_.seat_wind  = Wind::South;
    context_.round_wind = Wind::East;
    context_.is_dealer  = false;
  }

  std::vector<YakuResult> EvaluateAll(const std::string& text,
                                      const RuleSet& rules = RuleSet()) {
    Hand hand;
    EXPECT_TRUE(utils::HandNotation::Parse(text, &hand)) << text;
    YakuEvaluator evaluator(rules);
    std::vector<YakuResult> results;
    for (const auto& d : decomposer_.Decompose(hand)) {
      results.push_back(evaluator.Evaluate(d, hand, context_));
    }
    return results;
  }

  // The single reading of a hand that decomposes one way only.
  YakuResult EvaluateOne(const std::string& text,
                         const RuleSet& rules = RuleSet()) {
    auto results = EvaluateAll(text, rules);
    EXPECT_EQ(results.size(), 1) << text;
    return results.empty() ? YakuResult() : results.front();
  }

  static bool AnyHas(const std::vector<YakuResult>& results, Yaku yaku) {
    for (const auto& r : results) {
      if (r.Has(yaku)) {
        return true;
      }
    }
    return false;
  }

  static int HanOf(const YakuResult& result, Yaku yaku) {
    for (const auto& entry : result.entries) {
      if (entry.yaku == yaku) {
        return entry.han;
      }
    }
    return 0;
  }

  Decomposer decomposer_;
  Context context_;
};

TEST_F(YakuEvaluatorTest, Pinfu) {
  auto result = EvaluateOne("234m567m789s33z34p5p");

  EXPECT_TRUE(result.Has(Yaku::Pinfu));
  EXPECT_FALSE(result.Has(Yaku::Tanyao));
  EXPECT_EQ(result.YakuHan(), 1);
  EXPECT_FALSE(result.is_yakuman);
}

TEST_F(YakuEvaluatorTest, NoPinfuWithValuePair) {
  // East is the round wind, so a pair of it costs pinfu.
  auto result = EvaluateOne("234m567m789s11z34p5p");
  EXPECT_FALSE(result.Has(Yaku::Pinfu));
  EXPECT_FALSE(result.HasYaku());
}

TEST_F(YakuEvaluatorTest, NoPinfuOnClosedWait) {
  auto result = EvaluateOne("234m567m789s33z35p4p");
  EXPECT_FALSE(result.Has(Yaku::Pinfu));
}

TEST_F(YakuEvaluatorTest, OpenTanyaoFollowsRules) {
  auto allowed = EvaluateOne("[555p,2]234m678s234s66m");
  EXPECT_TRUE(allowed.Has(Yaku::Tanyao));
  EXPECT_EQ(HanOf(allowed, Yaku::Tanyao), 1);

  RuleSet closed_only;
  closed_only.open_tanyao = false;
  auto denied = EvaluateOne("[555p,2]234m678s234s66m", closed_only);
  EXPECT_FALSE(denied.Has(Yaku::Tanyao));
  EXPECT_FALSE(denied.HasYaku());
}

TEST_F(YakuEvaluatorTest, Iipeikou) {
  auto result = EvaluateOne("223344m456p678s5s5s");

  EXPECT_TRUE(result.Has(Yaku::Iipeikou));
  EXPECT_TRUE(result.Has(Yaku::Tanyao));
  EXPECT_FALSE(result.Has(Yaku::Pinfu));
  EXPECT_EQ(result.YakuHan(), 2);
}

TEST_F(YakuEvaluatorTest, IipeikouNeedsClosedHand) {
  auto result = EvaluateOne("[234m]234m456p678s5s5s");
  EXPECT_FALSE(result.Has(Yaku::Iipeikou));
}

TEST_F(YakuEvaluatorTest, RyanpeikouReplacesIipeikou) {
  auto results = EvaluateAll("112233m445566p7s7s");
  ASSERT_EQ(results.size(), 2);

  EXPECT_TRUE(AnyHas(results, Yaku::Ryanpeikou));
  EXPECT_TRUE(AnyHas(results, Yaku::Chiitoitsu));
  EXPECT_FALSE(AnyHas(results, Yaku::Iipeikou));
}

TEST_F(YakuEvaluatorTest, DragonTriplet) {
  auto result = EvaluateOne("[777z]234m567p789s1s1s");

  EXPECT_TRUE(result.Has(Yaku::YakuhaiRed));
  EXPECT_EQ(result.YakuHan(), 1);
}

TEST_F(YakuEvaluatorTest, DoubleWindTriplet) {
  context_.seat_wind = Wind::East;
  context_.is_dealer = true;
  auto result        = EvaluateOne("111z234m567p789s5s5s");

  EXPECT_TRUE(result.Has(Yaku::YakuhaiSeatWind));
  EXPECT_TRUE(result.Has(Yaku::YakuhaiRoundWind));
  EXPECT_EQ(result.YakuHan(), 2);
}

TEST_F(YakuEvaluatorTest, OffWindTripletIsWorthless) {
  auto result = EvaluateOne("444z234m567p789s5s5s");
  EXPECT_FALSE(result.HasYaku());
}

TEST_F(YakuEvaluatorTest, SanshokuDoujunLosesHanWhenOpen) {
  auto closed = EvaluateOne("123456m123p123s9p9p");
  EXPECT_EQ(HanOf(closed, Yaku::SanshokuDoujun), 2);

  auto open = EvaluateOne("[123m]456m123p123s9p9p");
  EXPECT_EQ(HanOf(open, Yaku::SanshokuDoujun), 1);
}

TEST_F(YakuEvaluatorTest, SanshokuDoukou) {
  auto result = EvaluateOne("[222m]222p222s456m9s9s");
  EXPECT_EQ(HanOf(result, Yaku::SanshokuDoukou), 2);
}

TEST_F(YakuEvaluatorTest, Ittsu) {
  auto result = EvaluateOne("123456789m234p5s5s");
  EXPECT_EQ(HanOf(result, Yaku::Ittsu), 2);
}

TEST_F(YakuEvaluatorTest, Chanta) {
  auto result = EvaluateOne("123m789p123s999s1z1z");

  EXPECT_EQ(HanOf(result, Yaku::Chanta), 2);
  EXPECT_FALSE(result.Has(Yaku::Junchan));
}

TEST_F(YakuEvaluatorTest, JunchanReplacesChanta) {
  auto results = EvaluateAll("123m789p123s999s1m1m");
  ASSERT_FALSE(results.empty());
  for (const auto& result : results) {
    EXPECT_EQ(HanOf(result, Yaku::Junchan), 3);
    EXPECT_FALSE(result.Has(Yaku::Chanta));
  }
}

TEST_F(YakuEvaluatorTest, Toitoi) {
  context_.round_wind = Wind::South;
  auto result         = EvaluateOne("[222m][555p]888s999s1z1z");

  EXPECT_EQ(HanOf(result, Yaku::Toitoi), 2);
  EXPECT_FALSE(result.Has(Yaku::Sanankou));
}

TEST_F(YakuEvaluatorTest, RonTripletIsNotConcealed) {
  auto ron = EvaluateOne("222m555p88s234s11z8s");
  EXPECT_FALSE(ron.Has(Yaku::Sanankou));

  context_.win_method = WinMethod::Tsumo;
  auto tsumo          = EvaluateOne("222m555p88s234s11z8s");
  EXPECT_TRUE(tsumo.Has(Yaku::Sanankou));
  EXPECT_TRUE(tsumo.Has(Yaku::MenzenTsumo));
}

TEST_F(YakuEvaluatorTest, Sankantsu) {
  auto result = EvaluateOne("[2222m][5555p,0][8888s]234s1z1z");
  EXPECT_TRUE(result.Has(Yaku::Sankantsu));
}

TEST_F(YakuEvaluatorTest, Shousangen) {
  auto result = EvaluateOne("234m567p555z666z7z7z");

  EXPECT_TRUE(result.Has(Yaku::Shousangen));
  EXPECT_TRUE(result.Has(Yaku::YakuhaiWhite));
  EXPECT_TRUE(result.Has(Yaku::YakuhaiGreen));
  EXPECT_FALSE(result.Has(Yaku::YakuhaiRed));
}

TEST_F(YakuEvaluatorTest, Honroutou) {
  context_.round_wind = Wind::South;
  auto result         = EvaluateOne("[111m]999p111s333z9m9m");

  EXPECT_TRUE(result.Has(Yaku::Honroutou));
  EXPECT_TRUE(result.Has(Yaku::Toitoi));
  EXPECT_FALSE(result.Has(Yaku::Chanta));
}

TEST_F(YakuEvaluatorTest, Honitsu) {
  context_.round_wind = Wind::South;
  auto result         = EvaluateOne("123456789m333z5z5z");

  EXPECT_EQ(HanOf(result, Yaku::Honitsu), 3);
  EXPECT_TRUE(result.Has(Yaku::Ittsu));
  EXPECT_FALSE(result.Has(Yaku::Chinitsu));
}

TEST_F(YakuEvaluatorTest, ChinitsuReplacesHonitsu) {
  auto results = EvaluateAll("1233455677899m9m");
  ASSERT_FALSE(results.empty());
  EXPECT_TRUE(AnyHas(results, Yaku::Chinitsu));
  EXPECT_FALSE(AnyHas(results, Yaku::Honitsu));
}

TEST_F(YakuEvaluatorTest, Chiitoitsu) {
  auto result = EvaluateOne("1122m3344p5566s77z");
  EXPECT_EQ(HanOf(result, Yaku::Chiitoitsu), 2);
}

TEST_F(YakuEvaluatorTest, ContextYaku) {
  context_.riichi     = RiichiType::Riichi;
  context_.ippatsu    = true;
  context_.win_method = WinMethod::Tsumo;
  auto result         = EvaluateOne("234m567m789s33z34p5p");

  EXPECT_TRUE(result.Has(Yaku::Riichi));
  EXPECT_TRUE(result.Has(Yaku::Ippatsu));
  EXPECT_TRUE(result.Has(Yaku::MenzenTsumo));
  EXPECT_TRUE(result.Has(Yaku::Pinfu));
  EXPECT_EQ(result.YakuHan(), 4);
}

TEST_F(YakuEvaluatorTest, DoubleRiichiReplacesRiichi) {
  context_.riichi = RiichiType::DoubleRiichi;
  auto result     = EvaluateOne("234m567m789s33z34p5p");

  EXPECT_EQ(HanOf(result, Yaku::DoubleRiichi), 2);
  EXPECT_FALSE(result.Has(Yaku::Riichi));
}

TEST_F(YakuEvaluatorTest, LastTileYaku) {
  context_.houtei = true;
  EXPECT_TRUE(EvaluateOne("234m567m789s33z34p5p").Has(Yaku::Houtei));

  context_.houtei     = false;
  context_.haitei     = true;
  context_.win_method = WinMethod::Tsumo;
  EXPECT_TRUE(EvaluateOne("234m567m789s33z34p5p").Has(Yaku::Haitei));
}

TEST_F(YakuEvaluatorTest, DoraCountsOnlyWithYaku) {
  context_.dora_indicators = {Tile(Suit::Manzu, 1)};
  auto result              = EvaluateOne("234m567m789s33z34p5p");

  EXPECT_EQ(HanOf(result, Yaku::Dora), 1);
  EXPECT_EQ(result.DoraHan(), 1);
  EXPECT_EQ(result.TotalHan(), 2);
}

TEST_F(YakuEvaluatorTest, RedFiveFollowsRules) {
  auto result = EvaluateOne("234m567m789s33z34p0p");
  EXPECT_EQ(HanOf(result, Yaku::AkaDora), 1);

  RuleSet no_aka;
  no_aka.aka_dora = false;
  EXPECT_FALSE(
      EvaluateOne("234m567m789s33z34p0p", no_aka).Has(Yaku::AkaDora));
}

TEST_F(YakuEvaluatorTest, RedFiveAloneIsNoYaku) {
  auto result = EvaluateOne("[234m]567m789s33z34p0p");

  EXPECT_FALSE(result.HasYaku());
  EXPECT_EQ(result.YakuHan(), 0);
}

TEST_F(YakuEvaluatorTest, UraDoraNeedsRiichi) {
  context_.ura_dora_indicators = {Tile(Suit::Manzu, 1)};
  EXPECT_FALSE(EvaluateOne("234m567m789s33z34p5p").Has(Yaku::UraDora));

  context_.riichi = RiichiType::Riichi;
  EXPECT_EQ(HanOf(EvaluateOne("234m567m789s33z34p5p"), Yaku::UraDora), 1);
}

TEST_F(YakuEvaluatorTest, CountDoraOverMelds) {
  Hand hand;
  ASSERT_TRUE(utils::HandNotation::Parse("[5555p]234m678s234s6m6m", &hand));
  context_.dora_indicators = {Tile(Suit::Pinzu, 4), Tile(Suit::Souzu, 1)};

  YakuEvaluator evaluator;
  auto entries = evaluator.CountDora(hand, context_);
  ASSERT_EQ(entries.size(), 1);
  EXPECT_EQ(entries[0].yaku, Yaku::Dora);
  EXPECT_EQ(entries[0].han, 5);
}

TEST_F(YakuEvaluatorTest, ThirteenOrphans) {
  auto single = EvaluateOne("119m19p19s1234567z");
  EXPECT_TRUE(single.is_yakuman);
  EXPECT_TRUE(single.Has(Yaku::KokushiMusou));
  EXPECT_EQ(single.yakuman_multiple, 1);

  auto thirteen = EvaluateOne("19m19p19s1234567z1m");
  EXPECT_TRUE(thirteen.Has(Yaku::KokushiMusou13Sided));
  EXPECT_FALSE(thirteen.Has(Yaku::KokushiMusou));
  EXPECT_EQ(thirteen.yakuman_multiple, 2);

  RuleSet single_only;
  single_only.double_yakuman = false;
  auto capped = EvaluateOne("19m19p19s1234567z1m", single_only);
  EXPECT_TRUE(capped.Has(Yaku::KokushiMusou));
  EXPECT_EQ(capped.yakuman_multiple, 1);
}

TEST_F(YakuEvaluatorTest, SuuankouOnTsumo) {
  context_.win_method = WinMethod::Tsumo;
  auto result         = EvaluateOne("111m99m333p555s77s7s");

  EXPECT_TRUE(result.is_yakuman);
  EXPECT_TRUE(result.Has(Yaku::Suuankou));
  EXPECT_EQ(result.yakuman_multiple, 1);
  EXPECT_EQ(result.YakuHan(), 0);
}

TEST_F(YakuEvaluatorTest, SuuankouRonOnTripletIsNotYakuman) {
  auto result = EvaluateOne("111m99m333p555s77s7s");

  EXPECT_FALSE(result.is_yakuman);
  EXPECT_TRUE(result.Has(Yaku::Sanankou));
  EXPECT_TRUE(result.Has(Yaku::Toitoi));
}

TEST_F(YakuEvaluatorTest, SuuankouTanki) {
  auto result = EvaluateOne("111m333p555s777s9m9m");

  EXPECT_TRUE(result.Has(Yaku::SuuankouTanki));
  EXPECT_FALSE(result.Has(Yaku::Suuankou));
  EXPECT_EQ(result.yakuman_multiple, 2);
}

TEST_F(YakuEvaluatorTest, Daisangen) {
  auto result = EvaluateOne("555z666z777z234m1m1m");

  EXPECT_TRUE(result.Has(Yaku::Daisangen));
  EXPECT_FALSE(result.Has(Yaku::YakuhaiRed));
}

TEST_F(YakuEvaluatorTest, YakumanStacking) {
  auto summed = EvaluateOne("[111z][222z]333z444z5z5z");
  EXPECT_TRUE(summed.Has(Yaku::Daisuushii));
  EXPECT_TRUE(summed.Has(Yaku::Tsuuiisou));
  EXPECT_EQ(summed.yakuman_multiple, 2);

  RuleSet max_only;
  max_only.yakuman_stacking = YakumanStacking::Max;
  auto largest = EvaluateOne("[111z][222z]333z444z5z5z", max_only);
  EXPECT_EQ(largest.yakuman_multiple, 1);
  EXPECT_EQ(largest.entries.size(), 1u);
}

TEST_F(YakuEvaluatorTest, YakumanEntriesMatchMultiple) {
  auto entry_sum = [](const YakuResult& result) {
    int sum = 0;
    for (const auto& entry : result.entries) {
      sum += entry.yakuman;
    }
    return sum;
  };
  context_.win_method = WinMethod::Tsumo;

  auto summed = EvaluateOne("111z222z333z444z5z5z");
  EXPECT_TRUE(summed.Has(Yaku::SuuankouTanki));
  EXPECT_EQ(summed.yakuman_multiple, entry_sum(summed));

  RuleSet max_only;
  max_only.yakuman_stacking = YakumanStacking::Max;
  auto largest = EvaluateOne("111z222z333z444z5z5z", max_only);
  ASSERT_EQ(largest.entries.size(), 1u);
  EXPECT_EQ(largest.entries.front().yaku, Yaku::SuuankouTanki);
  EXPECT_EQ(largest.yakuman_multiple, 2);
  EXPECT_EQ(largest.yakuman_multiple, entry_sum(largest));
}

TEST_F(YakuEvaluatorTest, Shousuushii) {
  auto result = EvaluateOne("[111z]222z333z234m4z4z");
  EXPECT_TRUE(result.Has(Yaku::Shousuushii));
}

TEST_F(YakuEvaluatorTest, Ryuuiisou) {
  auto result = EvaluateOne("[234s]666s888s666z2s2s");
  EXPECT_TRUE(result.Has(Yaku::Ryuuiisou));
}

TEST_F(YakuEvaluatorTest, Chinroutou) {
  auto result = EvaluateOne("[111m]999m111p999p1s1s");
  EXPECT_TRUE(result.Has(Yaku::Chinroutou));
}

TEST_F(YakuEvaluatorTest, Suukantsu) {
  auto result = EvaluateOne("[1111m][2222p,0][3333s][4444z]5z5z");
  EXPECT_TRUE(result.Has(Yaku::Suukantsu));
}

TEST_F(YakuEvaluatorTest, NineGates) {
  auto pure = EvaluateAll("1112345678999m5m");
  EXPECT_TRUE(AnyHas(pure, Yaku::JunseiChuurenPoutou));

  auto plain = EvaluateAll("1112345567899m9m");
  EXPECT_TRUE(AnyHas(plain, Yaku::ChuurenPoutou));
  EXPECT_FALSE(AnyHas(plain, Yaku::JunseiChuurenPoutou));
}

TEST_F(YakuEvaluatorTest, Tenhou) {
  context_.seat_wind  = Wind::East;
  context_.is_dealer  = true;
  context_.tenhou     = true;
  context_.win_method = WinMethod::Tsumo;
  auto result         = EvaluateOne("234m567m789s33z34p5p");

  EXPECT_TRUE(result.Has(Yaku::Tenhou));
  EXPECT_FALSE(result.Has(Yaku::Pinfu));
}

TEST_F(YakuEvaluatorTest, RenhouFollowsRules) {
  context_.renhou = true;
  EXPECT_TRUE(EvaluateOne("234m567m789s33z34p5p").Has(Yaku::Renhou));

  RuleSet no_renhou;
  no_renhou.renhou = false;
  auto result      = EvaluateOne("234m567m789s33z34p5p", no_renhou);
  EXPECT_FALSE(result.is_yakuman);
  EXPECT_TRUE(result.Has(Yaku::Pinfu));
}

TEST(YakuTableTest, Lookups) {
  EXPECT_EQ(YakuName(Yaku::Pinfu), "Pinfu");
  EXPECT_EQ(GetYakuInfo(Yaku::Chinitsu).closed_han, 6);
  EXPECT_EQ(GetYakuInfo(Yaku::Chinitsu).open_han, 5);
  EXPECT_TRUE(IsYakuman(Yaku::Daisangen));
  EXPECT_FALSE(IsYakuman(Yaku::Toitoi));
  EXPECT_TRUE(IsDora(Yaku::AkaDora));
  EXPECT_EQ(GetYakuInfo(Yaku::SuuankouTanki).yakuman, 2);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);

  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = 0;

  return RUN_ALL_TESTS();
}
