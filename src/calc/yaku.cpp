#include "calc/yaku.h"
#include <algorithm>
#include <array>
#include <stdexcept>

namespace riichi {
namespace calc {

namespace {

const std::array<YakuInfo, 49> YAKU_TABLE = {{
    {Yaku::Riichi, "Riichi", 1, 0, 0},
    {Yaku::DoubleRiichi, "Double Riichi", 2, 0, 0},
    {Yaku::Ippatsu, "Ippatsu", 1, 0, 0},
    {Yaku::MenzenTsumo, "Menzen Tsumo", 1, 0, 0},
    {Yaku::Haitei, "Haitei Raoyue", 1, 1, 0},
    {Yaku::Houtei, "Houtei Raoyui", 1, 1, 0},
    {Yaku::Rinshan, "Rinshan Kaihou", 1, 1, 0},
    {Yaku::Chankan, "Chankan", 1, 1, 0},
    {Yaku::Pinfu, "Pinfu", 1, 0, 0},
    {Yaku::Tanyao, "Tanyao", 1, 1, 0},
    {Yaku::Iipeikou, "Iipeikou", 1, 0, 0},
    {Yaku::Ryanpeikou, "Ryanpeikou", 3, 0, 0},
    {Yaku::YakuhaiSeatWind, "Yakuhai (Seat Wind)", 1, 1, 0},
    {Yaku::YakuhaiRoundWind, "Yakuhai (Round Wind)", 1, 1, 0},
    {Yaku::YakuhaiWhite, "Yakuhai (White Dragon)", 1, 1, 0},
    {Yaku::YakuhaiGreen, "Yakuhai (Green Dragon)", 1, 1, 0},
    {Yaku::YakuhaiRed, "Yakuhai (Red Dragon)", 1, 1, 0},
    {Yaku::SanshokuDoujun, "Sanshoku Doujun", 2, 1, 0},
    {Yaku::SanshokuDoukou, "Sanshoku Doukou", 2, 2, 0},
    {Yaku::Ittsu, "Ittsu", 2, 1, 0},
    {Yaku::Chanta, "Chanta", 2, 1, 0},
    {Yaku::Junchan, "Junchan", 3, 2, 0},
    {Yaku::Toitoi, "Toitoi", 2, 2, 0},
    {Yaku::Sanankou, "Sanankou", 2, 2, 0},
    {Yaku::Sankantsu, "Sankantsu", 2, 2, 0},
    {Yaku::Shousangen, "Shousangen", 2, 2, 0},
    {Yaku::Honroutou, "Honroutou", 2, 2, 0},
    {Yaku::Honitsu, "Honitsu", 3, 2, 0},
    {Yaku::Chinitsu, "Chinitsu", 6, 5, 0},
    {Yaku::Chiitoitsu, "Chiitoitsu", 2, 0, 0},
    {Yaku::Tenhou, "Tenhou", 0, 0, 1},
    {Yaku::Chiihou, "Chiihou", 0, 0, 1},
    {Yaku::Renhou, "Renhou", 0, 0, 1},
    {Yaku::KokushiMusou, "Kokushi Musou", 0, 0, 1},
    {Yaku::KokushiMusou13Sided, "Kokushi Musou 13-Sided Wait", 0, 0, 2},
    {Yaku::Suuankou, "Suuankou", 0, 0, 1},
    {Yaku::SuuankouTanki, "Suuankou Tanki", 0, 0, 2},
    {Yaku::Daisangen, "Daisangen", 0, 0, 1},
    {Yaku::Shousuushii, "Shousuushii", 0, 0, 1},
    {Yaku::Daisuushii, "Daisuushii", 0, 0, 1},
    {Yaku::Tsuuiisou, "Tsuuiisou", 0, 0, 1},
    {Yaku::Chinroutou, "Chinroutou", 0, 0, 1},
    {Yaku::Ryuuiisou, "Ryuuiisou", 0, 0, 1},
    {Yaku::Suukantsu, "Suukantsu", 0, 0, 1},
    {Yaku::ChuurenPoutou, "Chuuren Poutou", 0, 0, 1},
    {Yaku::JunseiChuurenPoutou, "Junsei Chuuren Poutou", 0, 0, 2},
    {Yaku::Dora, "Dora", 1, 1, 0},
    {Yaku::AkaDora, "Aka Dora", 1, 1, 0},
    {Yaku::UraDora, "Ura Dora", 1, 1, 0},
}};

} // namespace

const YakuInfo& GetYakuInfo(Yaku yaku) {
  for (const auto& info : YAKU_TABLE) {
    if (info.yaku == yaku) {
      return info;
    }
  }
  throw std::out_of_range("Unknown yaku id " +
                          std::to_string(static_cast<int>(yaku)));
}

std::string YakuName(Yaku yaku) { return GetYakuInfo(yaku).name; }

bool IsDora(Yaku yaku) {
  return yaku == Yaku::Dora || yaku == Yaku::AkaDora || yaku == Yaku::UraDora;
}

bool IsYakuman(Yaku yaku) { return GetYakuInfo(yaku).yakuman > 0; }

int YakuResult::YakuHan() const {
  int han = 0;
  for (const auto& entry : entries) {
    if (!IsDora(entry.yaku)) {
      han += entry.han;
    }
  }
  return han;
}

int YakuResult::DoraHan() const {
  int han = 0;
  for (const auto& entry : entries) {
    if (IsDora(entry.yaku)) {
      han += entry.han;
    }
  }
  return han;
}

int YakuResult::TotalHan() const { return YakuHan() + DoraHan(); }

bool YakuResult::HasYaku() const {
  return std::any_of(entries.begin(), entries.end(), [](const YakuEntry& e) {
    return !IsDora(e.yaku);
  });
}

bool YakuResult::Has(Yaku yaku) const {
  return std::any_of(entries.begin(), entries.end(),
                     [yaku](const YakuEntry& e) { return e.yaku == yaku; });
}

} // namespace calc
} // namespace riichi
