#pragma once

#include <string>
#include <vector>

namespace riichi {
namespace calc {

enum class Yaku {
  // Context
  Riichi,
  DoubleRiichi,
  Ippatsu,
  MenzenTsumo,
  Haitei,
  Houtei,
  Rinshan,
  Chankan,
  // Shape
  Pinfu,
  Tanyao,
  Iipeikou,
  Ryanpeikou,
  YakuhaiSeatWind,
  YakuhaiRoundWind,
  YakuhaiWhite,
  YakuhaiGreen,
  YakuhaiRed,
  SanshokuDoujun,
  SanshokuDoukou,
  Ittsu,
  Chanta,
  Junchan,
  Toitoi,
  Sanankou,
  Sankantsu,
  Shousangen,
  Honroutou,
  Honitsu,
  Chinitsu,
  Chiitoitsu,
  // Yakuman
  Tenhou,
  Chiihou,
  Renhou,
  KokushiMusou,
  KokushiMusou13Sided,
  Suuankou,
  SuuankouTanki,
  Daisangen,
  Shousuushii,
  Daisuushii,
  Tsuuiisou,
  Chinroutou,
  Ryuuiisou,
  Suukantsu,
  ChuurenPoutou,
  JunseiChuurenPoutou,
  // Bonus han, never a yaku on their own
  Dora,
  AkaDora,
  UraDora,
};

struct YakuInfo {
  Yaku yaku;
  const char* name;
  int closed_han;
  int open_han; // 0 when the yaku requires a closed hand
  int yakuman;  // yakuman multiple, 0 for regular yaku
};

const YakuInfo& GetYakuInfo(Yaku yaku);
std::string YakuName(Yaku yaku);
bool IsDora(Yaku yaku);
bool IsYakuman(Yaku yaku);

struct YakuEntry {
  Yaku yaku;
  int han;     // han contributed; 0 for yakuman entries
  int yakuman; // yakuman multiple contributed
};

struct YakuResult {
  std::vector<YakuEntry> entries;
  bool is_yakuman      = false;
  int yakuman_multiple = 0;

  int YakuHan() const; // han from yaku only
  int DoraHan() const;
  int TotalHan() const;
  bool HasYaku() const; // at least one entry that is not dora
  bool Has(Yaku yaku) const;
};

} // namespace calc
} // namespace riichi
