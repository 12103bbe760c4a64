#pragma once

#include "calc/decomposition.h"
#include "calc/hand.h"

namespace riichi {
namespace calc {

constexpr int kSevenPairsFu = 25;

// Itemised fu before rounding, kept for the breakdown printout.
struct FuDetail {
  int base   = 20;
  int menzen = 0;
  int tsumo  = 0;
  int groups = 0;
  int wait   = 0;
  int pair   = 0;
  int raw    = 0;
  int total  = 0;
};

// Fu for a non-yakuman decomposition. `pinfu` marks that the pinfu yaku
// fired, which waives the tsumo fu.
FuDetail ComputeFuDetail(const Decomposition& decomposition,
                         const Hand& hand,
                         const Context& context,
                         bool pinfu);

int ComputeFu(const Decomposition& decomposition,
              const Hand& hand,
              const Context& context,
              bool pinfu);

// Fu contributed by one triplet or quad.
int GroupFu(const Group& group, bool concealed);

int PairFu(const Tile& pair, const Context& context);

int RoundUpFu(int fu);

} // namespace calc
} // namespace riichi
