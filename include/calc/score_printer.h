#pragma once

#include "calc/score_calculator.h"
#include "calc/yaku.h"
#include <iostream>
#include <string>

namespace riichi {
namespace calc {

class ScorePrinter {
public:
  static void PrintBreakdown(const ScoreBreakdown& breakdown) {
    std::cout << "\n=== Score ===" << std::endl;
    if (breakdown.limit == LimitKind::Yakuman) {
      std::cout << "Yakuman x" << breakdown.yakuman_multiple << std::endl;
    } else {
      std::cout << breakdown.han << " han " << breakdown.fu << " fu";
      if (breakdown.limit != LimitKind::None) {
        std::cout << " (" << LimitName(breakdown.limit) << ")";
      }
      std::cout << std::endl;
    }
    std::cout << "Base Points: " << breakdown.base_points << std::endl;
    std::cout << "Shape: " << breakdown.decomposition << std::endl;
    std::cout << "Wait: " << breakdown.wait << std::endl;

    std::cout << "\nYaku:" << std::endl;
    for (const auto& entry : breakdown.yaku) {
      std::cout << "  " << YakuName(entry.yaku) << ": ";
      if (entry.yakuman > 0) {
        std::cout << (entry.yakuman > 1 ? "Double Yakuman" : "Yakuman");
      } else {
        std::cout << entry.han << " han";
      }
      std::cout << std::endl;
    }

    if (breakdown.limit != LimitKind::Yakuman) {
      PrintFu(breakdown.fu_detail);
    }
    PrintPayments(breakdown);
  }

  static void PrintFu(const FuDetail& fu) {
    std::cout << "\nFu: " << fu.raw << " -> " << fu.total << std::endl;
    PrintFuLine("Base", fu.base);
    PrintFuLine("Menzen ron", fu.menzen);
    PrintFuLine("Tsumo", fu.tsumo);
    PrintFuLine("Melds", fu.groups);
    PrintFuLine("Wait", fu.wait);
    PrintFuLine("Pair", fu.pair);
  }

  static void PrintPayments(const ScoreBreakdown& breakdown) {
    std::cout << "\nPayments ("
              << (breakdown.tsumo ? "tsumo" : "ron") << "):" << std::endl;
    for (const auto& payment : breakdown.payments) {
      std::cout << "  "
                << (payment.payer ? utils::WindName(*payment.payer)
                                  : std::string("Discarder"))
                << " pays " << payment.amount << std::endl;
    }
    if (breakdown.honba_bonus > 0) {
      std::cout << "Honba: +" << breakdown.honba_bonus << std::endl;
    }
    if (breakdown.riichi_bonus > 0) {
      std::cout << "Riichi sticks: +" << breakdown.riichi_bonus << std::endl;
    }
    std::cout << "Total: " << breakdown.total_points << std::endl;
  }

  static void PrintResult(const ScoringResult& result) {
    if (result.success) {
      PrintBreakdown(result.breakdown);
    } else {
      std::cout << "Scoring failed (" << ScoringErrorName(result.error)
                << "): " << result.error_message << std::endl;
    }
  }

private:
  static void PrintFuLine(const std::string& label, int fu) {
    if (fu > 0) {
      std::cout << "  " << label << ": " << fu << std::endl;
    }
  }
};

} // namespace calc
} // namespace riichi
