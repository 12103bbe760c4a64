#include "calc/scoring_error.h"

namespace riichi {
namespace calc {

std::string ScoringErrorName(ScoringError error) {
  switch (error) {
  case ScoringError::None:
    return "None";
  case ScoringError::InvalidHandShape:
    return "InvalidHandShape";
  case ScoringError::NoYakuFound:
    return "NoYakuFound";
  case ScoringError::AmbiguousConfiguration:
    return "AmbiguousConfiguration";
  }
  return "Unknown";
}

} // namespace calc
} // namespace riichi
