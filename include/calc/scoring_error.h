#pragma once

#include <stdexcept>
#include <string>

namespace riichi {
namespace calc {

enum class ScoringError {
  None,
  InvalidHandShape,
  NoYakuFound,
  AmbiguousConfiguration,
};

std::string ScoringErrorName(ScoringError error);

constexpr const char* kNoYakuMessage = "No Yaku Found";

// Raised by the individual engine stages; ScoreCalculator turns it into a
// ScoringResult so callers never see it.
class ScoringException : public std::runtime_error {
public:
  ScoringException(ScoringError error, const std::string& message)
      : std::runtime_error(message), error_(error) {}

  ScoringError error() const { return error_; }

private:
  ScoringError error_;
};

} // namespace calc
} // namespace riichi
