#pragma once

namespace sigexec {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Responsibility: Trading direction shared by signals, orders, positions and
// deals.
// Why enum class: Side::Buy / Side::Sell cannot be confused with integers or
// with the producer's free-form direction text, which is only parsed at the
// store boundary.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// +1 for Buy, -1 for Sell. Used to sign price differences.
inline double sideSign(Side side) { return side == Side::Buy ? 1.0 : -1.0; }

inline Side opposite(Side side) {
  return side == Side::Buy ? Side::Sell : Side::Buy;
}

inline const char* sideToString(Side side) {
  return side == Side::Buy ? "BUY" : "SELL";
}

}  // namespace domain
}  // namespace sigexec
