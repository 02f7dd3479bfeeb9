#pragma once

namespace perpsim {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Responsibility: Direction of an order. Buy opens/increases a long or
// reduces a short; Sell opens/increases a short or reduces a long.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// PositionSide
// -----------------------------------------------------------------------------
// Responsibility: Directional exposure of the account's single position.
// Flat means no open position (quantity and entry price are both zero).
// -----------------------------------------------------------------------------
enum class PositionSide {
  Flat,
  Long,
  Short,
};

// +1 for Long, -1 for Short, 0 for Flat. Every PnL and liquidation formula
// multiplies by this sign so one expression serves both directions.
inline int sign(PositionSide side) {
  switch (side) {
    case PositionSide::Long:  return 1;
    case PositionSide::Short: return -1;
    case PositionSide::Flat:  return 0;
  }
  return 0;
}

// The position side an order of the given direction opens.
inline PositionSide positionSideFor(Side side) {
  return side == Side::Buy ? PositionSide::Long : PositionSide::Short;
}

// True when an order of `side` adds to (or opens) a position on `current`.
inline bool isSameDirection(Side side, PositionSide current) {
  return current == PositionSide::Flat || current == positionSideFor(side);
}

inline const char* toString(Side side) {
  switch (side) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

inline const char* toString(PositionSide side) {
  switch (side) {
    case PositionSide::Long:  return "Long";
    case PositionSide::Short: return "Short";
    case PositionSide::Flat:  return "None";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace perpsim
