// LIQUIDSTAKE - Checked Arithmetic
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Overflow-aware helpers for u64 token amounts. Intermediate products of
// MulDiv are computed in 128 bits so amount * scale never wraps.

#ifndef LIQUIDSTAKE_CORE_ARITH_H
#define LIQUIDSTAKE_CORE_ARITH_H

#include "liquidstake/core/types.h"

#include <limits>
#include <optional>

namespace liquidstake {

/// a + b, or nullopt on u64 overflow
inline std::optional<Amount> CheckedAdd(Amount a, Amount b) {
    if (a > std::numeric_limits<Amount>::max() - b) {
        return std::nullopt;
    }
    return a + b;
}

/// a - b, or nullopt if b > a
inline std::optional<Amount> CheckedSub(Amount a, Amount b) {
    if (b > a) {
        return std::nullopt;
    }
    return a - b;
}

/// floor(a * b / denom), or nullopt if denom is zero or the quotient
/// does not fit in 64 bits
inline std::optional<Amount> MulDiv(Amount a, Amount b, Amount denom) {
    if (denom == 0) {
        return std::nullopt;
    }
    unsigned __int128 product = static_cast<unsigned __int128>(a) * b;
    unsigned __int128 quotient = product / denom;
    if (quotient > std::numeric_limits<Amount>::max()) {
        return std::nullopt;
    }
    return static_cast<Amount>(quotient);
}

} // namespace liquidstake

#endif // LIQUIDSTAKE_CORE_ARITH_H
