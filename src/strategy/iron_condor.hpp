// SPDX-License-Identifier: MIT
/**
 * @file iron_condor.hpp
 * @brief Strike layout of a four-leg iron condor
 */

#pragma once

#include "condor/option/option_spec.hpp"
#include "condor/support/error_types.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <expected>

namespace condor {

/// Position of a leg inside the condor, also the index used by legs()
enum class CondorLeg : size_t {
    LongCall = 0,
    ShortCall = 1,
    ShortPut = 2,
    LongPut = 3
};

/// Shares per option contract
inline constexpr double kContractMultiplier = 100.0;

/**
 * @brief The four strikes of an iron condor
 *
 * Invariant (checked by validate_strikes): long_call > short_call >=
 * short_put > long_put, i.e. the protective wings sit outside the shorts.
 */
struct CondorStrikes {
    double long_call = 0.0;
    double short_call = 0.0;
    double short_put = 0.0;
    double long_put = 0.0;

    double call_spread_width() const { return long_call - short_call; }
    double put_spread_width() const { return short_put - long_put; }
    double max_spread_width() const { return std::max(call_spread_width(), put_spread_width()); }

    /// Midpoint of the short strikes, the default underlying price
    double short_midpoint() const { return (short_call + short_put) / 2.0; }

    /// Legs in CondorLeg order
    std::array<OptionLeg, 4> legs() const {
        return {{
            {long_call, OptionType::CALL, PositionSide::LONG},
            {short_call, OptionType::CALL, PositionSide::SHORT},
            {short_put, OptionType::PUT, PositionSide::SHORT},
            {long_put, OptionType::PUT, PositionSide::LONG},
        }};
    }

    bool operator==(const CondorStrikes&) const = default;
};

/// Check positivity and ordering of the strikes.
///
/// InvalidStrike reports the first non-positive strike, InvalidStrikeOrder
/// the first leg (CondorLeg index) that breaks the ordering.
std::expected<void, ValidationError> validate_strikes(const CondorStrikes& strikes);

}  // namespace condor
