// SPDX-License-Identifier: MIT
#include "condor/strategy/iron_condor.hpp"
#include <cmath>

namespace condor {

std::expected<void, ValidationError> validate_strikes(const CondorStrikes& strikes) {
    const auto legs = strikes.legs();
    for (size_t i = 0; i < legs.size(); ++i) {
        if (legs[i].strike <= 0.0 || !std::isfinite(legs[i].strike)) {
            return std::unexpected(ValidationError(ValidationErrorCode::InvalidStrike,
                                                   legs[i].strike, i));
        }
    }

    if (!(strikes.long_call > strikes.short_call)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidStrikeOrder,
                                               strikes.long_call,
                                               static_cast<size_t>(CondorLeg::LongCall)));
    }
    if (!(strikes.short_call >= strikes.short_put)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidStrikeOrder,
                                               strikes.short_call,
                                               static_cast<size_t>(CondorLeg::ShortCall)));
    }
    if (!(strikes.short_put > strikes.long_put)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidStrikeOrder,
                                               strikes.long_put,
                                               static_cast<size_t>(CondorLeg::LongPut)));
    }

    return {};
}

}  // namespace condor
