// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace condor {

/// Error codes for parameter validation failures
enum class ValidationErrorCode {
    InvalidSpotPrice,
    InvalidStrike,
    InvalidStrikeOrder,
    InvalidMaturity,
    InvalidVolatility,
    InvalidRate,
    InvalidContracts,
    InvalidTargetProbability,
    InvalidWingWidth
};

/// Detailed validation error for parameter validation failures
struct ValidationError {
    ValidationErrorCode code;
    double value;  // The invalid value that was provided
    size_t index;  // Leg index for strike errors (0 if not applicable)

    ValidationError(ValidationErrorCode code,
                   double value = 0.0,
                   size_t index = 0)
        : code(code), value(value), index(index) {}
};

/// Request-level failures of the analysis orchestrator
enum class AnalysisErrorCode {
    InvalidExpiration,   ///< Unparsable, past or present expiration date
    InvalidParameters    ///< A parameter failed validation (see validation)
};

/// Analysis failure; no partial report accompanies it
struct AnalysisError {
    AnalysisErrorCode code;
    std::string detail;
    std::optional<ValidationError> validation;  ///< Set for InvalidParameters

    static AnalysisError expiration(std::string detail) {
        return AnalysisError{AnalysisErrorCode::InvalidExpiration, std::move(detail), std::nullopt};
    }

    static AnalysisError parameters(const ValidationError& err) {
        return AnalysisError{AnalysisErrorCode::InvalidParameters, "Invalid input", err};
    }
};

/// Short name of a validation code, for diagnostics
inline const char* to_string(ValidationErrorCode code) {
    switch (code) {
        case ValidationErrorCode::InvalidSpotPrice: return "InvalidSpotPrice";
        case ValidationErrorCode::InvalidStrike: return "InvalidStrike";
        case ValidationErrorCode::InvalidStrikeOrder: return "InvalidStrikeOrder";
        case ValidationErrorCode::InvalidMaturity: return "InvalidMaturity";
        case ValidationErrorCode::InvalidVolatility: return "InvalidVolatility";
        case ValidationErrorCode::InvalidRate: return "InvalidRate";
        case ValidationErrorCode::InvalidContracts: return "InvalidContracts";
        case ValidationErrorCode::InvalidTargetProbability: return "InvalidTargetProbability";
        case ValidationErrorCode::InvalidWingWidth: return "InvalidWingWidth";
    }
    return "Unknown";
}

/// Output stream operator for ValidationError
inline std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
    os << "ValidationError{code=" << to_string(err.code)
       << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

/// Output stream operator for AnalysisError
inline std::ostream& operator<<(std::ostream& os, const AnalysisError& err) {
    os << "AnalysisError{code=";
    if (err.code == AnalysisErrorCode::InvalidExpiration) {
        os << "InvalidExpiration, detail=" << err.detail;
    } else {
        os << "InvalidParameters";
        if (err.validation) {
            os << ", " << *err.validation;
        }
    }
    os << "}";
    return os;
}

} // namespace condor
