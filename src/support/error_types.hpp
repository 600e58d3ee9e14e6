// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <expected>
#include <ostream>
#include <string>
#include <string_view>

namespace dealcalc {

/// Error codes for structurally malformed caller input
///
/// These are programming errors on the caller's side (negative term,
/// unknown frequency, NaN amount). Missing or unparsable user text is
/// NOT an error: it defaults to zero at the input boundary.
enum class ValidationErrorCode {
    InvalidTerm,         ///< Term is zero or negative
    UnsupportedTerm,     ///< Financing term is not one of 36/48/60/72/84/96
    InvalidMileage,      ///< Annual mileage is not a known tier
    InvalidFrequency,    ///< Unrecognized payment frequency
    InvalidAmount,       ///< Monetary field is NaN or infinite
    InvalidRate,         ///< Rate is negative or not finite
    InvalidTaxRate       ///< Jurisdiction tax rate is negative or not finite
};

/// Detailed validation error
struct ValidationError {
    ValidationErrorCode code;
    double value;  // The invalid value that was provided
    size_t index;  // Field or line position (0 if not applicable)

    ValidationError(ValidationErrorCode code,
                    double value = 0.0,
                    size_t index = 0)
        : code(code), value(value), index(index) {}
};

/// Human-readable name of an error code
inline std::string_view to_string(ValidationErrorCode code) {
    switch (code) {
        case ValidationErrorCode::InvalidTerm:      return "InvalidTerm";
        case ValidationErrorCode::UnsupportedTerm:  return "UnsupportedTerm";
        case ValidationErrorCode::InvalidMileage:   return "InvalidMileage";
        case ValidationErrorCode::InvalidFrequency: return "InvalidFrequency";
        case ValidationErrorCode::InvalidAmount:    return "InvalidAmount";
        case ValidationErrorCode::InvalidRate:      return "InvalidRate";
        case ValidationErrorCode::InvalidTaxRate:   return "InvalidTaxRate";
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

}  // namespace dealcalc
