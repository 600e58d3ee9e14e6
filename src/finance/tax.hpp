// SPDX-License-Identifier: MIT
/**
 * @file tax.hpp
 * @brief Quebec sales-tax rates (GST + QST) shared by financing and leasing
 */

#pragma once

#include "src/support/error_types.hpp"
#include <cmath>
#include <expected>

namespace dealcalc {

/// Federal goods and services tax
inline constexpr double kGstRate = 0.05;

/// Quebec sales tax
inline constexpr double kQstRate = 0.09975;

/// GST + QST applied as a single multiplier (14.975%)
inline constexpr double kCombinedTaxRate = kGstRate + kQstRate;

/// Itemized sales tax on one base amount
///
/// total is defined as gst + qst. Every tax in the engine goes through
/// SalesTaxRates::apply(), so itemized and combined figures never drift.
struct TaxBreakdown {
    double gst = 0.0;
    double qst = 0.0;
    double total = 0.0;
};

/// Jurisdiction tax rates (decimals, e.g. 0.05 for 5%)
struct SalesTaxRates {
    double gst = kGstRate;
    double qst = kQstRate;

    [[nodiscard]] double combined() const { return gst + qst; }

    /// Tax on a base amount, itemized
    [[nodiscard]] TaxBreakdown apply(double base) const {
        TaxBreakdown tax;
        tax.gst = base * gst;
        tax.qst = base * qst;
        tax.total = tax.gst + tax.qst;
        return tax;
    }

    /// Amount grossed up by the combined rate: amount * (1 + gst + qst)
    [[nodiscard]] double gross_up(double amount) const {
        return amount * (1.0 + combined());
    }
};

/// Validate jurisdiction rates: finite and non-negative
inline std::expected<void, ValidationError> validate_tax_rates(const SalesTaxRates& rates) {
    if (!std::isfinite(rates.gst) || rates.gst < 0.0) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidTaxRate, rates.gst, 0));
    }
    if (!std::isfinite(rates.qst) || rates.qst < 0.0) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidTaxRate, rates.qst, 1));
    }
    return {};
}

}  // namespace dealcalc
