// SPDX-License-Identifier: MIT
#pragma once

#include "src/finance/rate_table.hpp"
#include "src/finance/tax.hpp"
#include <cmath>
#include <expected>

namespace dealcalc {

/// Engine-wide configuration
///
/// Defaults reproduce the Quebec dealer setup. Pass a different
/// SalesTaxRates to reuse the engine in another jurisdiction; the
/// carried-balance gross-up of the lease engine follows it.
struct DealConfig {
    /// GST/QST rates applied by financing and leasing
    SalesTaxRates taxes;

    /// Financing rate substituted when a program has no rate for a term
    double fallback_rate_pct = kFallbackRatePct;
};

/// Reject negative or non-finite rates
inline std::expected<void, ValidationError> validate_deal_config(const DealConfig& config) {
    if (auto taxes = validate_tax_rates(config.taxes); !taxes) {
        return taxes;
    }
    if (!std::isfinite(config.fallback_rate_pct) || config.fallback_rate_pct < 0.0) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::InvalidRate, config.fallback_rate_pct));
    }
    return {};
}

}  // namespace dealcalc
