// SPDX-License-Identifier: MIT
/**
 * @file deal_quote.hpp
 * @brief Whole-deal quote: financing plus, when offered, leasing
 *
 * One call per input change. Financing always runs for inputs.term. Leasing
 * runs only when a LeaseMarket is supplied and the vehicle matcher finds
 * both a residual record and a lease-rate record; otherwise the lease part
 * is empty and the quote is financing-only.
 *
 * Example:
 * @code
 * LeaseMarket market{.residuals = residuals, .km_adjustments = km_table,
 *                    .lease_rates = catalog, .lease_term = 36, .km = 18000};
 * auto quote = quote_deal(program, inputs, &market);
 * if (quote && quote->lease) {
 *     auto& grid = quote->lease->grid;
 *     ...
 * }
 * @endcode
 */

#pragma once

#include "src/finance/deal_config.hpp"
#include "src/finance/deal_inputs.hpp"
#include "src/finance/financing.hpp"
#include "src/finance/vehicle_program.hpp"
#include "src/lease/lease_engine.hpp"
#include "src/lease/lease_grid.hpp"
#include "src/lease/lease_tables.hpp"
#include "src/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace dealcalc {

/// Lease reference data and the lease selection made on the form
struct LeaseMarket {
    std::vector<ResidualEntry> residuals;
    KmAdjustmentTable km_adjustments;
    LeaseRateCatalog lease_rates;

    int lease_term = 36;
    int km = 24000;
    std::string body_style;  ///< Inventory body style; empty when unknown
};

/// Lease side of a quote for a matched vehicle
struct LeaseQuote {
    size_t residual_index = 0;    ///< Into LeaseMarket::residuals
    size_t lease_rate_index = 0;  ///< Into the catalog list for the program year

    /// Selected term and mileage; empty when the term is not offered
    std::optional<LeaseResult> selected;

    LeaseGridResult grid;
};

struct DealQuote {
    FinancingResult financing;
    std::optional<LeaseQuote> lease;

    PaymentFrequency frequency = PaymentFrequency::Monthly;

    /// Recommended financing option's payment at the selected frequency
    double financing_payment = 0.0;

    /// Post-tax payment of the preferred selected-term lease scenario at the
    /// selected frequency
    std::optional<double> lease_payment;
};

/// Preferred scenario of a single-term lease: best_lease when both plans
/// exist, otherwise whichever plan was priced
const LeaseScenarioResult* preferred_scenario(const LeaseResult& lease);

/// Quote a deal
///
/// @param program Selected manufacturer program
/// @param inputs Parsed deal inputs; inputs.term is the financing term
/// @param market Lease data, or nullptr for a financing-only quote
/// @param config Tax rates and fallback rate
/// @return ValidationError for an unsupported financing term, unknown lease
///         mileage, non-positive lease term, non-finite amount or invalid config
std::expected<DealQuote, ValidationError> quote_deal(
    const VehicleProgram& program,
    const DealInputs& inputs,
    const LeaseMarket* market = nullptr,
    const DealConfig& config = {});

}  // namespace dealcalc
