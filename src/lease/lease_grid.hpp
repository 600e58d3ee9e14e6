// SPDX-License-Identifier: MIT
/**
 * @file lease_grid.hpp
 * @brief Exhaustive search over mileage tier x term x rate plan
 *
 * Enumeration order is fixed and defines the tie-break:
 *   for km in 12000, 18000, 24000
 *     for term in 24, 27, 36, 39, 42, 48, 51, 54, 60
 *       alternative plan row, then standard plan row
 *
 * A row exists only when the plan has a rate for the term and the base
 * residual for the term is non-zero. The winner is the first row with the
 * lowest post-tax monthly payment.
 *
 * This objective (periodic affordability) differs from LeaseResult::best_lease
 * (lowest total cost). The two can disagree and are reported separately.
 */

#pragma once

#include "src/finance/deal_config.hpp"
#include "src/finance/deal_inputs.hpp"
#include "src/lease/lease_engine.hpp"
#include "src/lease/lease_tables.hpp"
#include "src/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <optional>
#include <vector>

namespace dealcalc {

/// One evaluated (term, mileage, plan) combination
struct GridRow {
    int term = 0;
    MileageTier mileage = MileageTier::Km24000;
    LeasePlan plan = LeasePlan::Standard;
    double residual_pct = 0.0;   ///< Adjusted for mileage
    LeaseScenarioResult scenario;

    /// Post-tax monthly payment, the quantity the search minimizes
    [[nodiscard]] double monthly_payment() const { return scenario.post_tax_payment.monthly; }
};

/// Globally cheapest row by monthly payment
struct BestLeaseOption {
    int term = 0;
    MileageTier mileage = MileageTier::Km24000;
    LeasePlan plan = LeasePlan::Standard;
    double monthly_payment = 0.0;
    size_t row_index = 0;        ///< Position in LeaseGridResult::grid
    LeaseScenarioResult scenario;
};

struct LeaseGridResult {
    std::optional<BestLeaseOption> best;  ///< Empty when the grid is empty
    std::vector<GridRow> grid;            ///< Enumeration order
};

/// Evaluate every lease combination for the matched vehicle
///
/// Missing rates and zero residuals shrink the grid; they are not errors.
///
/// @return ValidationError only for non-finite deal amounts or invalid config
std::expected<LeaseGridResult, ValidationError> search_best_lease(
    const ResidualEntry& residual,
    const LeaseRateEntry& rates,
    const KmAdjustmentTable& km_table,
    const DealInputs& inputs,
    double program_bonus_cash = 0.0,
    const DealConfig& config = {});

}  // namespace dealcalc
