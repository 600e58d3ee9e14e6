// SPDX-License-Identifier: MIT
/**
 * @file lease_engine.hpp
 * @brief Quebec lease payment for one (term, mileage, rate plan) scenario
 *
 * Money-factor lease arithmetic:
 *   residual_value  = pdsf * adjusted_residual_pct / 100
 *   selling_price   = price + accessories - dealer_discount
 *   cap_cost        = selling_price + admin_fee - lease_cash
 *   net_cap_cost    = cap_cost + carried + trade_owed - trade_value - down - bonus_cash
 *   depreciation    = (net_cap_cost - residual_value) / term
 *   money_factor    = rate / 2400
 *   finance_charge  = (net_cap_cost + residual_value) * money_factor
 *   pre_tax         = depreciation + finance_charge
 *   post_tax        = max(0, pre_tax + GST + QST - trade_credit_applied)
 *
 * Tire tax and RDPRM are paid at delivery and are not capitalized. A
 * negative carried balance is a debt and is grossed up by the combined
 * tax rate; a positive one is rolled in as is.
 *
 * Trade-in tax credit: (trade_value / term) * combined rate per period,
 * limited to the taxes on the payment. The excess is reported as
 * trade_credit_lost and never silently dropped.
 */

#pragma once

#include "src/finance/amortization.hpp"
#include "src/finance/deal_config.hpp"
#include "src/finance/deal_inputs.hpp"
#include "src/finance/tax.hpp"
#include "src/lease/lease_tables.hpp"
#include "src/support/error_types.hpp"
#include <algorithm>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace dealcalc {

/// Lender rate plan
enum class LeasePlan {
    Standard,     ///< standard rate + lease cash
    Alternative   ///< alternative (usually lower) rate, no lease cash
};

std::string_view to_string(LeasePlan plan);

/// Money factor for a rate in percent (rate / 2400)
inline double money_factor(double rate_pct) { return rate_pct / 2400.0; }

/// What to price: one plan at one term and mileage
struct LeaseScenarioSpec {
    LeasePlan plan = LeasePlan::Standard;
    int term = 0;
    MileageTier mileage = MileageTier::Km24000;
    double rate_pct = 0.0;
    double lease_cash = 0.0;
    double residual_pct = 0.0;  ///< Already adjusted for mileage
    double bonus_cash = 0.0;    ///< Effective bonus cash (override or program)
};

/// Full breakdown of one lease scenario
///
/// All fields are full precision; use round_cents() when displaying.
struct LeaseScenarioResult {
    LeasePlan plan = LeasePlan::Standard;
    int term = 0;
    MileageTier mileage = MileageTier::Km24000;
    double rate_pct = 0.0;
    double lease_cash = 0.0;

    double pdsf = 0.0;
    double residual_pct = 0.0;
    double residual_value = 0.0;

    double selling_price = 0.0;
    double cap_cost = 0.0;
    double carried_balance_net = 0.0;
    double net_cap_cost = 0.0;  ///< May be negative; see display_net_cap_cost()

    double money_factor = 0.0;
    double depreciation = 0.0;    ///< Per period
    double finance_charge = 0.0;  ///< Per period

    TaxBreakdown payment_tax;     ///< GST/QST on the pre-tax payment

    double trade_credit_potential = 0.0;
    double trade_credit_applied = 0.0;
    double trade_credit_lost = 0.0;

    PeriodicPayment pre_tax_payment;
    PeriodicPayment post_tax_payment;

    double total_cost = 0.0;         ///< post_tax_payment.monthly * term
    double cost_of_borrowing = 0.0;  ///< finance_charge * term

    [[nodiscard]] double display_net_cap_cost() const { return std::max(0.0, net_cap_cost); }

    /// True when part of the trade-in tax credit could not be used
    [[nodiscard]] bool has_lost_trade_credit() const { return trade_credit_lost > 0.0; }
};

/// Single-term lease comparison for the matched vehicle
struct LeaseResult {
    std::string vehicle_name;
    int term = 0;
    MileageTier mileage = MileageTier::Km24000;

    double base_residual_pct = 0.0;
    double km_adjustment = 0.0;   ///< Percentage points added for the tier
    double residual_pct = 0.0;    ///< base + adjustment
    double residual_value = 0.0;

    std::optional<LeaseScenarioResult> standard;
    std::optional<LeaseScenarioResult> alternative;

    /// Lower total_cost of the two plans; empty unless both exist
    std::optional<LeasePlan> best_lease;
    std::optional<double> savings;

    /// Scenario selected by best_lease (nullptr when none)
    [[nodiscard]] const LeaseScenarioResult* best() const;
};

/// Residual percentage for a term after the mileage adjustment
///
/// Returns 0 when the base percentage is 0 (term not offered), whatever
/// the adjustment.
double adjusted_residual_pct(const ResidualEntry& residual,
                             const KmAdjustmentTable& km_table,
                             int term,
                             MileageTier mileage);

/// Price one scenario
///
/// The caller guarantees term > 0 and a non-zero residual.
LeaseScenarioResult price_lease_scenario(const LeaseScenarioSpec& spec,
                                         const DealInputs& inputs,
                                         const SalesTaxRates& taxes = {});

/// Standard and alternative scenarios for one term and mileage tier
///
/// @param residual Matched residual record
/// @param rates Matched lease-rate record
/// @param km_table Mileage adjustments
/// @param inputs Parsed deal inputs
/// @param term Lease term in months (> 0)
/// @param km Annual mileage, one of 12000/18000/24000
/// @param program_bonus_cash Program bonus cash, used unless the deal overrides it
/// @param config Tax rates
/// @return std::nullopt when the residual for the term is 0 (term not
///         offered); ValidationError for a non-positive term, unknown
///         mileage, non-finite amount or invalid config
std::expected<std::optional<LeaseResult>, ValidationError> compute_lease(
    const ResidualEntry& residual,
    const LeaseRateEntry& rates,
    const KmAdjustmentTable& km_table,
    const DealInputs& inputs,
    int term,
    int km,
    double program_bonus_cash = 0.0,
    const DealConfig& config = {});

}  // namespace dealcalc
