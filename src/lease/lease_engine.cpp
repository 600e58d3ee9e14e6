// SPDX-License-Identifier: MIT
#include "src/lease/lease_engine.hpp"
#include "src/support/dealcalc_trace.h"
#include <cmath>
#include <utility>

namespace dealcalc {

namespace {

/// Carried balance as rolled into the cap cost
double normalize_carried_balance(double balance, const SalesTaxRates& taxes) {
    if (balance < 0.0) {
        return taxes.gross_up(std::abs(balance));
    }
    return balance;
}

std::optional<LeaseScenarioResult> scenario_for_plan(LeasePlan plan,
                                                     std::optional<double> rate_pct,
                                                     double lease_cash,
                                                     const LeaseResult& lease,
                                                     double bonus_cash,
                                                     const DealInputs& inputs,
                                                     const SalesTaxRates& taxes)
{
    if (!rate_pct) {
        DEALCALC_TRACE_SCENARIO_SKIPPED(lease.term, km_per_year(lease.mileage),
                                        SCENARIO_SKIP_NO_RATE);
        return std::nullopt;
    }
    LeaseScenarioSpec spec{
        .plan = plan,
        .term = lease.term,
        .mileage = lease.mileage,
        .rate_pct = *rate_pct,
        .lease_cash = lease_cash,
        .residual_pct = lease.residual_pct,
        .bonus_cash = bonus_cash,
    };
    return price_lease_scenario(spec, inputs, taxes);
}

}  // namespace

std::string_view to_string(LeasePlan plan) {
    switch (plan) {
        case LeasePlan::Standard:    return "standard";
        case LeasePlan::Alternative: return "alternative";
    }
    return "unknown";
}

const LeaseScenarioResult* LeaseResult::best() const {
    if (!best_lease) {
        return nullptr;
    }
    const auto& chosen = (*best_lease == LeasePlan::Standard) ? standard : alternative;
    return chosen ? &*chosen : nullptr;
}

double adjusted_residual_pct(const ResidualEntry& residual,
                             const KmAdjustmentTable& km_table,
                             int term,
                             MileageTier mileage)
{
    const double base = residual.residual_pct(term);
    if (base == 0.0) {
        return 0.0;
    }
    return base + km_table.points(mileage, term);
}

LeaseScenarioResult price_lease_scenario(const LeaseScenarioSpec& spec,
                                         const DealInputs& inputs,
                                         const SalesTaxRates& taxes)
{
    const double term = static_cast<double>(spec.term);

    LeaseScenarioResult r;
    r.plan = spec.plan;
    r.term = spec.term;
    r.mileage = spec.mileage;
    r.rate_pct = spec.rate_pct;
    r.lease_cash = spec.lease_cash;

    r.pdsf = inputs.residual_basis();
    r.residual_pct = spec.residual_pct;
    r.residual_value = r.pdsf * spec.residual_pct / 100.0;

    // Tire tax and RDPRM are paid at delivery, only the admin fee is capitalized
    r.selling_price = inputs.vehicle_price + inputs.accessories_total() - inputs.dealer_discount;
    r.cap_cost = r.selling_price + inputs.admin_fee - spec.lease_cash;
    r.carried_balance_net = normalize_carried_balance(inputs.carried_balance, taxes);
    r.net_cap_cost = r.cap_cost + r.carried_balance_net + inputs.trade_in_owed
                   - inputs.trade_in_value - inputs.down_payment - spec.bonus_cash;

    r.money_factor = money_factor(spec.rate_pct);
    r.depreciation = (r.net_cap_cost - r.residual_value) / term;
    r.finance_charge = (r.net_cap_cost + r.residual_value) * r.money_factor;

    const double pre_tax = r.depreciation + r.finance_charge;
    r.payment_tax = taxes.apply(pre_tax);

    // A negative payment carries negative tax; there is nothing to credit against
    const double creditable_tax = std::max(0.0, r.payment_tax.total);
    if (inputs.trade_in_value > 0.0) {
        r.trade_credit_potential = inputs.trade_in_value / term * taxes.combined();
        r.trade_credit_applied = std::min(r.trade_credit_potential, creditable_tax);
        r.trade_credit_lost = std::max(0.0, r.trade_credit_potential - creditable_tax);
        if (r.trade_credit_lost > 0.0) {
            DEALCALC_TRACE_TRADE_CREDIT_LOST(spec.term, r.trade_credit_potential,
                                             r.trade_credit_lost);
        }
    }

    const double post_tax = std::max(0.0, pre_tax + r.payment_tax.total - r.trade_credit_applied);
    r.pre_tax_payment = PeriodicPayment::from_monthly(pre_tax);
    r.post_tax_payment = PeriodicPayment::from_monthly(post_tax);

    r.total_cost = post_tax * term;
    r.cost_of_borrowing = r.finance_charge * term;
    return r;
}

std::expected<std::optional<LeaseResult>, ValidationError> compute_lease(
    const ResidualEntry& residual,
    const LeaseRateEntry& rates,
    const KmAdjustmentTable& km_table,
    const DealInputs& inputs,
    int term,
    int km,
    double program_bonus_cash,
    const DealConfig& config)
{
    if (term <= 0) {
        DEALCALC_TRACE_VALIDATION_ERROR(MODULE_LEASE,
            static_cast<int>(ValidationErrorCode::InvalidTerm), term, 0);
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidTerm, term));
    }
    auto mileage = mileage_tier_from_km(km);
    if (!mileage) {
        return std::unexpected(mileage.error());
    }
    if (auto ok = validate_deal_inputs(inputs); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = validate_deal_config(config); !ok) {
        return std::unexpected(ok.error());
    }

    DEALCALC_TRACE_ALGO_START(MODULE_LEASE, term, km, 0);

    LeaseResult lease;
    lease.vehicle_name = residual.label();
    lease.term = term;
    lease.mileage = *mileage;
    lease.base_residual_pct = residual.residual_pct(term);
    if (lease.base_residual_pct == 0.0) {
        DEALCALC_TRACE_SCENARIO_SKIPPED(term, km, SCENARIO_SKIP_NO_RESIDUAL);
        return std::optional<LeaseResult>{};
    }
    lease.km_adjustment = km_table.points(*mileage, term);
    lease.residual_pct = adjusted_residual_pct(residual, km_table, term, *mileage);
    lease.residual_value = inputs.residual_basis() * lease.residual_pct / 100.0;

    const double bonus_cash = inputs.effective_bonus_cash(program_bonus_cash);
    lease.standard = scenario_for_plan(LeasePlan::Standard, rates.standard_rate(term),
                                       rates.lease_cash, lease, bonus_cash, inputs, config.taxes);
    lease.alternative = scenario_for_plan(LeasePlan::Alternative, rates.alternative_rate(term),
                                          0.0, lease, bonus_cash, inputs, config.taxes);

    if (lease.standard && lease.alternative) {
        const double standard_total = lease.standard->total_cost;
        const double alternative_total = lease.alternative->total_cost;
        // Tie goes to the alternative plan
        lease.best_lease = (standard_total < alternative_total) ? LeasePlan::Standard
                                                                : LeasePlan::Alternative;
        lease.savings = std::abs(standard_total - alternative_total);
    }

    const auto* best = lease.best();
    DEALCALC_TRACE_ALGO_COMPLETE(MODULE_LEASE,
        static_cast<int>(lease.standard.has_value()) + static_cast<int>(lease.alternative.has_value()),
        best ? best->post_tax_payment.monthly : 0.0);
    return std::optional<LeaseResult>{std::move(lease)};
}

}  // namespace dealcalc
