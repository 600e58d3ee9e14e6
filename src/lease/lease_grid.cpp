// SPDX-License-Identifier: MIT
#include "src/lease/lease_grid.hpp"
#include "src/support/dealcalc_trace.h"
#include <utility>

namespace dealcalc {

std::expected<LeaseGridResult, ValidationError> search_best_lease(
    const ResidualEntry& residual,
    const LeaseRateEntry& rates,
    const KmAdjustmentTable& km_table,
    const DealInputs& inputs,
    double program_bonus_cash,
    const DealConfig& config)
{
    if (auto ok = validate_deal_inputs(inputs); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = validate_deal_config(config); !ok) {
        return std::unexpected(ok.error());
    }

    DEALCALC_TRACE_ALGO_START(MODULE_LEASE_GRID,
        static_cast<int>(kLeaseTerms.size()), static_cast<int>(kMileageTiers.size()), 0);

    const double bonus_cash = inputs.effective_bonus_cash(program_bonus_cash);

    LeaseGridResult result;
    result.grid.reserve(kLeaseTerms.size() * kMileageTiers.size() * 2);

    for (MileageTier mileage : kMileageTiers) {
        for (int term : kLeaseTerms) {
            // Offered terms follow the base residual, not the km-adjusted one
            if (residual.residual_pct(term) == 0.0) {
                DEALCALC_TRACE_SCENARIO_SKIPPED(term, km_per_year(mileage),
                                                SCENARIO_SKIP_NO_RESIDUAL);
                continue;
            }
            const double residual_pct = adjusted_residual_pct(residual, km_table, term, mileage);

            struct PlanRate {
                LeasePlan plan;
                std::optional<double> rate;
                double lease_cash;
            };
            const PlanRate plans[] = {
                {LeasePlan::Alternative, rates.alternative_rate(term), 0.0},
                {LeasePlan::Standard, rates.standard_rate(term), rates.lease_cash},
            };

            for (const auto& p : plans) {
                if (!p.rate) {
                    DEALCALC_TRACE_SCENARIO_SKIPPED(term, km_per_year(mileage),
                                                    SCENARIO_SKIP_NO_RATE);
                    continue;
                }
                LeaseScenarioSpec spec{
                    .plan = p.plan,
                    .term = term,
                    .mileage = mileage,
                    .rate_pct = *p.rate,
                    .lease_cash = p.lease_cash,
                    .residual_pct = residual_pct,
                    .bonus_cash = bonus_cash,
                };
                GridRow row;
                row.term = term;
                row.mileage = mileage;
                row.plan = p.plan;
                row.residual_pct = residual_pct;
                row.scenario = price_lease_scenario(spec, inputs, config.taxes);
                result.grid.push_back(std::move(row));
            }
        }
    }

    for (size_t i = 0; i < result.grid.size(); ++i) {
        const auto& row = result.grid[i];
        // Strict < keeps the first minimum in enumeration order
        if (!result.best || row.monthly_payment() < result.best->monthly_payment) {
            result.best = BestLeaseOption{
                .term = row.term,
                .mileage = row.mileage,
                .plan = row.plan,
                .monthly_payment = row.monthly_payment(),
                .row_index = i,
                .scenario = row.scenario,
            };
        }
    }

    if (result.best) {
        DEALCALC_TRACE_GRID_BEST(result.best->term, km_per_year(result.best->mileage),
                                 result.best->plan == LeasePlan::Alternative ? 1 : 0,
                                 result.best->monthly_payment);
    }
    DEALCALC_TRACE_ALGO_COMPLETE(MODULE_LEASE_GRID, result.grid.size(),
                                 result.best ? result.best->monthly_payment : 0.0);
    return result;
}

}  // namespace dealcalc
