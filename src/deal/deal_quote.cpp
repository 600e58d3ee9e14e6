// SPDX-License-Identifier: MIT
#include "src/deal/deal_quote.hpp"
#include "src/lease/vehicle_matcher.hpp"
#include "src/support/dealcalc_trace.h"
#include <utility>

namespace dealcalc {

namespace {

std::expected<std::optional<LeaseQuote>, ValidationError> quote_lease(
    const VehicleProgram& program,
    const DealInputs& inputs,
    const LeaseMarket& market,
    const DealConfig& config)
{
    const auto query = VehicleQuery::from_program(program, market.body_style);
    const auto rate_entries = market.lease_rates.entries_for_year(program.year);

    auto residual_index = match_residual(query, market.residuals);
    auto rate_index = match_lease_rate(query, rate_entries);
    if (!residual_index || !rate_index) {
        return std::optional<LeaseQuote>{};
    }

    const auto& residual = market.residuals[*residual_index];
    const auto& rates = rate_entries[*rate_index];

    auto selected = compute_lease(residual, rates, market.km_adjustments, inputs,
                                  market.lease_term, market.km, program.bonus_cash, config);
    if (!selected) {
        return std::unexpected(selected.error());
    }
    auto grid = search_best_lease(residual, rates, market.km_adjustments, inputs,
                                  program.bonus_cash, config);
    if (!grid) {
        return std::unexpected(grid.error());
    }

    LeaseQuote quote;
    quote.residual_index = *residual_index;
    quote.lease_rate_index = *rate_index;
    quote.selected = std::move(*selected);
    quote.grid = std::move(*grid);
    return std::optional<LeaseQuote>{std::move(quote)};
}

}  // namespace

const LeaseScenarioResult* preferred_scenario(const LeaseResult& lease) {
    if (const auto* best = lease.best()) {
        return best;
    }
    if (lease.standard) {
        return &*lease.standard;
    }
    if (lease.alternative) {
        return &*lease.alternative;
    }
    return nullptr;
}

std::expected<DealQuote, ValidationError> quote_deal(
    const VehicleProgram& program,
    const DealInputs& inputs,
    const LeaseMarket* market,
    const DealConfig& config)
{
    DEALCALC_TRACE_ALGO_START(MODULE_DEAL_QUOTE, inputs.term,
                              market ? market->lease_term : 0, market ? market->km : 0);

    auto financing = compute_financing(program, inputs, inputs.term, config);
    if (!financing) {
        return std::unexpected(financing.error());
    }

    DealQuote quote;
    quote.financing = std::move(*financing);
    quote.frequency = inputs.frequency;
    quote.financing_payment = quote.financing.recommended().payment.for_frequency(inputs.frequency);

    if (market) {
        auto lease = quote_lease(program, inputs, *market, config);
        if (!lease) {
            return std::unexpected(lease.error());
        }
        quote.lease = std::move(*lease);
    }

    if (quote.lease && quote.lease->selected) {
        if (const auto* scenario = preferred_scenario(*quote.lease->selected)) {
            quote.lease_payment = scenario->post_tax_payment.for_frequency(inputs.frequency);
        }
    }

    DEALCALC_TRACE_ALGO_COMPLETE(MODULE_DEAL_QUOTE, quote.lease ? 2 : 1, quote.financing_payment);
    return quote;
}

}  // namespace dealcalc
