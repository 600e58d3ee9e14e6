// SPDX-License-Identifier: MIT
#include "src/finance/financing.hpp"
#include "src/support/dealcalc_trace.h"
#include <utility>

namespace dealcalc {

namespace {

FinancingOption evaluate_option(const FinancingPrincipal& principal,
                                double rate_pct,
                                int term)
{
    FinancingOption option;
    option.rate_pct = rate_pct;
    option.principal = principal;
    option.payment = PeriodicPayment::from_monthly(
        monthly_payment(principal.financed(), rate_pct, term));
    option.total = option.payment.monthly * term;
    return option;
}

std::expected<void, ValidationError> validate_request(const DealInputs& inputs,
                                                      int term,
                                                      const DealConfig& config)
{
    if (auto ok = validate_financing_term(term); !ok) {
        DEALCALC_TRACE_VALIDATION_ERROR(MODULE_FINANCING,
            static_cast<int>(ok.error().code), term, 0);
        return ok;
    }
    if (auto ok = validate_deal_inputs(inputs); !ok) {
        return ok;
    }
    return validate_deal_config(config);
}

}  // namespace

std::expected<FinancingResult, ValidationError> compute_financing(
    const VehicleProgram& program,
    const DealInputs& inputs,
    int term,
    const DealConfig& config)
{
    if (auto ok = validate_request(inputs, term, config); !ok) {
        return std::unexpected(ok.error());
    }

    DEALCALC_TRACE_ALGO_START(MODULE_FINANCING, term, program.has_option2() ? 2 : 1, 0);

    FinancingResult result;
    result.term = term;
    result.bonus_cash_applied = inputs.effective_bonus_cash(program.bonus_cash);
    result.trade_equity = inputs.trade_in_value - inputs.trade_in_owed;

    result.option1 = evaluate_option(
        option1_principal(program, inputs, config.taxes),
        rate_for_term(program.option1_rates, term, config.fallback_rate_pct),
        term);

    if (program.option2_rates) {
        result.option2 = evaluate_option(
            option2_principal(inputs, config.taxes),
            rate_for_term(*program.option2_rates, term, config.fallback_rate_pct),
            term);

        const double total1 = result.option1.total;
        const double total2 = result.option2->total;
        if (total2 < total1) {
            result.best_option = FinancingChoice::Option2;
            result.savings = total1 - total2;
        } else if (total1 < total2) {
            result.best_option = FinancingChoice::Option1;
            result.savings = total2 - total1;
        } else {
            result.best_option = FinancingChoice::Option1;
            result.savings = 0.0;
        }
    }

    DEALCALC_TRACE_ALGO_COMPLETE(MODULE_FINANCING, result.option2 ? 2 : 1,
                                 result.recommended().payment.monthly);
    return result;
}

std::expected<std::vector<FinancingResult>, ValidationError> compare_financing_terms(
    const VehicleProgram& program,
    const DealInputs& inputs,
    const DealConfig& config)
{
    std::vector<FinancingResult> results;
    results.reserve(kFinancingTerms.size());
    for (int term : kFinancingTerms) {
        auto result = compute_financing(program, inputs, term, config);
        if (!result) {
            return std::unexpected(result.error());
        }
        results.push_back(std::move(*result));
    }
    return results;
}

}  // namespace dealcalc
