// SPDX-License-Identifier: MIT
/**
 * @file financing.hpp
 * @brief Financing option comparison for one program and deal
 *
 * Runs both financing options through the amortization engine and picks
 * the cheaper one by total paid over the term (monthly payment * term):
 * - strictly lower total wins, savings = |total1 - total2|
 * - exact tie goes to option 1 (it carries the rebate), savings = 0
 * - no option 2 in the program: best_option and savings are empty
 *
 * Example:
 * @code
 * auto result = compute_financing(program, inputs, 72);
 * if (!result) {
 *     std::cerr << result.error() << "\n";
 * } else if (result->best_option == FinancingChoice::Option2) {
 *     std::cout << "Reduced rate saves " << *result->savings << "\n";
 * }
 * @endcode
 */

#pragma once

#include "src/finance/amortization.hpp"
#include "src/finance/deal_config.hpp"
#include "src/finance/deal_inputs.hpp"
#include "src/finance/financing_principal.hpp"
#include "src/finance/vehicle_program.hpp"
#include "src/support/error_types.hpp"
#include <expected>
#include <optional>
#include <vector>

namespace dealcalc {

enum class FinancingChoice {
    Option1,  ///< Rebates + standard rate
    Option2   ///< No rebate + reduced rate
};

/// One financing option evaluated for one term
struct FinancingOption {
    double rate_pct = 0.0;
    FinancingPrincipal principal;
    PeriodicPayment payment;
    double total = 0.0;  ///< payment.monthly * term
};

/// Derived snapshot: recomputed from scratch on every input change
struct FinancingResult {
    int term = 0;
    FinancingOption option1;
    std::optional<FinancingOption> option2;

    std::optional<FinancingChoice> best_option;
    std::optional<double> savings;   ///< Set whenever best_option is

    double bonus_cash_applied = 0.0; ///< Effective bonus cash used by option 1
    double trade_equity = 0.0;       ///< trade_in_value - trade_in_owed

    /// Option selected by best_option (option 1 when no comparison exists)
    [[nodiscard]] const FinancingOption& recommended() const {
        if (best_option == FinancingChoice::Option2 && option2) {
            return *option2;
        }
        return option1;
    }
};

/// Compare the program's financing options for one term
///
/// @param program Selected manufacturer program
/// @param inputs Parsed deal inputs
/// @param term Financing term, one of kFinancingTerms
/// @param config Tax rates and fallback rate
/// @return Result, or ValidationError for an unsupported term, a
///         non-finite amount or an invalid config
std::expected<FinancingResult, ValidationError> compute_financing(
    const VehicleProgram& program,
    const DealInputs& inputs,
    int term,
    const DealConfig& config = {});

/// compute_financing() for every term in kFinancingTerms, ascending
std::expected<std::vector<FinancingResult>, ValidationError> compare_financing_terms(
    const VehicleProgram& program,
    const DealInputs& inputs,
    const DealConfig& config = {});

}  // namespace dealcalc
