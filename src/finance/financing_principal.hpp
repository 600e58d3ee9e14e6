// SPDX-License-Identifier: MIT
/**
 * @file financing_principal.hpp
 * @brief Taxable base and amount financed for the two financing options
 *
 * Option 1 (rebate + standard rate):
 *   base  = price + accessories - consumer_cash - trade_in_value + taxable_fees
 *   gross = base + tax(base) + trade_in_owed
 *   net   = gross - down_payment - effective_bonus_cash
 *
 * Option 2 (no rebate + reduced rate):
 *   base  = price + accessories - trade_in_value + taxable_fees
 *   gross = base + tax(base) + trade_in_owed
 *   net   = gross - down_payment
 *
 * Down payment and bonus cash are tax-inclusive: they reduce the amount
 * financed, never the taxable base.
 */

#pragma once

#include "src/finance/deal_inputs.hpp"
#include "src/finance/tax.hpp"
#include "src/finance/vehicle_program.hpp"
#include <algorithm>

namespace dealcalc {

/// Breakdown of the amount financed for one option
struct FinancingPrincipal {
    double taxable_fees = 0.0;
    double taxable_base = 0.0;
    TaxBreakdown tax;
    double gross_principal = 0.0;   ///< base + tax + trade-in owed
    double net_principal = 0.0;     ///< gross - down payment (- bonus cash); may be negative

    /// Amount handed to the amortization engine (never negative)
    [[nodiscard]] double financed() const { return std::max(0.0, net_principal); }
};

/// Option 1: consumer cash before tax, bonus cash after tax
FinancingPrincipal option1_principal(const VehicleProgram& program,
                                     const DealInputs& inputs,
                                     const SalesTaxRates& taxes = {});

/// Option 2: no rebate of any kind
FinancingPrincipal option2_principal(const DealInputs& inputs,
                                     const SalesTaxRates& taxes = {});

}  // namespace dealcalc
