// SPDX-License-Identifier: MIT
#include "src/finance/financing_principal.hpp"

namespace dealcalc {

namespace {

FinancingPrincipal principal_from_base(double taxable_base,
                                       double taxable_fees,
                                       const DealInputs& inputs,
                                       double post_tax_credit,
                                       const SalesTaxRates& taxes)
{
    FinancingPrincipal p;
    p.taxable_fees = taxable_fees;
    p.taxable_base = taxable_base;
    p.tax = taxes.apply(taxable_base);
    p.gross_principal = taxable_base + p.tax.total + inputs.trade_in_owed;
    p.net_principal = p.gross_principal - inputs.down_payment - post_tax_credit;
    return p;
}

}  // namespace

FinancingPrincipal option1_principal(const VehicleProgram& program,
                                     const DealInputs& inputs,
                                     const SalesTaxRates& taxes)
{
    const double fees = inputs.taxable_fees();
    const double base = inputs.vehicle_price + inputs.accessories_total()
                      - program.consumer_cash - inputs.trade_in_value + fees;
    return principal_from_base(base, fees, inputs,
                               inputs.effective_bonus_cash(program.bonus_cash), taxes);
}

FinancingPrincipal option2_principal(const DealInputs& inputs,
                                     const SalesTaxRates& taxes)
{
    const double fees = inputs.taxable_fees();
    const double base = inputs.vehicle_price + inputs.accessories_total()
                      - inputs.trade_in_value + fees;
    return principal_from_base(base, fees, inputs, 0.0, taxes);
}

}  // namespace dealcalc
