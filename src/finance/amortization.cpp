// SPDX-License-Identifier: MIT
#include "src/finance/amortization.hpp"
#include "src/support/dealcalc_trace.h"
#include "src/support/text_parse.hpp"
#include <cmath>

namespace dealcalc {

std::expected<PaymentFrequency, ValidationError> parse_payment_frequency(std::string_view text) {
    auto key = ascii_lower(trim_ascii(text));
    if (key == "monthly") {
        return PaymentFrequency::Monthly;
    }
    if (key == "biweekly") {
        return PaymentFrequency::Biweekly;
    }
    if (key == "weekly") {
        return PaymentFrequency::Weekly;
    }
    DEALCALC_TRACE_VALIDATION_ERROR(MODULE_INPUT_PARSE,
        static_cast<int>(ValidationErrorCode::InvalidFrequency), 0.0, 0);
    return std::unexpected(ValidationError(ValidationErrorCode::InvalidFrequency));
}

double monthly_payment(double principal, double annual_rate_pct, int n_months) {
    if (principal <= 0.0 || n_months <= 0) {
        return 0.0;
    }
    if (annual_rate_pct == 0.0) {
        return principal / n_months;
    }

    const double r = annual_rate_pct / 100.0 / 12.0;
    const double growth = std::pow(1.0 + r, n_months);
    return principal * r * growth / (growth - 1.0);
}

std::vector<AmortizationRow> amortization_schedule(
    double principal, double annual_rate_pct, int n_months)
{
    std::vector<AmortizationRow> rows;
    if (principal <= 0.0 || n_months <= 0) {
        return rows;
    }

    const double payment = monthly_payment(principal, annual_rate_pct, n_months);
    const double r = annual_rate_pct / 100.0 / 12.0;
    rows.reserve(static_cast<size_t>(n_months));

    double balance = principal;
    for (int period = 1; period <= n_months; ++period) {
        AmortizationRow row;
        row.period = period;
        row.payment = payment;
        row.interest = balance * r;
        row.principal = payment - row.interest;
        balance -= row.principal;
        row.balance = balance;
        rows.push_back(row);
    }
    return rows;
}

double round_cents(double amount) {
    return std::round(amount * 100.0) / 100.0;
}

}  // namespace dealcalc
