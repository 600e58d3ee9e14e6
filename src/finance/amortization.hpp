// SPDX-License-Identifier: MIT
/**
 * @file amortization.hpp
 * @brief Level-payment amortization and payment-frequency conversion
 *
 * Frequency conversion assumes a year is exactly 12 months = 26 biweekly
 * periods = 52 weekly periods:
 *   biweekly = monthly * 12 / 26
 *   weekly   = monthly * 12 / 52
 * This is the calendar approximation dealers quote with, not an actuarial
 * day-count conversion.
 */

#pragma once

#include "src/support/error_types.hpp"
#include <expected>
#include <string_view>
#include <vector>

namespace dealcalc {

/// How often the customer pays
enum class PaymentFrequency {
    Monthly,
    Biweekly,
    Weekly
};

/// Parse "monthly" / "biweekly" / "weekly" (case-insensitive)
///
/// Unknown text is a caller error, not a zero default.
std::expected<PaymentFrequency, ValidationError> parse_payment_frequency(std::string_view text);

/// Level monthly payment for a fixed-rate loan
///
/// Returns 0 when principal <= 0 or n_months <= 0, and principal / n_months
/// for a zero rate. Otherwise
///   r = annual_rate_pct / 100 / 12
///   payment = principal * r * (1+r)^n / ((1+r)^n - 1)
///
/// @param principal Amount financed
/// @param annual_rate_pct Nominal annual rate in percent (4.99 for 4.99%)
/// @param n_months Number of monthly payments
double monthly_payment(double principal, double annual_rate_pct, int n_months);

inline double to_biweekly(double monthly) { return monthly * 12.0 / 26.0; }

inline double to_weekly(double monthly) { return monthly * 12.0 / 52.0; }

/// One payment expressed in all three frequencies
struct PeriodicPayment {
    double monthly = 0.0;
    double biweekly = 0.0;
    double weekly = 0.0;

    static PeriodicPayment from_monthly(double monthly) {
        return PeriodicPayment{monthly, to_biweekly(monthly), to_weekly(monthly)};
    }

    [[nodiscard]] double for_frequency(PaymentFrequency frequency) const {
        switch (frequency) {
            case PaymentFrequency::Biweekly: return biweekly;
            case PaymentFrequency::Weekly:   return weekly;
            case PaymentFrequency::Monthly:  break;
        }
        return monthly;
    }
};

/// One row of an amortization schedule
struct AmortizationRow {
    int period = 0;             ///< 1-based payment number
    double payment = 0.0;
    double interest = 0.0;
    double principal = 0.0;     ///< Principal repaid by this payment
    double balance = 0.0;       ///< Balance remaining after this payment
};

/// Full schedule for the level payment returned by monthly_payment()
///
/// Empty when principal <= 0 or n_months <= 0.
std::vector<AmortizationRow> amortization_schedule(
    double principal, double annual_rate_pct, int n_months);

/// Round to cents, for display only
///
/// Never feed the result back into further arithmetic.
double round_cents(double amount);

}  // namespace dealcalc
