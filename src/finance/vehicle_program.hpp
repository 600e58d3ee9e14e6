// SPDX-License-Identifier: MIT
/**
 * @file vehicle_program.hpp
 * @brief Manufacturer financing program for one vehicle
 */

#pragma once

#include "src/finance/rate_table.hpp"
#include <optional>
#include <string>

namespace dealcalc {

/// Manufacturer financing program, loaded externally and read-only here
///
/// Option 1 pairs the rebates with option1_rates. Option 2 (no rebate,
/// reduced rate) exists only when option2_rates is set; it is never
/// derived from option 1.
struct VehicleProgram {
    std::string brand;
    std::string model;
    std::optional<std::string> trim;
    int year = 0;

    double consumer_cash = 0.0;  ///< Pre-tax rebate, option 1 only
    double bonus_cash = 0.0;     ///< Post-tax rebate, option 1 only

    RateTable option1_rates;
    std::optional<RateTable> option2_rates;

    [[nodiscard]] bool has_option2() const { return option2_rates.has_value(); }
};

}  // namespace dealcalc
