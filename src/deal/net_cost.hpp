// SPDX-License-Identifier: MIT
/**
 * @file net_cost.hpp
 * @brief Dealer-side cost and margin of an invoiced vehicle
 *
 * EP is the employee price (dealer invoice cost), PDCO the dealer price
 * with options. Holdback is returned to the dealer by the manufacturer
 * after the sale, so the real cost is EP - holdback.
 */

#pragma once

#include <string_view>
#include <vector>

namespace dealcalc {

/// Invoice figures for one vehicle (dollars, 0 when absent)
struct VehicleCostData {
    double ep_cost = 0.0;
    double pdco = 0.0;
    double pref = 0.0;          ///< Preferred price, reported only
    double holdback = 0.0;
    double invoice_total = 0.0; ///< Reported only
};

struct NetCostResult {
    VehicleCostData data;

    double margin = 0.0;           ///< pdco - ep_cost
    double margin_pct = 0.0;       ///< Of pdco; 0 when pdco <= 0
    double dealer_net_cost = 0.0;  ///< ep_cost - holdback
    double potential_profit = 0.0; ///< pdco - dealer_net_cost
};

NetCostResult compute_net_cost(const VehicleCostData& data);

struct Margin {
    double amount = 0.0;
    double pct = 0.0;   ///< Of the sell price; 0 when sell price <= 0
};

Margin calculate_margin(double sell_price, double cost_price);

/// Plausible PDCO range for a new vehicle
inline constexpr double kMinPlausiblePdco = 30000.0;
inline constexpr double kMaxPlausiblePdco = 150000.0;

enum class CostDataIssue {
    NonPositiveEp,
    NonPositivePdco,
    EpNotBelowPdco,
    PdcoOutOfRange
};

std::string_view to_string(CostDataIssue issue);

/// Sanity checks on scanned invoice figures
///
/// Problems are advisory (OCR may misread a field), so every failing check
/// is reported rather than stopping at the first. Empty means valid.
std::vector<CostDataIssue> validate_cost_data(const VehicleCostData& data);

}  // namespace dealcalc
