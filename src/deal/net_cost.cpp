// SPDX-License-Identifier: MIT
#include "src/deal/net_cost.hpp"

namespace dealcalc {

NetCostResult compute_net_cost(const VehicleCostData& data) {
    NetCostResult result;
    result.data = data;
    result.margin = data.pdco - data.ep_cost;
    result.margin_pct = data.pdco > 0.0 ? result.margin / data.pdco * 100.0 : 0.0;
    result.dealer_net_cost = data.ep_cost - data.holdback;
    result.potential_profit = data.pdco - result.dealer_net_cost;
    return result;
}

Margin calculate_margin(double sell_price, double cost_price) {
    Margin margin;
    margin.amount = sell_price - cost_price;
    margin.pct = sell_price > 0.0 ? margin.amount / sell_price * 100.0 : 0.0;
    return margin;
}

std::string_view to_string(CostDataIssue issue) {
    switch (issue) {
        case CostDataIssue::NonPositiveEp:   return "EP must be positive";
        case CostDataIssue::NonPositivePdco: return "PDCO must be positive";
        case CostDataIssue::EpNotBelowPdco:  return "EP must be below PDCO";
        case CostDataIssue::PdcoOutOfRange:  return "PDCO outside 30K-150K";
    }
    return "unknown";
}

std::vector<CostDataIssue> validate_cost_data(const VehicleCostData& data) {
    std::vector<CostDataIssue> issues;
    if (data.ep_cost <= 0.0) {
        issues.push_back(CostDataIssue::NonPositiveEp);
    }
    if (data.pdco <= 0.0) {
        issues.push_back(CostDataIssue::NonPositivePdco);
    }
    if (data.ep_cost > 0.0 && data.pdco > 0.0 && data.ep_cost >= data.pdco) {
        issues.push_back(CostDataIssue::EpNotBelowPdco);
    }
    if (data.pdco < kMinPlausiblePdco || data.pdco > kMaxPlausiblePdco) {
        issues.push_back(CostDataIssue::PdcoOutOfRange);
    }
    return issues;
}

}  // namespace dealcalc
