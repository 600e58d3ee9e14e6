// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include <algorithm>
#include "src/deal/net_cost.hpp"

namespace dealcalc {
namespace {

bool has_issue(const std::vector<CostDataIssue>& issues, CostDataIssue issue) {
    return std::find(issues.begin(), issues.end(), issue) != issues.end();
}

TEST(NetCostTest, DealerMargins) {
    VehicleCostData data{.ep_cost = 52000.0, .pdco = 56000.0, .pref = 53500.0,
                         .holdback = 1500.0, .invoice_total = 58100.0};
    auto result = compute_net_cost(data);

    EXPECT_DOUBLE_EQ(result.margin, 4000.0);
    EXPECT_NEAR(result.margin_pct, 4000.0 / 56000.0 * 100.0, 1e-9);
    EXPECT_DOUBLE_EQ(result.dealer_net_cost, 50500.0);
    EXPECT_DOUBLE_EQ(result.potential_profit, 5500.0);
    EXPECT_DOUBLE_EQ(result.data.pref, 53500.0);
    EXPECT_DOUBLE_EQ(result.data.invoice_total, 58100.0);
}

TEST(NetCostTest, ZeroPdcoHasZeroPercent) {
    auto result = compute_net_cost(VehicleCostData{.ep_cost = 1000.0});
    EXPECT_DOUBLE_EQ(result.margin, -1000.0);
    EXPECT_DOUBLE_EQ(result.margin_pct, 0.0);
}

TEST(NetCostTest, MarginOfSellPrice) {
    auto margin = calculate_margin(50000.0, 45000.0);
    EXPECT_DOUBLE_EQ(margin.amount, 5000.0);
    EXPECT_DOUBLE_EQ(margin.pct, 10.0);

    auto free = calculate_margin(0.0, 100.0);
    EXPECT_DOUBLE_EQ(free.amount, -100.0);
    EXPECT_DOUBLE_EQ(free.pct, 0.0);
}

TEST(CostDataValidationTest, PlausibleInvoice) {
    EXPECT_TRUE(validate_cost_data(VehicleCostData{.ep_cost = 52000.0, .pdco = 56000.0}).empty());
}

TEST(CostDataValidationTest, ReportsEveryProblem) {
    auto issues = validate_cost_data(VehicleCostData{});
    EXPECT_TRUE(has_issue(issues, CostDataIssue::NonPositiveEp));
    EXPECT_TRUE(has_issue(issues, CostDataIssue::NonPositivePdco));
    EXPECT_TRUE(has_issue(issues, CostDataIssue::PdcoOutOfRange));
    EXPECT_FALSE(has_issue(issues, CostDataIssue::EpNotBelowPdco));
}

TEST(CostDataValidationTest, EpMustBeBelowPdco) {
    auto issues = validate_cost_data(VehicleCostData{.ep_cost = 60000.0, .pdco = 60000.0});
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0], CostDataIssue::EpNotBelowPdco);
}

TEST(CostDataValidationTest, PdcoRange) {
    EXPECT_TRUE(has_issue(validate_cost_data(VehicleCostData{.ep_cost = 20000.0, .pdco = 29999.0}),
                          CostDataIssue::PdcoOutOfRange));
    EXPECT_TRUE(has_issue(validate_cost_data(VehicleCostData{.ep_cost = 140000.0, .pdco = 150001.0}),
                          CostDataIssue::PdcoOutOfRange));
    EXPECT_TRUE(validate_cost_data(VehicleCostData{.ep_cost = 25000.0, .pdco = 30000.0}).empty());
    EXPECT_TRUE(validate_cost_data(VehicleCostData{.ep_cost = 140000.0, .pdco = 150000.0}).empty());
}

TEST(CostDataValidationTest, IssueNames) {
    EXPECT_EQ(to_string(CostDataIssue::EpNotBelowPdco), "EP must be below PDCO");
}

}  // namespace
}  // namespace dealcalc
