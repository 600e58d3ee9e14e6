// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/lease/lease_tables.hpp"

namespace dealcalc {
namespace {

TEST(MileageTierTest, KnownTiers) {
    EXPECT_EQ(mileage_tier_from_km(12000).value(), MileageTier::Km12000);
    EXPECT_EQ(mileage_tier_from_km(18000).value(), MileageTier::Km18000);
    EXPECT_EQ(mileage_tier_from_km(24000).value(), MileageTier::Km24000);
    EXPECT_EQ(km_per_year(MileageTier::Km18000), 18000);
}

TEST(MileageTierTest, UnknownTierIsAnError) {
    auto tier = mileage_tier_from_km(20000);
    ASSERT_FALSE(tier.has_value());
    EXPECT_EQ(tier.error().code, ValidationErrorCode::InvalidMileage);
    EXPECT_DOUBLE_EQ(tier.error().value, 20000.0);
}

TEST(ResidualEntryTest, MissingTermIsZero) {
    ResidualEntry entry;
    entry.residual_percentages = {{36, 55.0}, {48, 0.0}};
    EXPECT_DOUBLE_EQ(entry.residual_pct(36), 55.0);
    EXPECT_DOUBLE_EQ(entry.residual_pct(48), 0.0);
    EXPECT_DOUBLE_EQ(entry.residual_pct(60), 0.0);
}

TEST(ResidualEntryTest, LabelJoinsBrandModelAndTrim) {
    ResidualEntry entry;
    entry.brand = "Jeep";
    entry.model_name = "Grand Cherokee";
    entry.trim = "Limited";
    EXPECT_EQ(entry.label(), "Jeep Grand Cherokee Limited");

    entry.trim.clear();
    EXPECT_EQ(entry.label(), "Jeep Grand Cherokee");
}

TEST(KmAdjustmentTableTest, BaselineNeverAdjusted) {
    KmAdjustmentTable table;
    table.adjustments[MileageTier::Km12000] = {{36, 3.0}};
    table.adjustments[MileageTier::Km18000] = {{36, 2.0}};
    table.adjustments[MileageTier::Km24000] = {{36, 9.0}};

    EXPECT_DOUBLE_EQ(table.points(MileageTier::Km12000, 36), 3.0);
    EXPECT_DOUBLE_EQ(table.points(MileageTier::Km18000, 36), 2.0);
    EXPECT_DOUBLE_EQ(table.points(MileageTier::Km24000, 36), 0.0);
    EXPECT_DOUBLE_EQ(table.points(MileageTier::Km18000, 48), 0.0);
    EXPECT_DOUBLE_EQ(KmAdjustmentTable{}.points(MileageTier::Km12000, 36), 0.0);
}

TEST(LeaseRateEntryTest, RatesByTerm) {
    LeaseRateEntry entry;
    entry.standard_rates = {{36, 5.49}};
    entry.alternative_rates = {{36, 1.99}, {48, 2.49}};

    EXPECT_DOUBLE_EQ(entry.standard_rate(36).value_or(-1.0), 5.49);
    EXPECT_FALSE(entry.standard_rate(48).has_value());
    EXPECT_DOUBLE_EQ(entry.alternative_rate(48).value_or(-1.0), 2.49);
}

TEST(LeaseRateCatalogTest, ExactYear) {
    LeaseRateCatalog catalog;
    catalog.by_year[2025] = {LeaseRateEntry{.brand = "Jeep", .model = "Compass"}};
    catalog.by_year[2026] = {LeaseRateEntry{.brand = "Jeep", .model = "Wagoneer"},
                             LeaseRateEntry{.brand = "Ram", .model = "1500"}};

    auto entries = catalog.entries_for_year(2025);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].model, "Compass");
}

TEST(LeaseRateCatalogTest, FallsBackToMostRecentYear) {
    LeaseRateCatalog catalog;
    catalog.by_year[2025] = {LeaseRateEntry{.brand = "Jeep", .model = "Compass"}};
    catalog.by_year[2026] = {LeaseRateEntry{.brand = "Ram", .model = "1500"}};

    auto entries = catalog.entries_for_year(2024);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].model, "1500");
}

TEST(LeaseRateCatalogTest, EmptyCatalog) {
    EXPECT_TRUE(LeaseRateCatalog{}.entries_for_year(2025).empty());
}

}  // namespace
}  // namespace dealcalc
