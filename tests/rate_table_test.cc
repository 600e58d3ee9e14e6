// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include <limits>
#include "src/finance/rate_table.hpp"

namespace dealcalc {
namespace {

TEST(RateTableTest, SparseLookup) {
    auto table = RateTable::create({{36, 0.0}, {72, 4.99}, {96, 6.49}});
    ASSERT_TRUE(table.has_value());

    EXPECT_DOUBLE_EQ(table->find(36).value_or(-1.0), 0.0);
    EXPECT_DOUBLE_EQ(table->find(72).value_or(-1.0), 4.99);
    EXPECT_DOUBLE_EQ(table->find(96).value_or(-1.0), 6.49);
    EXPECT_FALSE(table->find(48).has_value());
    EXPECT_FALSE(table->find(12).has_value());
    EXPECT_FALSE(table->empty());
}

TEST(RateTableTest, DefaultIsEmpty) {
    RateTable table;
    EXPECT_TRUE(table.empty());
    for (int term : kFinancingTerms) {
        EXPECT_FALSE(table.find(term).has_value());
    }
}

TEST(RateTableTest, CreateRejectsUnsupportedTerm) {
    auto table = RateTable::create({{36, 1.99}, {66, 2.99}});
    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().code, ValidationErrorCode::UnsupportedTerm);
    EXPECT_DOUBLE_EQ(table.error().value, 66.0);
    EXPECT_EQ(table.error().index, 1u);
}

TEST(RateTableTest, CreateRejectsBadRate) {
    auto negative = RateTable::create({{48, -1.0}});
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().code, ValidationErrorCode::InvalidRate);

    auto nan = RateTable::create({{48, std::numeric_limits<double>::quiet_NaN()}});
    ASSERT_FALSE(nan.has_value());
    EXPECT_EQ(nan.error().code, ValidationErrorCode::InvalidRate);
}

TEST(RateTableTest, FallbackWhenMissing) {
    auto table = RateTable::create({{60, 1.49}});
    ASSERT_TRUE(table.has_value());

    EXPECT_DOUBLE_EQ(rate_for_term(*table, 60), 1.49);
    EXPECT_DOUBLE_EQ(rate_for_term(*table, 84), kFallbackRatePct);
    EXPECT_DOUBLE_EQ(rate_for_term(*table, 84, 7.25), 7.25);
    EXPECT_DOUBLE_EQ(rate_for_term(RateTable{}, 72), 4.99);
}

TEST(RateTableTest, ZeroRateIsNotMissing) {
    auto table = RateTable::create({{36, 0.0}});
    ASSERT_TRUE(table.has_value());
    EXPECT_DOUBLE_EQ(rate_for_term(*table, 36), 0.0);
}

TEST(RateTableTest, ValidateFinancingTerm) {
    EXPECT_TRUE(validate_financing_term(36).has_value());
    EXPECT_TRUE(validate_financing_term(96).has_value());

    auto zero = validate_financing_term(0);
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().code, ValidationErrorCode::InvalidTerm);

    auto odd = validate_financing_term(42);
    ASSERT_FALSE(odd.has_value());
    EXPECT_EQ(odd.error().code, ValidationErrorCode::UnsupportedTerm);

    EXPECT_EQ(financing_term_index(36).value_or(99), 0u);
    EXPECT_EQ(financing_term_index(96).value_or(99), 5u);
    EXPECT_FALSE(financing_term_index(24).has_value());
}

}  // namespace
}  // namespace dealcalc
