// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include <limits>
#include "src/finance/deal_inputs.hpp"

namespace dealcalc {
namespace {

TEST(ParseDealInputsTest, EmptyFormIsAllZero) {
    auto inputs = parse_deal_inputs(RawDealInputs{});
    ASSERT_TRUE(inputs.has_value());

    EXPECT_DOUBLE_EQ(inputs->vehicle_price, 0.0);
    EXPECT_DOUBLE_EQ(inputs->taxable_fees(), 0.0);
    EXPECT_DOUBLE_EQ(inputs->down_payment, 0.0);
    EXPECT_FALSE(inputs->bonus_cash_override.has_value());
    EXPECT_FALSE(inputs->pdsf.has_value());
    EXPECT_EQ(inputs->term, 72);
    EXPECT_EQ(inputs->frequency, PaymentFrequency::Monthly);
}

TEST(ParseDealInputsTest, ParsesEveryField) {
    RawDealInputs raw;
    raw.vehicle_price = "52995";
    raw.accessories = {{"Tonneau", "1200"}, {"Mats", "abc"}};
    raw.admin_fee = "799";
    raw.tire_tax = "15";
    raw.rdprm_fee = "101.50";
    raw.trade_in_value = "12000";
    raw.trade_in_owed = "4000";
    raw.down_payment = " 3000";
    raw.bonus_cash_override = "1500";
    raw.term = 84;
    raw.frequency = "Biweekly";
    raw.pdsf = "54500";
    raw.dealer_discount = "500";
    raw.carried_balance = "-2000";

    auto inputs = parse_deal_inputs(raw);
    ASSERT_TRUE(inputs.has_value());

    EXPECT_DOUBLE_EQ(inputs->vehicle_price, 52995.0);
    ASSERT_EQ(inputs->accessories.size(), 2u);
    EXPECT_EQ(inputs->accessories[0].description, "Tonneau");
    EXPECT_DOUBLE_EQ(inputs->accessories[1].price, 0.0);
    EXPECT_DOUBLE_EQ(inputs->accessories_total(), 1200.0);
    EXPECT_NEAR(inputs->taxable_fees(), 915.5, 1e-9);
    EXPECT_DOUBLE_EQ(inputs->trade_in_value, 12000.0);
    EXPECT_DOUBLE_EQ(inputs->trade_in_owed, 4000.0);
    EXPECT_DOUBLE_EQ(inputs->down_payment, 3000.0);
    EXPECT_DOUBLE_EQ(inputs->bonus_cash_override.value_or(0.0), 1500.0);
    EXPECT_EQ(inputs->term, 84);
    EXPECT_EQ(inputs->frequency, PaymentFrequency::Biweekly);
    EXPECT_DOUBLE_EQ(inputs->residual_basis(), 54500.0);
    EXPECT_DOUBLE_EQ(inputs->dealer_discount, 500.0);
    EXPECT_DOUBLE_EQ(inputs->carried_balance, -2000.0);
}

TEST(ParseDealInputsTest, ZeroOverridesMeanNotProvided) {
    RawDealInputs raw;
    raw.vehicle_price = "40000";
    raw.bonus_cash_override = "0";
    raw.pdsf = "n/a";

    auto inputs = parse_deal_inputs(raw);
    ASSERT_TRUE(inputs.has_value());
    EXPECT_FALSE(inputs->bonus_cash_override.has_value());
    EXPECT_DOUBLE_EQ(inputs->effective_bonus_cash(1000.0), 1000.0);
    EXPECT_DOUBLE_EQ(inputs->residual_basis(), 40000.0);
}

TEST(ParseDealInputsTest, OverrideReplacesProgramBonus) {
    DealInputs inputs;
    inputs.bonus_cash_override = 250.0;
    EXPECT_DOUBLE_EQ(inputs.effective_bonus_cash(1000.0), 250.0);
}

TEST(ParseDealInputsTest, RejectsNonPositiveTerm) {
    RawDealInputs raw;
    raw.term = 0;
    auto inputs = parse_deal_inputs(raw);
    ASSERT_FALSE(inputs.has_value());
    EXPECT_EQ(inputs.error().code, ValidationErrorCode::InvalidTerm);
}

TEST(ParseDealInputsTest, RejectsUnknownFrequency) {
    RawDealInputs raw;
    raw.frequency = "quarterly";
    auto inputs = parse_deal_inputs(raw);
    ASSERT_FALSE(inputs.has_value());
    EXPECT_EQ(inputs.error().code, ValidationErrorCode::InvalidFrequency);
}

TEST(ValidateDealInputsTest, AcceptsDefaults) {
    EXPECT_TRUE(validate_deal_inputs(DealInputs{}).has_value());
}

TEST(ValidateDealInputsTest, ReportsNonFiniteFieldIndex) {
    DealInputs inputs;
    inputs.down_payment = std::numeric_limits<double>::infinity();
    auto ok = validate_deal_inputs(inputs);
    ASSERT_FALSE(ok.has_value());
    EXPECT_EQ(ok.error().code, ValidationErrorCode::InvalidAmount);
    EXPECT_EQ(ok.error().index, 6u);
}

TEST(ValidateDealInputsTest, AccessoriesNumberedAfterScalars) {
    DealInputs inputs;
    inputs.accessories = {{"Hitch", 450.0}, {"Bad", std::numeric_limits<double>::quiet_NaN()}};
    auto ok = validate_deal_inputs(inputs);
    ASSERT_FALSE(ok.has_value());
    EXPECT_EQ(ok.error().code, ValidationErrorCode::InvalidAmount);
    EXPECT_EQ(ok.error().index, 12u);
}

TEST(ValidateDealInputsTest, RejectsNonPositiveTerm) {
    DealInputs inputs;
    inputs.term = -12;
    auto ok = validate_deal_inputs(inputs);
    ASSERT_FALSE(ok.has_value());
    EXPECT_EQ(ok.error().code, ValidationErrorCode::InvalidTerm);
}

}  // namespace
}  // namespace dealcalc
