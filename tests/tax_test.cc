// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include <limits>
#include "src/finance/tax.hpp"

namespace dealcalc {
namespace {

TEST(SalesTaxRatesTest, QuebecDefaults) {
    SalesTaxRates rates;
    EXPECT_DOUBLE_EQ(rates.gst, 0.05);
    EXPECT_DOUBLE_EQ(rates.qst, 0.09975);
    EXPECT_NEAR(rates.combined(), 0.14975, 1e-12);
}

TEST(SalesTaxRatesTest, ApplyItemizes) {
    auto tax = SalesTaxRates{}.apply(48000.0);
    EXPECT_NEAR(tax.gst, 2400.0, 1e-9);
    EXPECT_NEAR(tax.qst, 4788.0, 1e-9);
    EXPECT_NEAR(tax.total, 7188.0, 1e-9);
    EXPECT_DOUBLE_EQ(tax.total, tax.gst + tax.qst);
}

TEST(SalesTaxRatesTest, ApplyOnNegativeBase) {
    auto tax = SalesTaxRates{}.apply(-1000.0);
    EXPECT_NEAR(tax.total, -149.75, 1e-9);
}

TEST(SalesTaxRatesTest, GrossUp) {
    EXPECT_NEAR(SalesTaxRates{}.gross_up(1000.0), 1149.75, 1e-9);

    SalesTaxRates ontario{.gst = 0.13, .qst = 0.0};
    EXPECT_NEAR(ontario.gross_up(1000.0), 1130.0, 1e-9);
}

TEST(SalesTaxRatesTest, ValidateRejectsNegativeAndNonFinite) {
    EXPECT_TRUE(validate_tax_rates(SalesTaxRates{}).has_value());
    EXPECT_TRUE(validate_tax_rates(SalesTaxRates{.gst = 0.0, .qst = 0.0}).has_value());

    auto bad_gst = validate_tax_rates(SalesTaxRates{.gst = -0.05, .qst = 0.09975});
    ASSERT_FALSE(bad_gst.has_value());
    EXPECT_EQ(bad_gst.error().code, ValidationErrorCode::InvalidTaxRate);
    EXPECT_EQ(bad_gst.error().index, 0u);

    auto bad_qst = validate_tax_rates(
        SalesTaxRates{.gst = 0.05, .qst = std::numeric_limits<double>::quiet_NaN()});
    ASSERT_FALSE(bad_qst.has_value());
    EXPECT_EQ(bad_qst.error().index, 1u);
}

}  // namespace
}  // namespace dealcalc
