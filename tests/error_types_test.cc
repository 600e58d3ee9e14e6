// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include <sstream>
#include "src/support/error_types.hpp"

namespace dealcalc {
namespace {

TEST(ErrorTypesTest, CodeNames) {
    EXPECT_EQ(to_string(ValidationErrorCode::InvalidTerm), "InvalidTerm");
    EXPECT_EQ(to_string(ValidationErrorCode::UnsupportedTerm), "UnsupportedTerm");
    EXPECT_EQ(to_string(ValidationErrorCode::InvalidMileage), "InvalidMileage");
    EXPECT_EQ(to_string(ValidationErrorCode::InvalidFrequency), "InvalidFrequency");
    EXPECT_EQ(to_string(ValidationErrorCode::InvalidAmount), "InvalidAmount");
    EXPECT_EQ(to_string(ValidationErrorCode::InvalidRate), "InvalidRate");
    EXPECT_EQ(to_string(ValidationErrorCode::InvalidTaxRate), "InvalidTaxRate");
}

TEST(ErrorTypesTest, DefaultsValueAndIndexToZero) {
    ValidationError err(ValidationErrorCode::InvalidFrequency);
    EXPECT_EQ(err.code, ValidationErrorCode::InvalidFrequency);
    EXPECT_DOUBLE_EQ(err.value, 0.0);
    EXPECT_EQ(err.index, 0u);
}

TEST(ErrorTypesTest, StreamFormat) {
    std::ostringstream os;
    os << ValidationError(ValidationErrorCode::InvalidMileage, 15000, 2);
    EXPECT_EQ(os.str(), "ValidationError{code=InvalidMileage, value=15000, index=2}");
}

}  // namespace
}  // namespace dealcalc
