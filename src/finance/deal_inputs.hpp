// SPDX-License-Identifier: MIT
/**
 * @file deal_inputs.hpp
 * @brief Deal-specific adjustments entered by the salesperson
 *
 * Two forms exist. RawDealInputs carries the text typed into the form;
 * parse_deal_inputs() turns it into DealInputs, applying the
 * default-to-zero policy to every amount. The formulas only ever see
 * DealInputs.
 */

#pragma once

#include "src/finance/amortization.hpp"
#include "src/support/error_types.hpp"
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace dealcalc {

/// Accessory line item
struct Accessory {
    std::string description;
    double price = 0.0;
};

/// Parsed deal inputs (dollars)
struct DealInputs {
    double vehicle_price = 0.0;
    std::vector<Accessory> accessories;

    // Taxable delivery fees
    double admin_fee = 0.0;
    double tire_tax = 0.0;
    double rdprm_fee = 0.0;

    double trade_in_value = 0.0;
    double trade_in_owed = 0.0;

    /// Cash down, taxes included
    double down_payment = 0.0;

    /// Replaces the program's bonus cash when set
    std::optional<double> bonus_cash_override;

    int term = 72;
    PaymentFrequency frequency = PaymentFrequency::Monthly;

    // Lease-only adjustments
    std::optional<double> pdsf;    ///< MSRP basis for the residual; vehicle price when unset
    double dealer_discount = 0.0;  ///< Pre-tax dealer discount on the selling price
    double carried_balance = 0.0;  ///< Balance rolled into the lease; negative = debt

    [[nodiscard]] double accessories_total() const;

    /// admin fee + tire tax + RDPRM
    [[nodiscard]] double taxable_fees() const {
        return admin_fee + tire_tax + rdprm_fee;
    }

    /// Override if set, otherwise the program's bonus cash
    [[nodiscard]] double effective_bonus_cash(double program_bonus_cash) const {
        return bonus_cash_override.value_or(program_bonus_cash);
    }

    /// MSRP basis for residual value
    [[nodiscard]] double residual_basis() const {
        return pdsf.value_or(vehicle_price);
    }
};

/// Accessory line as typed
struct RawAccessory {
    std::string description;
    std::string price;
};

/// Deal inputs as typed into the form
struct RawDealInputs {
    std::string vehicle_price;
    std::vector<RawAccessory> accessories;
    std::string admin_fee;
    std::string tire_tax;
    std::string rdprm_fee;
    std::string trade_in_value;
    std::string trade_in_owed;
    std::string down_payment;
    std::string bonus_cash_override;
    int term = 72;
    std::string frequency = "monthly";
    std::string pdsf;
    std::string dealer_discount;
    std::string carried_balance;
};

/// Parse form text into DealInputs
///
/// Amount fields use parse_or_zero(). Override fields (bonus cash, PDSF)
/// that parse to 0 count as "not provided". Fails only on a non-positive
/// term or an unknown frequency.
std::expected<DealInputs, ValidationError> parse_deal_inputs(const RawDealInputs& raw);

/// Check that every amount is finite and the term is positive
///
/// For InvalidAmount errors, index is the field position in declaration
/// order (accessories are numbered after the scalar fields).
std::expected<void, ValidationError> validate_deal_inputs(const DealInputs& inputs);

}  // namespace dealcalc
