// SPDX-License-Identifier: MIT
#include "src/finance/deal_inputs.hpp"
#include "src/support/dealcalc_trace.h"
#include "src/support/text_parse.hpp"
#include <array>
#include <cmath>
#include <numeric>

namespace dealcalc {

namespace {

std::optional<double> parse_override(const std::string& text) {
    double value = parse_or_zero(text);
    if (value == 0.0) {
        return std::nullopt;
    }
    return value;
}

std::unexpected<ValidationError> invalid_amount(double value, size_t index) {
    DEALCALC_TRACE_VALIDATION_ERROR(MODULE_INPUT_PARSE,
        static_cast<int>(ValidationErrorCode::InvalidAmount), value, index);
    return std::unexpected(ValidationError(ValidationErrorCode::InvalidAmount, value, index));
}

}  // namespace

double DealInputs::accessories_total() const {
    return std::accumulate(accessories.begin(), accessories.end(), 0.0,
        [](double sum, const Accessory& a) { return sum + a.price; });
}

std::expected<DealInputs, ValidationError> parse_deal_inputs(const RawDealInputs& raw) {
    if (raw.term <= 0) {
        DEALCALC_TRACE_VALIDATION_ERROR(MODULE_INPUT_PARSE,
            static_cast<int>(ValidationErrorCode::InvalidTerm), raw.term, 0);
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidTerm, raw.term));
    }

    auto frequency = parse_payment_frequency(raw.frequency);
    if (!frequency) {
        return std::unexpected(frequency.error());
    }

    DealInputs inputs;
    inputs.vehicle_price = parse_or_zero(raw.vehicle_price);
    inputs.accessories.reserve(raw.accessories.size());
    for (const auto& line : raw.accessories) {
        inputs.accessories.push_back(Accessory{line.description, parse_or_zero(line.price)});
    }
    inputs.admin_fee = parse_or_zero(raw.admin_fee);
    inputs.tire_tax = parse_or_zero(raw.tire_tax);
    inputs.rdprm_fee = parse_or_zero(raw.rdprm_fee);
    inputs.trade_in_value = parse_or_zero(raw.trade_in_value);
    inputs.trade_in_owed = parse_or_zero(raw.trade_in_owed);
    inputs.down_payment = parse_or_zero(raw.down_payment);
    inputs.bonus_cash_override = parse_override(raw.bonus_cash_override);
    inputs.term = raw.term;
    inputs.frequency = *frequency;
    inputs.pdsf = parse_override(raw.pdsf);
    inputs.dealer_discount = parse_or_zero(raw.dealer_discount);
    inputs.carried_balance = parse_or_zero(raw.carried_balance);
    return inputs;
}

std::expected<void, ValidationError> validate_deal_inputs(const DealInputs& inputs) {
    if (inputs.term <= 0) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidTerm, inputs.term));
    }

    const std::array<double, 11> amounts{
        inputs.vehicle_price,
        inputs.admin_fee,
        inputs.tire_tax,
        inputs.rdprm_fee,
        inputs.trade_in_value,
        inputs.trade_in_owed,
        inputs.down_payment,
        inputs.bonus_cash_override.value_or(0.0),
        inputs.pdsf.value_or(0.0),
        inputs.dealer_discount,
        inputs.carried_balance,
    };
    for (size_t i = 0; i < amounts.size(); ++i) {
        if (!std::isfinite(amounts[i])) {
            return invalid_amount(amounts[i], i);
        }
    }
    for (size_t i = 0; i < inputs.accessories.size(); ++i) {
        double price = inputs.accessories[i].price;
        if (!std::isfinite(price)) {
            return invalid_amount(price, amounts.size() + i);
        }
    }
    return {};
}

}  // namespace dealcalc
