// SPDX-License-Identifier: MIT
#include "src/finance/rate_table.hpp"
#include "src/support/dealcalc_trace.h"
#include <algorithm>
#include <cmath>

namespace dealcalc {

std::optional<size_t> financing_term_index(int term) {
    auto it = std::find(kFinancingTerms.begin(), kFinancingTerms.end(), term);
    if (it == kFinancingTerms.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(kFinancingTerms.begin(), it));
}

std::expected<void, ValidationError> validate_financing_term(int term) {
    if (term <= 0) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidTerm, term));
    }
    if (!financing_term_index(term)) {
        return std::unexpected(ValidationError(ValidationErrorCode::UnsupportedTerm, term));
    }
    return {};
}

std::expected<RateTable, ValidationError> RateTable::create(
    std::span<const std::pair<int, double>> entries)
{
    RateTable table;
    size_t position = 0;
    for (const auto& [term, rate] : entries) {
        auto index = financing_term_index(term);
        if (!index) {
            return std::unexpected(ValidationError(
                ValidationErrorCode::UnsupportedTerm, term, position));
        }
        if (!std::isfinite(rate) || rate < 0.0) {
            return std::unexpected(ValidationError(
                ValidationErrorCode::InvalidRate, rate, position));
        }
        table.rates_[*index] = rate;
        ++position;
    }
    return table;
}

std::optional<double> RateTable::find(int term) const {
    auto index = financing_term_index(term);
    if (!index) {
        return std::nullopt;
    }
    return rates_[*index];
}

bool RateTable::empty() const {
    return std::none_of(rates_.begin(), rates_.end(),
                        [](const std::optional<double>& r) { return r.has_value(); });
}

double rate_for_term(const RateTable& table, int term, double fallback_rate_pct) {
    if (auto rate = table.find(term)) {
        return *rate;
    }
    DEALCALC_TRACE_RATE_FALLBACK(term, fallback_rate_pct);
    return fallback_rate_pct;
}

}  // namespace dealcalc
