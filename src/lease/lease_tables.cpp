// SPDX-License-Identifier: MIT
#include "src/lease/lease_tables.hpp"
#include "src/support/dealcalc_trace.h"
#include <initializer_list>
#include <iterator>

namespace dealcalc {

namespace {

std::optional<double> lookup(const std::map<int, double>& table, int term) {
    auto it = table.find(term);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace

std::expected<MileageTier, ValidationError> mileage_tier_from_km(int km) {
    for (auto tier : kMileageTiers) {
        if (km_per_year(tier) == km) {
            return tier;
        }
    }
    DEALCALC_TRACE_VALIDATION_ERROR(MODULE_LEASE,
        static_cast<int>(ValidationErrorCode::InvalidMileage), km, 0);
    return std::unexpected(ValidationError(ValidationErrorCode::InvalidMileage, km));
}

double ResidualEntry::residual_pct(int term) const {
    return lookup(residual_percentages, term).value_or(0.0);
}

std::string ResidualEntry::label() const {
    std::string out;
    for (const std::string* part : {&brand, &model_name, &trim}) {
        if (part->empty()) {
            continue;
        }
        if (!out.empty()) {
            out += ' ';
        }
        out += *part;
    }
    return out;
}

double KmAdjustmentTable::points(MileageTier tier, int term) const {
    if (tier == MileageTier::Km24000) {
        return 0.0;
    }
    auto row = adjustments.find(tier);
    if (row == adjustments.end()) {
        return 0.0;
    }
    return lookup(row->second, term).value_or(0.0);
}

std::optional<double> LeaseRateEntry::standard_rate(int term) const {
    return lookup(standard_rates, term);
}

std::optional<double> LeaseRateEntry::alternative_rate(int term) const {
    return lookup(alternative_rates, term);
}

std::span<const LeaseRateEntry> LeaseRateCatalog::entries_for_year(int year) const {
    if (by_year.empty()) {
        return {};
    }
    auto it = by_year.find(year);
    if (it == by_year.end()) {
        it = std::prev(by_year.end());
    }
    return it->second;
}

}  // namespace dealcalc
