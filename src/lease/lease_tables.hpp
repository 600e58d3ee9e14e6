// SPDX-License-Identifier: MIT
/**
 * @file lease_tables.hpp
 * @brief Residual, mileage-adjustment and lease-rate reference tables
 *
 * These records arrive already parsed from the lender's published tables.
 * They are keyed loosely by brand/model/trim text and are resolved to a
 * financing program by the vehicle matcher.
 */

#pragma once

#include "src/support/error_types.hpp"
#include <array>
#include <expected>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace dealcalc {

/// Lease terms published in the residual tables (months)
inline constexpr std::array<int, 9> kLeaseTerms{24, 27, 36, 39, 42, 48, 51, 54, 60};

/// Annual mileage allowance
enum class MileageTier {
    Km12000 = 12000,
    Km18000 = 18000,
    Km24000 = 24000   ///< Baseline; residuals are published for this tier
};

inline constexpr std::array<MileageTier, 3> kMileageTiers{
    MileageTier::Km12000, MileageTier::Km18000, MileageTier::Km24000};

inline constexpr int km_per_year(MileageTier tier) { return static_cast<int>(tier); }

/// Map a km/year figure to its tier; anything else is a caller error
std::expected<MileageTier, ValidationError> mileage_tier_from_km(int km);

/// Residual percentages of MSRP for one vehicle
struct ResidualEntry {
    std::string brand;
    std::string model_name;
    std::string trim;
    std::string body_style;
    std::map<int, double> residual_percentages;  ///< term -> % of MSRP

    /// Base residual for a term; 0 means the term is not offered
    [[nodiscard]] double residual_pct(int term) const;

    /// "brand model trim", skipping empty parts
    [[nodiscard]] std::string label() const;
};

/// Percentage-point residual adjustments relative to the 24000 km baseline
struct KmAdjustmentTable {
    std::map<MileageTier, std::map<int, double>> adjustments;  ///< tier -> term -> points

    /// Adjustment for a tier and term; always 0 for the baseline tier
    /// and for missing entries
    [[nodiscard]] double points(MileageTier tier, int term) const;
};

/// Lease rates for one vehicle line
///
/// The model text usually carries the trim family as well
/// ("Ram 1500 Sport, Rebel").
struct LeaseRateEntry {
    std::string brand;
    std::string model;
    std::map<int, double> standard_rates;     ///< term -> rate %, paired with lease_cash
    std::map<int, double> alternative_rates;  ///< term -> rate %, no lease cash
    double lease_cash = 0.0;

    [[nodiscard]] std::optional<double> standard_rate(int term) const;
    [[nodiscard]] std::optional<double> alternative_rate(int term) const;
};

/// Lease-rate entries grouped by model year
struct LeaseRateCatalog {
    std::map<int, std::vector<LeaseRateEntry>> by_year;

    /// Entries for a model year; the most recent year's list when the
    /// year is not published, empty when the catalog is empty
    [[nodiscard]] std::span<const LeaseRateEntry> entries_for_year(int year) const;
};

}  // namespace dealcalc
