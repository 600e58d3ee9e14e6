// SPDX-License-Identifier: MIT
/**
 * @file rate_table.hpp
 * @brief Sparse per-program financing rate table
 */

#pragma once

#include "src/support/error_types.hpp"
#include <array>
#include <cstddef>
#include <expected>
#include <initializer_list>
#include <optional>
#include <span>
#include <utility>

namespace dealcalc {

/// Financing terms offered by manufacturer programs (months)
inline constexpr std::array<int, 6> kFinancingTerms{36, 48, 60, 72, 84, 96};

/// Rate used when a table has no entry for the requested term (percent)
///
/// Keeps the calculator usable with incomplete program data. It does not
/// reflect any real offer.
inline constexpr double kFallbackRatePct = 4.99;

/// Position of a term in kFinancingTerms, if supported
std::optional<size_t> financing_term_index(int term);

/// Check that a financing term is positive and one of kFinancingTerms
std::expected<void, ValidationError> validate_financing_term(int term);

/// Nominal annual rates (percent) keyed by financing term
///
/// Entries may be absent. Tables are built once with create() and are
/// read-only afterwards.
class RateTable {
public:
    RateTable() = default;

    /// Build a table from (term, rate%) pairs
    ///
    /// Fails on a term outside kFinancingTerms or a negative/non-finite rate.
    static std::expected<RateTable, ValidationError> create(
        std::span<const std::pair<int, double>> entries);

    static std::expected<RateTable, ValidationError> create(
        std::initializer_list<std::pair<int, double>> entries)
    {
        return create(std::span<const std::pair<int, double>>(entries.begin(), entries.size()));
    }

    /// Rate for a term, if the table has one
    [[nodiscard]] std::optional<double> find(int term) const;

    /// True when no term has a rate
    [[nodiscard]] bool empty() const;

private:
    std::array<std::optional<double>, kFinancingTerms.size()> rates_{};
};

/// Rate for a term, or the fallback when the table has no entry
///
/// @param table Program rate table
/// @param term Financing term (months)
/// @param fallback_rate_pct Rate returned for a missing entry
double rate_for_term(const RateTable& table, int term,
                     double fallback_rate_pct = kFallbackRatePct);

}  // namespace dealcalc
