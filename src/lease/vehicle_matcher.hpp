// SPDX-License-Identifier: MIT
/**
 * @file vehicle_matcher.hpp
 * @brief Resolve a financing program to residual and lease-rate records
 *
 * The residual and lease-rate tables are keyed by free text that does not
 * line up with program names ("Grand Cherokee" vs "Grand Cherokee L",
 * "Sport" vs "Ram 1500 Sport, Rebel"). Matching is case-insensitive:
 * - brand: exact
 * - model: either string contains the other
 * - trim:  either contains the other, or either side is empty
 *
 * Residual matching (first hit in table order wins):
 *   1. if the query has a body style: brand/model/trim + exact body style
 *   2. brand/model/trim
 *
 * Lease-rate matching (first hit in table order wins):
 *   1. brand/model, and when the query has a trim the entry's model text
 *      contains the whole trim or one of its comma-separated tokens
 *   2. brand/model only
 *
 * No match is not an error: leasing is simply not offered for that vehicle.
 */

#pragma once

#include "src/finance/vehicle_program.hpp"
#include "src/lease/lease_tables.hpp"
#include <cstddef>
#include <optional>
#include <span>
#include <string>

namespace dealcalc {

/// What the salesperson selected
struct VehicleQuery {
    std::string brand;
    std::string model;
    std::string trim;        ///< Empty when the program states no trim family
    std::string body_style;  ///< From inventory; empty when unknown

    static VehicleQuery from_program(const VehicleProgram& program,
                                     std::string body_style = {});
};

/// Brand, model and trim rules against a residual record (body style ignored)
bool residual_matches(const VehicleQuery& query, const ResidualEntry& entry);

/// Index of the residual record for the query
std::optional<size_t> match_residual(const VehicleQuery& query,
                                     std::span<const ResidualEntry> entries);

/// Index of the lease-rate record for the query
std::optional<size_t> match_lease_rate(const VehicleQuery& query,
                                       std::span<const LeaseRateEntry> entries);

}  // namespace dealcalc
