// SPDX-License-Identifier: MIT
#include "src/lease/vehicle_matcher.hpp"
#include "src/support/dealcalc_trace.h"
#include "src/support/text_parse.hpp"
#include <algorithm>
#include <utility>

namespace dealcalc {

namespace {

bool mutually_contained(std::string_view a, std::string_view b) {
    return contains_ignore_case(a, b) || contains_ignore_case(b, a);
}

bool brand_and_model_match(const VehicleQuery& query,
                           std::string_view brand,
                           std::string_view model)
{
    return equals_ignore_case(brand, query.brand) && mutually_contained(model, query.model);
}

bool lease_trim_matches(const VehicleQuery& query, const LeaseRateEntry& entry) {
    if (query.trim.empty()) {
        return true;
    }
    if (contains_ignore_case(entry.model, query.trim)) {
        return true;
    }
    auto tokens = split_tokens(query.trim);
    return std::any_of(tokens.begin(), tokens.end(),
                       [&](std::string_view t) { return contains_ignore_case(entry.model, t); });
}

template <typename Entry, typename Pred>
std::optional<size_t> first_match(std::span<const Entry> entries, int pass, Pred pred) {
    for (size_t i = 0; i < entries.size(); ++i) {
        if (pred(entries[i])) {
            DEALCALC_TRACE_MATCH_RESULT(pass, 1, i);
            return i;
        }
    }
    DEALCALC_TRACE_MATCH_RESULT(pass, 0, 0);
    return std::nullopt;
}

}  // namespace

VehicleQuery VehicleQuery::from_program(const VehicleProgram& program, std::string body_style) {
    VehicleQuery query;
    query.brand = program.brand;
    query.model = program.model;
    query.trim = program.trim.value_or("");
    query.body_style = std::move(body_style);
    return query;
}

bool residual_matches(const VehicleQuery& query, const ResidualEntry& entry) {
    return brand_and_model_match(query, entry.brand, entry.model_name) &&
           (query.trim.empty() || mutually_contained(entry.trim, query.trim));
}

std::optional<size_t> match_residual(const VehicleQuery& query,
                                     std::span<const ResidualEntry> entries)
{
    if (!query.body_style.empty()) {
        auto hit = first_match(entries, MATCH_PASS_BODY_STYLE, [&](const ResidualEntry& e) {
            return residual_matches(query, e) && equals_ignore_case(e.body_style, query.body_style);
        });
        if (hit) {
            return hit;
        }
    }
    return first_match(entries, MATCH_PASS_TRIM, [&](const ResidualEntry& e) {
        return residual_matches(query, e);
    });
}

std::optional<size_t> match_lease_rate(const VehicleQuery& query,
                                       std::span<const LeaseRateEntry> entries)
{
    auto hit = first_match(entries, MATCH_PASS_TRIM, [&](const LeaseRateEntry& e) {
        return brand_and_model_match(query, e.brand, e.model) && lease_trim_matches(query, e);
    });
    if (hit) {
        return hit;
    }
    return first_match(entries, MATCH_PASS_MODEL_ONLY, [&](const LeaseRateEntry& e) {
        return brand_and_model_match(query, e.brand, e.model);
    });
}

}  // namespace dealcalc
