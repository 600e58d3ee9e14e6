// SPDX-License-Identifier: MIT
/**
 * @file text_parse.hpp
 * @brief Text helpers used at the input boundary
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace dealcalc {

/// Parse a user-entered amount, defaulting to zero
///
/// Leading whitespace and one optional sign are accepted, then the longest
/// numeric prefix is parsed: "1500abc" -> 1500, "abc" -> 0, "" -> 0.
/// Non-finite or out-of-range values also yield 0. This is the
/// default-to-zero policy for deal fields; it never fails.
double parse_or_zero(std::string_view text);

/// ASCII case fold
std::string ascii_lower(std::string_view text);

/// Strip ASCII whitespace from both ends
std::string_view trim_ascii(std::string_view text);

/// Split on commas, trim each token and drop empty tokens
std::vector<std::string_view> split_tokens(std::string_view text, char separator = ',');

/// Case-insensitive substring test; an empty needle is always contained
bool contains_ignore_case(std::string_view haystack, std::string_view needle);

/// Case-insensitive equality
bool equals_ignore_case(std::string_view a, std::string_view b);

}  // namespace dealcalc
