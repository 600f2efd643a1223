#pragma once

#include <array>
#include <string_view>

namespace wbcalc::syntax
{

// NOTE: Formula-language surface vocabulary. Matching against all of these
// tables is ASCII case-insensitive.

/// Keywords that open a scoped-aggregation block: {FIXED ...}, {INCLUDE ...}, {EXCLUDE ...}
inline constexpr std::array<std::string_view, 3> k_scope_keywords = {
  "FIXED",
  "INCLUDE",
  "EXCLUDE",
};

/// Aggregation functions recognized at the start of an aggregated expression.
inline constexpr std::array<std::string_view, 12> k_aggregation_functions = {
  "SUM", "AVG", "COUNT", "COUNTD", "MIN", "MAX", "MEDIAN", "ATTR", "STDEV", "STDEVP", "VAR", "VARP",
};

/// Dimension-name fragments that identify an entity (customer-like) dimension.
inline constexpr std::array<std::string_view, 5> k_entity_vocabulary = {
  "customer", "user", "client", "account", "member",
};

/// Dimension-name fragments that identify a temporal dimension.
inline constexpr std::array<std::string_view, 6> k_temporal_vocabulary = {
  "date", "month", "year", "quarter", "week", "day",
};

/// Qualifier token that prefixes parameter references ([Parameters].[Rate]).
inline constexpr std::string_view k_parameters_qualifier = "Parameters";

}  // namespace wbcalc::syntax
