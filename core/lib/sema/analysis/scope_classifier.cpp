// wbcalc/sema/analysis/scope_classifier.cpp - Scoped aggregation patterns + explanations

#include "wbcalc/sema/analysis/scope_classifier.hpp"

#include <algorithm>
#include <array>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "wbcalc/basic/string_utils.hpp"
#include "wbcalc/syntax/keywords.hpp"

namespace wbcalc
{

namespace
{

constexpr size_t k_expression_preview = 50;

template <size_t N>
bool any_dimension_matches(
  const syntax::ScopedAggregation & agg, const std::array<std::string_view, N> & vocabulary)
{
  return std::any_of(agg.dimensions.begin(), agg.dimensions.end(), [&](const std::string & dim) {
    return std::any_of(vocabulary.begin(), vocabulary.end(), [&](std::string_view word) {
      return icontains(dim, word);
    });
  });
}

bool aggregation_is(const syntax::ScopedAggregation & agg, std::string_view fn)
{
  return agg.aggregation && *agg.aggregation == fn;
}

std::string dimension_list(const syntax::ScopedAggregation & agg)
{
  if (agg.dimensions.empty()) {
    return "no dimensions";
  }
  return fmt::format("{}", fmt::join(agg.dimensions, ", "));
}

std::string aggregated_summary(const syntax::ScopedAggregation & agg)
{
  if (agg.aggregation) {
    return *agg.aggregation + "(...)";
  }
  return truncate_utf8(agg.expression, k_expression_preview);
}

}  // namespace

bool has_entity_dimension(const syntax::ScopedAggregation & agg)
{
  return any_dimension_matches(agg, syntax::k_entity_vocabulary);
}

bool has_temporal_dimension(const syntax::ScopedAggregation & agg)
{
  return any_dimension_matches(agg, syntax::k_temporal_vocabulary);
}

ScopePattern classify_scope(const syntax::ScopedAggregation & agg)
{
  if (agg.kind != syntax::ScopeKind::Fixed) {
    return ScopePattern::Other;
  }
  if (agg.dimensions.empty()) {
    return ScopePattern::ScopeWideTotal;
  }
  if (has_entity_dimension(agg) && (aggregation_is(agg, "MIN") || aggregation_is(agg, "MAX"))) {
    return ScopePattern::EntityCohort;
  }
  if (aggregation_is(agg, "SUM") && has_temporal_dimension(agg)) {
    return ScopePattern::CumulativeTotal;
  }
  return ScopePattern::Other;
}

ScopeExplanation explain_scope(const syntax::ScopedAggregation & agg)
{
  const std::string dims = dimension_list(agg);

  switch (agg.kind) {
    case syntax::ScopeKind::Fixed:
      if (agg.dimensions.empty()) {
        return {
          fmt::format("Table-wide aggregate: {}", aggregated_summary(agg)),
          "Computed once over the whole table, independent of every dimension in the view. "
          "Each row sees the same value, which makes it a denominator for shares of the "
          "grand total.",
          "Percent of total, grand totals, table-wide benchmarks",
        };
      }
      if (has_entity_dimension(agg)) {
        return {
          fmt::format("Per-entity {} by {}", agg.aggregation.value_or("calculation"), dims),
          fmt::format(
            "Computed once per {} regardless of the other dimensions in the view, so the "
            "value follows the entity and does not change while drilling down.",
            dims),
          "First or last event per entity, lifetime value, cohort analysis",
        };
      }
      return {
        fmt::format("Fixed at the {} level", dims),
        fmt::format(
          "Computed for each combination of {} and held constant there; dimensions of the "
          "view that are not listed have no effect.",
          dims),
        "Values that must stay at one specific granularity",
      };

    case syntax::ScopeKind::Include:
      return {
        fmt::format("Adds {} to the view's detail", dims),
        fmt::format(
          "Computed with {} added to the dimensions already in the view, at a finer "
          "granularity than the view shows, and then aggregated back up.",
          dims),
        "Aggregating detailed intermediate values, e.g. the average of daily totals",
      };

    case syntax::ScopeKind::Exclude:
      return {
        fmt::format("Removes {} from the view's detail", dims),
        fmt::format(
          "Computed with {} dropped from the view's dimensions, at a coarser granularity "
          "than the view shows.",
          dims),
        "Subtotals, group averages, neutralizing one dimension",
      };
  }
  return {};
}

const ScopeGuide & scope_guide()
{
  static const ScopeGuide guide{
    "Scoped aggregations compute a value at a granularity other than the one the view "
    "shows. They can pin, add or remove dimensions relative to the view's level of detail.",
    "FIXED computes at the listed dimensions whatever the view contains, so the value stays "
    "constant across drill-downs. With no dimensions it computes over the whole table.",
    "INCLUDE adds the listed dimensions to the view's, computing at a finer granularity "
    "before the result is aggregated back to the view.",
    "EXCLUDE drops the listed dimensions from the view's, computing at a coarser "
    "granularity, as for subtotals.",
    {
      "FIXED is evaluated before dimension filters; only context filters apply to it",
      "INCLUDE and EXCLUDE are evaluated after dimension filters",
      "{ : SUM([Sales]) } gives a table-wide denominator for percent-of-total",
      "Nested scoped aggregations work but are expensive to evaluate",
      "{FIXED [Customer] : MIN([Order Date])} finds each customer's first order",
    },
  };
  return guide;
}

}  // namespace wbcalc
