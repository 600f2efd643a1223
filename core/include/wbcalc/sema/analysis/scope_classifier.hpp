// wbcalc/sema/analysis/scope_classifier.hpp - Usage patterns of scoped aggregations
//
// Surface-level heuristics over kind, dimension names and aggregation
// function. No expression semantics are involved; misclassification is
// expected for unusual formulas and falls into ScopePattern::Other.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "wbcalc/syntax/scope_parser.hpp"

namespace wbcalc
{

enum class ScopePattern : uint8_t {
  ScopeWideTotal,   ///< FIXED without dimensions (percent-of-total style)
  EntityCohort,     ///< FIXED on an entity dimension with MIN/MAX
  CumulativeTotal,  ///< FIXED on a temporal dimension with SUM
  Other,
};

inline constexpr size_t k_scope_pattern_count = 4;

[[nodiscard]] constexpr std::string_view to_string(ScopePattern p) noexcept
{
  switch (p) {
    case ScopePattern::ScopeWideTotal:
      return "scopeWideTotal";
    case ScopePattern::EntityCohort:
      return "entityCohort";
    case ScopePattern::CumulativeTotal:
      return "cumulativeTotal";
    case ScopePattern::Other:
      return "other";
  }
  return "other";
}

/// Human-readable description of one scoped aggregation.
struct ScopeExplanation
{
  std::string brief;
  std::string detailed;
  std::string use_case;
};

/// Static reference text attached to scope reports.
struct ScopeGuide
{
  std::string introduction;
  std::string fixed;
  std::string include;
  std::string exclude;
  std::vector<std::string> tips;
};

/**
 * Classify a parsed block. Checked in order: scope-wide total, entity
 * cohort, cumulative total; the first match wins.
 */
[[nodiscard]] ScopePattern classify_scope(const syntax::ScopedAggregation & agg);

[[nodiscard]] ScopeExplanation explain_scope(const syntax::ScopedAggregation & agg);

[[nodiscard]] const ScopeGuide & scope_guide();

/// True if any dimension name contains an entity word (customer, user, ...).
[[nodiscard]] bool has_entity_dimension(const syntax::ScopedAggregation & agg);

/// True if any dimension name contains a temporal word (date, month, ...).
[[nodiscard]] bool has_temporal_dimension(const syntax::ScopedAggregation & agg);

}  // namespace wbcalc
