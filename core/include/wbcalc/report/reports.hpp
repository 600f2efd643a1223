// wbcalc/report/reports.hpp - Result records produced by the analyzer
//
// Plain data: captions instead of ids, already truncated and ordered for
// presentation. Serialized by json_report and text_report.
//
#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "wbcalc/sema/analysis/scope_classifier.hpp"
#include "wbcalc/syntax/scope_parser.hpp"

namespace wbcalc
{

// ============================================================================
// Dependency Report
// ============================================================================

struct DependencySummary
{
  size_t total_calculations = 0;
  int max_dependency_depth = 0;  ///< circular calculations excluded
  size_t root_calculations = 0;
  size_t leaf_calculations = 0;
  size_t intermediate_calculations = 0;
  size_t circular_dependencies = 0;  ///< number of reported cycles
  size_t parameter_count = 0;
  size_t source_field_count = 0;
};

struct CalculationOutput
{
  std::string name;
  std::string caption;
  std::string formula;
  std::string datasource;
  int depth = 0;
  bool hidden = false;

  std::vector<std::string> depends_on_calcs;
  std::vector<std::string> depends_on_source;
  std::vector<std::string> depends_on_params;
  std::vector<std::string> used_by;

  bool is_root = false;
  bool is_leaf = false;
  bool is_circular = false;
};

struct DepthLevelEntry
{
  std::string caption;
  std::string formula_preview;
  std::vector<std::string> used_by;
};

/// One group of depthLevels: key is "level<N>" or "circular".
struct DepthLevel
{
  std::string key;
  std::vector<DepthLevelEntry> entries;
};

struct CycleOutput
{
  std::vector<std::string> cycle;  ///< first caption repeated at the end
  std::string explanation;
};

struct DependencyReport
{
  /// Set when there was nothing to analyze.
  std::optional<std::string> message;

  DependencySummary summary;
  std::vector<CalculationOutput> calculations;  ///< by depth, possibly truncated
  std::vector<DepthLevel> depth_levels;         ///< ascending level, "circular" last
  std::vector<CycleOutput> cycles;
  std::string dependency_tree;
};

// ============================================================================
// Scope Report
// ============================================================================

struct ScopeSummary
{
  size_t total_expressions = 0;
  size_t fixed_count = 0;
  size_t include_count = 0;
  size_t exclude_count = 0;
  size_t nested_count = 0;
  size_t table_wide_fixed_count = 0;  ///< FIXED with no dimensions
  size_t hidden_count = 0;
  size_t total_calculations = 0;
};

struct ScopeExpressionOutput
{
  std::string name;
  std::string caption;
  std::string full_formula;
  std::string datasource;
  bool hidden = false;

  syntax::ScopedAggregation details;
  ScopePattern pattern = ScopePattern::Other;
  ScopeExplanation explanation;

  /// Calculations using the owning calculation; absent when usage context is off.
  std::optional<std::vector<std::string>> used_in_calculations;
};

struct ScopeReport
{
  std::optional<std::string> message;

  ScopeSummary summary;
  std::vector<ScopeExpressionOutput> expressions;

  /// Owning captions per ScopePattern, indexed by the enum value.
  std::array<std::vector<std::string>, k_scope_pattern_count> patterns;

  [[nodiscard]] const std::vector<std::string> & pattern(ScopePattern p) const
  {
    return patterns.at(static_cast<size_t>(p));
  }
};

}  // namespace wbcalc
