// wbcalc/driver/analysis_options.hpp - Tunables shared by config, CLI and analyzer
#pragma once

#include <cstddef>

#include "wbcalc/render/tree_renderer.hpp"

namespace wbcalc
{

struct AnalysisOptions
{
  /// List every source-field dependency instead of the first source_field_preview.
  bool include_source_fields = false;
  size_t source_field_preview = 5;

  /// Formula characters kept in depthLevels entries before "...".
  size_t formula_preview_length = 100;

  /// usedBy entries kept in depthLevels entries.
  size_t used_by_preview = 5;

  /// Calculations listed in the dependency report (0 = unlimited).
  size_t max_listed_calculations = 50;

  TreeRenderOptions tree;

  /// Attach usedBy context to every scoped aggregation.
  bool include_usage_context = true;
};

}  // namespace wbcalc
