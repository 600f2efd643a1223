// wbcalc/render/tree_renderer.hpp - Indented text view of dependency chains
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "wbcalc/sema/resolution/field_table.hpp"

namespace wbcalc
{

struct TreeRenderOptions
{
  /// Maximum number of leaf calculations drawn as tree roots (0 = all).
  size_t max_leaf_trees = 10;

  /// Source fields named on a node's trailing "[source: ...]" line.
  size_t source_preview = 3;

  /// Print a subtree only the first time it appears in the whole render;
  /// later occurrences become "(see above)".
  bool collapse_shared_subtrees = false;
};

/**
 * Renders one tree per leaf calculation (not used by any other, not
 * circular), deepest first, descending through depends_on_calcs.
 *
 * A calculation that already appears on the current branch is printed as
 * "(circular reference)" and not expanded again. Source-field dependencies
 * are listed on one trailing line per node.
 *
 * The table must already carry depths (CycleDetector::run).
 */
class TreeRenderer
{
public:
  TreeRenderer(const FieldTable & table, TreeRenderOptions options)
  : table_(table), options_(options)
  {
  }

  [[nodiscard]] std::string render() const;

  /// Leaf calculations in render order, before the max_leaf_trees cap.
  [[nodiscard]] std::vector<CalcId> leaf_order() const;

private:
  const FieldTable & table_;
  TreeRenderOptions options_;
};

/// "[source: a, b, c (+2 more)]", "[source: +5 more]" with a zero preview, or an
/// empty string when there are none.
[[nodiscard]] std::string format_source_list(
  const std::vector<std::string> & sources, size_t preview);

}  // namespace wbcalc
