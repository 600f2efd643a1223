// wbcalc/render/tree_renderer.cpp - Dependency tree rendering

#include "wbcalc/render/tree_renderer.hpp"

#include <algorithm>
#include <cstddef>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace wbcalc
{

namespace
{

constexpr const char * k_branch = "├── ";
constexpr const char * k_last_branch = "└── ";
constexpr const char * k_pipe_indent = "│   ";
constexpr const char * k_blank_indent = "    ";

struct RenderState
{
  const FieldTable & table;
  const TreeRenderOptions & options;
  std::vector<std::string> lines;
  std::vector<bool> on_branch;
  std::vector<bool> expanded;
};

std::string node_label(const CalculationField & calc)
{
  if (calc.is_circular) {
    return fmt::format("{} [circular]", calc.caption);
  }
  return fmt::format("{} [depth: {}]", calc.caption, calc.depth);
}

void render_children(RenderState & st, const CalculationField & calc, const std::string & indent);

void render_node(RenderState & st, CalcId id, const std::string & indent, bool is_last)
{
  const auto & calc = st.table.calculation(id);
  const char * connector = is_last ? k_last_branch : k_branch;

  if (st.on_branch[id]) {
    st.lines.push_back(fmt::format("{}{}{} (circular reference)", indent, connector, calc.caption));
    return;
  }

  const bool has_children = !calc.depends_on_calcs.empty() || !calc.depends_on_source.empty();
  if (st.options.collapse_shared_subtrees && st.expanded[id] && has_children) {
    st.lines.push_back(fmt::format("{}{}{} (see above)", indent, connector, node_label(calc)));
    return;
  }

  st.lines.push_back(fmt::format("{}{}{}", indent, connector, node_label(calc)));

  st.on_branch[id] = true;
  st.expanded[id] = true;
  render_children(st, calc, indent + (is_last ? k_blank_indent : k_pipe_indent));
  st.on_branch[id] = false;
}

void render_children(RenderState & st, const CalculationField & calc, const std::string & indent)
{
  const std::string sources = format_source_list(calc.depends_on_source, st.options.source_preview);
  const auto & deps = calc.depends_on_calcs;

  for (size_t i = 0; i < deps.size(); ++i) {
    const bool last = (i + 1 == deps.size()) && sources.empty();
    render_node(st, deps[i], indent, last);
  }
  if (!sources.empty()) {
    st.lines.push_back(fmt::format("{}{}{}", indent, k_last_branch, sources));
  }
}

}  // namespace

std::string format_source_list(const std::vector<std::string> & sources, size_t preview)
{
  if (sources.empty()) {
    return {};
  }
  const size_t shown = std::min(sources.size(), preview);
  if (shown == 0) {
    return fmt::format("[source: +{} more]", sources.size());
  }
  std::string out = fmt::format(
    "[source: {}", fmt::join(sources.begin(), sources.begin() + static_cast<std::ptrdiff_t>(shown), ", "));
  if (sources.size() > shown) {
    out += fmt::format(" (+{} more)", sources.size() - shown);
  }
  out += "]";
  return out;
}

std::vector<CalcId> TreeRenderer::leaf_order() const
{
  std::vector<CalcId> leaves;
  for (const auto & calc : table_.calculations()) {
    if (calc.is_leaf() && !calc.is_circular) {
      leaves.push_back(calc.id);
    }
  }
  std::stable_sort(leaves.begin(), leaves.end(), [&](CalcId a, CalcId b) {
    return table_.calculation(a).depth > table_.calculation(b).depth;
  });
  return leaves;
}

std::string TreeRenderer::render() const
{
  std::vector<CalcId> leaves = leaf_order();
  if (leaves.empty()) {
    return "No leaf calculations found (possible circular dependencies)";
  }
  if (options_.max_leaf_trees > 0 && leaves.size() > options_.max_leaf_trees) {
    leaves.resize(options_.max_leaf_trees);
  }

  RenderState st{table_, options_, {}, {}, {}};
  st.on_branch.assign(table_.calculation_count(), false);
  st.expanded.assign(table_.calculation_count(), false);

  for (const CalcId leaf_id : leaves) {
    const auto & leaf = table_.calculation(leaf_id);
    if (!st.lines.empty()) {
      st.lines.emplace_back();
    }
    st.lines.push_back(fmt::format("{} (leaf calculation)", node_label(leaf)));

    st.on_branch[leaf_id] = true;
    st.expanded[leaf_id] = true;
    render_children(st, leaf, "");
    st.on_branch[leaf_id] = false;
  }

  return fmt::format("{}", fmt::join(st.lines, "\n"));
}

}  // namespace wbcalc
