// wbcalc/driver/analyzer.cpp - Analysis driver implementation

#include "wbcalc/driver/analyzer.hpp"

#include <algorithm>
#include <map>

#include "wbcalc/basic/string_utils.hpp"
#include "wbcalc/render/tree_renderer.hpp"
#include "wbcalc/sema/analysis/scope_classifier.hpp"
#include "wbcalc/sema/resolution/dependency_resolver.hpp"
#include "wbcalc/sema/resolution/field_extractor.hpp"
#include "wbcalc/syntax/scope_parser.hpp"

namespace wbcalc
{

namespace
{

constexpr const char * k_no_calculations_message = "No calculated fields found in this workbook";
constexpr const char * k_no_scopes_message = "No scoped aggregations found in this workbook";

std::vector<std::string> first_n(std::vector<std::string> items, size_t n)
{
  if (items.size() > n) {
    items.resize(n);
  }
  return items;
}

CalculationOutput make_output(
  const FieldTable & table, const CalculationField & calc, const AnalysisOptions & options)
{
  CalculationOutput out;
  out.name = calc.name;
  out.caption = calc.caption;
  out.formula = calc.formula;
  out.datasource = calc.datasource;
  out.depth = calc.depth;
  out.hidden = calc.hidden;
  out.depends_on_calcs = table.captions_of(calc.depends_on_calcs);
  out.depends_on_source = options.include_source_fields
                            ? calc.depends_on_source
                            : first_n(calc.depends_on_source, options.source_field_preview);
  out.depends_on_params = calc.depends_on_params;
  out.used_by = table.captions_of(calc.used_by);
  out.is_root = calc.is_root();
  out.is_leaf = calc.is_leaf();
  out.is_circular = calc.is_circular;
  return out;
}

DependencySummary summarize(const DependencyGraph & graph)
{
  const auto & table = graph.fields;

  DependencySummary summary;
  summary.total_calculations = table.calculation_count();
  summary.circular_dependencies = graph.cycles.size();
  summary.parameter_count = table.parameters().size();
  summary.source_field_count = table.source_field_names().size();

  for (const auto & calc : table.calculations()) {
    if (calc.is_circular) {
      continue;
    }
    summary.max_dependency_depth = std::max(summary.max_dependency_depth, calc.depth);
    if (calc.is_root()) ++summary.root_calculations;
    if (calc.is_leaf()) ++summary.leaf_calculations;
    if (!calc.is_root() && !calc.is_leaf()) ++summary.intermediate_calculations;
  }
  return summary;
}

std::vector<DepthLevel> group_by_depth(const FieldTable & table, const AnalysisOptions & options)
{
  std::map<int, std::vector<DepthLevelEntry>> levels;
  std::vector<DepthLevelEntry> circular;

  for (const auto & calc : table.calculations()) {
    DepthLevelEntry entry;
    entry.caption = calc.caption;
    entry.formula_preview = truncate_utf8(calc.formula, options.formula_preview_length);
    entry.used_by = first_n(table.captions_of(calc.used_by), options.used_by_preview);

    if (calc.is_circular) {
      circular.push_back(std::move(entry));
    } else {
      levels[calc.depth].push_back(std::move(entry));
    }
  }

  std::vector<DepthLevel> out;
  for (auto & [depth, entries] : levels) {
    out.push_back(DepthLevel{"level" + std::to_string(depth), std::move(entries)});
  }
  if (!circular.empty()) {
    out.push_back(DepthLevel{"circular", std::move(circular)});
  }
  return out;
}

void count_kind(ScopeSummary & summary, const syntax::ScopedAggregation & agg)
{
  switch (agg.kind) {
    case syntax::ScopeKind::Fixed:
      ++summary.fixed_count;
      if (agg.dimensions.empty()) ++summary.table_wide_fixed_count;
      break;
    case syntax::ScopeKind::Include:
      ++summary.include_count;
      break;
    case syntax::ScopeKind::Exclude:
      ++summary.exclude_count;
      break;
  }
}

}  // namespace

// ============================================================================
// Graph
// ============================================================================

DependencyGraph Analyzer::build_graph(const Workbook & workbook, DiagnosticBag & diags)
{
  DependencyGraph graph;

  FieldExtractor extractor(&diags);
  graph.fields = extractor.extract(workbook);

  DependencyResolver resolver(graph.fields);
  resolver.resolve();
  build_reverse_edges(graph.fields);

  CycleDetector detector(&diags);
  graph.cycles = detector.run(graph.fields);

  return graph;
}

// ============================================================================
// Dependencies
// ============================================================================

DependencyReport Analyzer::build_dependency_report(
  const DependencyGraph & graph, const AnalysisOptions & options)
{
  const auto & table = graph.fields;

  DependencyReport report;
  report.summary = summarize(graph);

  for (const auto & calc : table.calculations()) {
    report.calculations.push_back(make_output(table, calc, options));
  }
  std::stable_sort(
    report.calculations.begin(), report.calculations.end(),
    [](const CalculationOutput & a, const CalculationOutput & b) { return a.depth < b.depth; });
  if (
    options.max_listed_calculations > 0 &&
    report.calculations.size() > options.max_listed_calculations) {
    report.calculations.resize(options.max_listed_calculations);
  }

  report.depth_levels = group_by_depth(table, options);

  for (const auto & cycle : graph.cycles) {
    CycleOutput out;
    out.cycle = table.captions_of(cycle.members);
    out.explanation = "Circular dependency detected: " + format_cycle(table, cycle);
    report.cycles.push_back(std::move(out));
  }

  report.dependency_tree = TreeRenderer(table, options.tree).render();
  return report;
}

DependencyAnalysis Analyzer::analyze_dependencies(
  const Workbook & workbook, const AnalysisOptions & options)
{
  DependencyAnalysis result;
  const DependencyGraph graph = build_graph(workbook, result.diagnostics);

  if (graph.fields.empty()) {
    result.report.message = k_no_calculations_message;
    result.report.summary.parameter_count = graph.fields.parameters().size();
    result.report.summary.source_field_count = graph.fields.source_field_names().size();
    result.diagnostics.report_info(DocumentLocation{}, k_no_calculations_message)
      .with_code(diag_code::k_no_calculations);
    return result;
  }

  result.report = build_dependency_report(graph, options);
  return result;
}

// ============================================================================
// Scoped aggregations
// ============================================================================

ScopeAnalysis Analyzer::analyze_scopes(const Workbook & workbook, const AnalysisOptions & options)
{
  ScopeAnalysis result;
  const DependencyGraph graph = build_graph(workbook, result.diagnostics);
  const auto & table = graph.fields;

  auto & report = result.report;
  report.summary.total_calculations = table.calculation_count();

  for (const auto & calc : table.calculations()) {
    for (auto & agg : syntax::parse_scoped_aggregations(calc.formula)) {
      ScopeExpressionOutput out;
      out.name = calc.name;
      out.caption = calc.caption;
      out.full_formula = calc.formula;
      out.datasource = calc.datasource;
      out.hidden = calc.hidden;
      out.pattern = classify_scope(agg);
      out.explanation = explain_scope(agg);

      if (options.include_usage_context) {
        std::vector<std::string> used_in;
        for (const CalcId user : calc.used_by) {
          if (user != calc.id) {
            used_in.push_back(table.calculation(user).caption);
          }
        }
        out.used_in_calculations = std::move(used_in);
      }

      count_kind(report.summary, agg);
      if (agg.has_nested_scope) ++report.summary.nested_count;
      if (calc.hidden) ++report.summary.hidden_count;

      report.patterns.at(static_cast<size_t>(out.pattern)).push_back(calc.caption);
      out.details = std::move(agg);
      report.expressions.push_back(std::move(out));
    }
  }

  report.summary.total_expressions = report.expressions.size();
  if (report.expressions.empty()) {
    report.message = k_no_scopes_message;
  }
  return result;
}

}  // namespace wbcalc
