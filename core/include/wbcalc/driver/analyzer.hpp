// wbcalc/driver/analyzer.hpp - Analysis driver
//
// Single entry point for the analysis pipeline.
// Used by the CLI and by tests.
//
#pragma once

#include <vector>

#include "wbcalc/basic/diagnostic.hpp"
#include "wbcalc/driver/analysis_options.hpp"
#include "wbcalc/model/workbook.hpp"
#include "wbcalc/report/reports.hpp"
#include "wbcalc/sema/analysis/cycle_detector.hpp"
#include "wbcalc/sema/resolution/field_table.hpp"

namespace wbcalc
{

// ============================================================================
// Results
// ============================================================================

/// Fully resolved calculation graph of one workbook.
struct DependencyGraph
{
  FieldTable fields;
  std::vector<DependencyCycle> cycles;
};

struct DependencyAnalysis
{
  DependencyReport report;
  DiagnosticBag diagnostics;
};

struct ScopeAnalysis
{
  ScopeReport report;
  DiagnosticBag diagnostics;
};

// ============================================================================
// Analyzer
// ============================================================================

/**
 * Analyzer driver that orchestrates the pipeline.
 *
 * The pipeline consists of:
 * 1. Field extraction (calculations, parameters, source fields)
 * 2. Dependency resolution and reverse edges
 * 3. Cycle detection and depth assignment
 * 4. Report building (tree rendering / scoped-aggregation classification)
 *
 * Every call builds fresh state from its inputs; calls are independent and
 * may run concurrently on different workbooks.
 */
class Analyzer
{
public:
  /**
   * Run steps 1-3.
   *
   * @param workbook Input tree
   * @param diags Receives duplicate-caption and cycle warnings
   */
  [[nodiscard]] static DependencyGraph build_graph(const Workbook & workbook, DiagnosticBag & diags);

  /**
   * Build the dependency report, including the rendered tree.
   *
   * An empty calculation set is not an error: the report carries a message
   * and zero counts, and an I103 note is added to the diagnostics.
   */
  [[nodiscard]] static DependencyAnalysis analyze_dependencies(
    const Workbook & workbook, const AnalysisOptions & options);

  /// Build the scoped-aggregation report.
  [[nodiscard]] static ScopeAnalysis analyze_scopes(
    const Workbook & workbook, const AnalysisOptions & options);

private:
  static DependencyReport build_dependency_report(
    const DependencyGraph & graph, const AnalysisOptions & options);
};

}  // namespace wbcalc
