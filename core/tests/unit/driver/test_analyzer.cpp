// tests/unit/driver/test_analyzer.cpp - End-to-end dependency and scope reports

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "wbcalc/driver/analyzer.hpp"
#include "wbcalc/test_support/workbook_builder.hpp"

using namespace wbcalc;
using test_support::WorkbookBuilder;

using Names = std::vector<std::string>;

namespace
{

const CalculationOutput & output_for(const DependencyReport & report, const std::string & caption)
{
  const auto it = std::find_if(
    report.calculations.begin(), report.calculations.end(),
    [&](const CalculationOutput & c) { return c.caption == caption; });
  if (it == report.calculations.end()) {
    throw std::out_of_range("no output for '" + caption + "'");
  }
  return *it;
}

const DepthLevel * level_for(const DependencyReport & report, const std::string & key)
{
  for (const auto & level : report.depth_levels) {
    if (level.key == key) return &level;
  }
  return nullptr;
}

}  // namespace

// ============================================================================
// Dependencies
// ============================================================================

TEST(DriverAnalyzer, EmptyWorkbookIsNotAnError)
{
  const auto wb = WorkbookBuilder()
                    .field("Sales")
                    .field("Region")
                    .parameter("Rate", "Parameter 1")
                    .build();

  const auto result = Analyzer::analyze_dependencies(wb, {});
  ASSERT_TRUE(result.report.message.has_value());
  EXPECT_EQ(*result.report.message, "No calculated fields found in this workbook");
  EXPECT_EQ(result.report.summary.total_calculations, 0u);
  EXPECT_EQ(result.report.summary.parameter_count, 1u);
  EXPECT_EQ(result.report.summary.source_field_count, 2u);
  EXPECT_TRUE(result.report.calculations.empty());
  EXPECT_TRUE(result.diagnostics.has_code(diag_code::k_no_calculations));
  EXPECT_FALSE(result.diagnostics.has_errors());
}

TEST(DriverAnalyzer, SummaryCounts)
{
  const auto wb = WorkbookBuilder()
                    .calc("Alpha", "[Beta] + 1")
                    .calc("Beta", "[Gamma] * 2")
                    .calc("Gamma", "SUM([Sales])")
                    .calc("Standalone", "[Cost]")
                    .build();

  const auto result = Analyzer::analyze_dependencies(wb, {});
  const auto & s = result.report.summary;
  EXPECT_FALSE(result.report.message.has_value());
  EXPECT_EQ(s.total_calculations, 4u);
  EXPECT_EQ(s.max_dependency_depth, 2);
  EXPECT_EQ(s.root_calculations, 2u);  // Gamma, Standalone
  EXPECT_EQ(s.leaf_calculations, 2u);  // Alpha, Standalone
  EXPECT_EQ(s.intermediate_calculations, 1u);
  EXPECT_EQ(s.circular_dependencies, 0u);
  EXPECT_TRUE(result.report.cycles.empty());
}

TEST(DriverAnalyzer, CalculationsOrderedByDepth)
{
  const auto wb = WorkbookBuilder()
                    .calc("Alpha", "[Beta] + 1")
                    .calc("Beta", "[Gamma] * 2")
                    .calc("Gamma", "SUM([Sales])")
                    .build();

  const auto result = Analyzer::analyze_dependencies(wb, {});
  Names order;
  for (const auto & c : result.report.calculations) {
    order.push_back(c.caption);
  }
  EXPECT_EQ(order, (Names{"Gamma", "Beta", "Alpha"}));

  const auto & alpha = output_for(result.report, "Alpha");
  EXPECT_EQ(alpha.depends_on_calcs, (Names{"Beta"}));
  EXPECT_TRUE(alpha.is_leaf);
  EXPECT_FALSE(alpha.is_root);
  EXPECT_EQ(output_for(result.report, "Gamma").used_by, (Names{"Beta"}));

  ASSERT_EQ(result.report.depth_levels.size(), 3u);
  EXPECT_EQ(result.report.depth_levels[0].key, "level0");
  EXPECT_EQ(result.report.depth_levels[2].key, "level2");
}

TEST(DriverAnalyzer, CycleReport)
{
  const auto wb = WorkbookBuilder()
                    .calc("Alpha", "[Beta]")
                    .calc("Beta", "[Alpha]")
                    .calc("Ok", "[Sales]")
                    .build();

  const auto result = Analyzer::analyze_dependencies(wb, {});
  const auto & report = result.report;

  EXPECT_EQ(report.summary.circular_dependencies, 1u);
  // Circular calculations stay out of the structural counts.
  EXPECT_EQ(report.summary.root_calculations, 1u);
  EXPECT_EQ(report.summary.leaf_calculations, 1u);
  EXPECT_EQ(report.summary.max_dependency_depth, 0);

  ASSERT_EQ(report.cycles.size(), 1u);
  EXPECT_EQ(report.cycles[0].cycle, (Names{"Alpha", "Beta", "Alpha"}));
  EXPECT_EQ(report.cycles[0].explanation, "Circular dependency detected: Alpha -> Beta -> Alpha");

  const DepthLevel * circular = level_for(report, "circular");
  ASSERT_NE(circular, nullptr);
  EXPECT_EQ(circular->entries.size(), 2u);
  EXPECT_EQ(&report.depth_levels.back(), circular);

  EXPECT_TRUE(output_for(report, "Alpha").is_circular);
  EXPECT_EQ(output_for(report, "Alpha").depth, 0);
  EXPECT_TRUE(result.diagnostics.has_code(diag_code::k_circular_dependency));
}

TEST(DriverAnalyzer, PreviewsAndCaps)
{
  WorkbookBuilder builder;
  builder.calc("Wide", "[s1] + [s2] + [s3] + [s4] + [s5] + [s6] + [s7]");
  builder.calc("Long", "[Wide] + " + std::string(200, '1'));
  for (int i = 0; i < 7; ++i) {
    builder.calc("User" + std::to_string(i), "[Wide] * " + std::to_string(i));
  }

  AnalysisOptions options;
  options.max_listed_calculations = 3;

  const auto result = Analyzer::analyze_dependencies(builder.build(), options);
  const auto & report = result.report;

  EXPECT_EQ(report.calculations.size(), 3u);
  EXPECT_EQ(report.summary.total_calculations, 9u);

  const auto & wide = output_for(report, "Wide");
  EXPECT_EQ(wide.depends_on_source, (Names{"s1", "s2", "s3", "s4", "s5"}));

  const DepthLevel * level0 = level_for(report, "level0");
  ASSERT_NE(level0, nullptr);
  ASSERT_EQ(level0->entries.size(), 1u);
  EXPECT_EQ(level0->entries[0].used_by.size(), 5u);

  const DepthLevel * level1 = level_for(report, "level1");
  ASSERT_NE(level1, nullptr);
  const auto long_entry = std::find_if(
    level1->entries.begin(), level1->entries.end(),
    [](const DepthLevelEntry & e) { return e.caption == "Long"; });
  ASSERT_NE(long_entry, level1->entries.end());
  EXPECT_EQ(long_entry->formula_preview.size(), 103u);
  EXPECT_EQ(long_entry->formula_preview.substr(100), "...");
}

TEST(DriverAnalyzer, FormulaPreviewKeepsMultiByteCharacterWhole)
{
  // 99 ASCII bytes, then a two-byte character straddling the 100-byte limit.
  const std::string formula = std::string(99, '1') + "\xC3\xA9" + " + 1";
  const auto wb = WorkbookBuilder().calc("Accented", formula).build();

  const auto result = Analyzer::analyze_dependencies(wb, {});
  const DepthLevel * level0 = level_for(result.report, "level0");
  ASSERT_NE(level0, nullptr);
  ASSERT_EQ(level0->entries.size(), 1u);
  EXPECT_EQ(level0->entries[0].formula_preview, std::string(99, '1') + "...");
}

TEST(DriverAnalyzer, FullSourceListOnRequest)
{
  const auto wb =
    WorkbookBuilder().calc("Wide", "[s1] + [s2] + [s3] + [s4] + [s5] + [s6] + [s7]").build();

  AnalysisOptions options;
  options.include_source_fields = true;
  const auto result = Analyzer::analyze_dependencies(wb, options);
  EXPECT_EQ(output_for(result.report, "Wide").depends_on_source.size(), 7u);
}

TEST(DriverAnalyzer, TreeIncluded)
{
  const auto wb = WorkbookBuilder().calc("Top", "[Base]").calc("Base", "[Sales]").build();
  const auto result = Analyzer::analyze_dependencies(wb, {});
  EXPECT_EQ(
    result.report.dependency_tree,
    "Top [depth: 1] (leaf calculation)\n"
    "└── Base [depth: 0]\n"
    "    └── [source: Sales]");
}

// ============================================================================
// Scoped aggregations
// ============================================================================

TEST(DriverAnalyzer, ScopeReport)
{
  const auto wb = WorkbookBuilder()
                    .calc("First Purchase", "{FIXED [Customer ID] : MIN([Order Date])}")
                    .calc("Share", "SUM([Sales]) / SUM({FIXED : SUM([Sales])})")
                    .hidden_calc("Helper", "{EXCLUDE [Region] : AVG([Profit])} + [First Purchase]")
                    .calc("Plain", "[Sales] * 2")
                    .build();

  const auto result = Analyzer::analyze_scopes(wb, {});
  const auto & report = result.report;
  const auto & s = report.summary;

  EXPECT_FALSE(report.message.has_value());
  EXPECT_EQ(s.total_expressions, 3u);
  EXPECT_EQ(s.fixed_count, 2u);
  EXPECT_EQ(s.include_count, 0u);
  EXPECT_EQ(s.exclude_count, 1u);
  EXPECT_EQ(s.table_wide_fixed_count, 1u);
  EXPECT_EQ(s.hidden_count, 1u);
  EXPECT_EQ(s.total_calculations, 4u);

  EXPECT_EQ(report.pattern(ScopePattern::EntityCohort), (Names{"First Purchase"}));
  EXPECT_EQ(report.pattern(ScopePattern::ScopeWideTotal), (Names{"Share"}));
  EXPECT_EQ(report.pattern(ScopePattern::Other), (Names{"Helper"}));
  EXPECT_TRUE(report.pattern(ScopePattern::CumulativeTotal).empty());

  const auto & first = report.expressions.at(0);
  EXPECT_EQ(first.caption, "First Purchase");
  EXPECT_EQ(first.details.dimensions, (Names{"Customer ID"}));
  ASSERT_TRUE(first.used_in_calculations.has_value());
  EXPECT_EQ(*first.used_in_calculations, (Names{"Helper"}));
}

TEST(DriverAnalyzer, ScopeUsageContextExcludesSelfAndCanBeDisabled)
{
  const auto wb = WorkbookBuilder().calc("Self", "{FIXED : SUM([Self])} + [Self]").build();

  const auto with_usage = Analyzer::analyze_scopes(wb, {});
  ASSERT_EQ(with_usage.report.expressions.size(), 1u);
  ASSERT_TRUE(with_usage.report.expressions[0].used_in_calculations.has_value());
  EXPECT_TRUE(with_usage.report.expressions[0].used_in_calculations->empty());

  AnalysisOptions options;
  options.include_usage_context = false;
  const auto without = Analyzer::analyze_scopes(wb, options);
  EXPECT_FALSE(without.report.expressions[0].used_in_calculations.has_value());
}

TEST(DriverAnalyzer, NestedScopeCounted)
{
  const auto wb = WorkbookBuilder()
                    .calc("Nested", "{FIXED [Region] : AVG({INCLUDE [Customer] : SUM([Sales])})}")
                    .build();

  const auto result = Analyzer::analyze_scopes(wb, {});
  ASSERT_EQ(result.report.expressions.size(), 1u);
  EXPECT_EQ(result.report.summary.nested_count, 1u);
  EXPECT_EQ(result.report.summary.fixed_count, 1u);
  EXPECT_EQ(result.report.summary.include_count, 0u);
  ASSERT_EQ(result.report.expressions[0].details.nested.size(), 1u);
}

TEST(DriverAnalyzer, QuotedScopeOpeningIsNotNested)
{
  const auto wb = WorkbookBuilder()
                    .calc("Tagged", "{FIXED [Region] : MAX(IF [Tag] = \"{FIXED\" THEN 1 END)}")
                    .build();

  const auto result = Analyzer::analyze_scopes(wb, {});
  ASSERT_EQ(result.report.expressions.size(), 1u);
  EXPECT_FALSE(result.report.expressions[0].details.has_nested_scope);
  EXPECT_EQ(result.report.summary.nested_count, 0u);
}

TEST(DriverAnalyzer, NoScopesMessage)
{
  const auto wb = WorkbookBuilder().calc("Plain", "[Sales] * 2").build();
  const auto result = Analyzer::analyze_scopes(wb, {});
  ASSERT_TRUE(result.report.message.has_value());
  EXPECT_EQ(*result.report.message, "No scoped aggregations found in this workbook");
  EXPECT_EQ(result.report.summary.total_calculations, 1u);
}

TEST(DriverAnalyzer, RepeatedRunsAgree)
{
  const auto wb = WorkbookBuilder()
                    .calc("A", "[B] + [C]")
                    .calc("B", "[A]")
                    .calc("C", "{FIXED : SUM([Sales])}")
                    .build();

  const auto first = Analyzer::analyze_dependencies(wb, {});
  const auto second = Analyzer::analyze_dependencies(wb, {});
  EXPECT_EQ(first.report.dependency_tree, second.report.dependency_tree);
  ASSERT_EQ(first.report.cycles.size(), second.report.cycles.size());
  EXPECT_EQ(first.report.cycles[0].cycle, second.report.cycles[0].cycle);
  EXPECT_EQ(first.diagnostics.size(), second.diagnostics.size());
}
