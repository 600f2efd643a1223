// tests/unit/sema/test_field_resolution.cpp - Field extraction, reference classification, reverse edges

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "wbcalc/sema/resolution/dependency_resolver.hpp"
#include "wbcalc/sema/resolution/field_extractor.hpp"
#include "wbcalc/test_support/workbook_builder.hpp"

using namespace wbcalc;
using test_support::WorkbookBuilder;

using Names = std::vector<std::string>;

TEST(SemaFieldResolution, SourceFieldsAndOneParameterOnly)
{
  const auto wb = WorkbookBuilder()
                    .field("Sales")
                    .field("Discount")
                    .calc("Net Sales", "[Sales] * (1 - [Discount]) * [Tax Rate]")
                    .parameter("Tax Rate", "Parameter 1", "0.2")
                    .build();

  const auto t = test_support::build_graph(wb);
  const auto & calc = t.calc("Net Sales");

  EXPECT_TRUE(calc.depends_on_calcs.empty());
  EXPECT_EQ(calc.depends_on_params, (Names{"Tax Rate"}));
  EXPECT_EQ(calc.depends_on_source, (Names{"Sales", "Discount"}));
  EXPECT_TRUE(calc.is_root());
  EXPECT_EQ(calc.depth, 0);
}

TEST(SemaFieldResolution, ParameterMatchedByInternalName)
{
  const auto wb = WorkbookBuilder()
                    .calc("Projected", "[Sales] * [Parameters].[Parameter 1]")
                    .parameter("Growth Rate", "Parameter 1")
                    .build();

  const auto t = test_support::build_graph(wb);
  EXPECT_EQ(t.calc("Projected").depends_on_params, (Names{"Parameter 1"}));
  EXPECT_EQ(t.calc("Projected").depends_on_source, (Names{"Sales"}));
}

TEST(SemaFieldResolution, CalculationMatchedByCaptionOrInternalName)
{
  const auto wb = WorkbookBuilder()
                    .calc("Profit Ratio", "SUM([Profit]) / SUM([Sales])", "Calculation_123")
                    .calc("Ratio Pct", "[Calculation_123] * 100 + [Profit Ratio]")
                    .build();

  const auto t = test_support::build_graph(wb);
  const auto & pct = t.calc("Ratio Pct");
  EXPECT_EQ(t.captions(pct.depends_on_calcs), (Names{"Profit Ratio"}));
  EXPECT_TRUE(pct.depends_on_source.empty());
  EXPECT_EQ(pct.depth, 1);
}

TEST(SemaFieldResolution, UnmatchedReferencesBecomeSourceFields)
{
  const auto wb = WorkbookBuilder().calc("X", "[Nowhere] + [Also Missing]").build();

  const auto t = test_support::build_graph(wb);
  EXPECT_EQ(t.calc("X").depends_on_source, (Names{"Nowhere", "Also Missing"}));
}

TEST(SemaFieldResolution, EveryReferenceIsClassifiedExactlyOnce)
{
  const auto wb = WorkbookBuilder()
                    .field("Sales")
                    .calc("Base", "[Sales]")
                    .calc("Mixed", "[Base] + [Sales] + [Rate] + [Unknown] + [Base]")
                    .parameter("Rate", "Parameter 1")
                    .build();

  const auto t = test_support::build_graph(wb);
  for (const auto & calc : t.graph.fields.calculations()) {
    const size_t classified =
      calc.depends_on_calcs.size() + calc.depends_on_params.size() + calc.depends_on_source.size();
    EXPECT_EQ(classified, calc.all_references.size()) << calc.caption;
  }
}

TEST(SemaFieldResolution, ParameterColumnsNeverBecomeCalculations)
{
  Workbook wb = WorkbookBuilder().calc("Uses Param", "[Rate] * 2").build();
  Datasource params;
  params.name = "Parameters";
  Column col;
  col.name = "Parameter 1";
  col.caption = "Rate";
  col.formula = "0.05";
  col.allowed_values = {"0.05", "0.1", "0.05"};
  params.columns.push_back(col);
  wb.datasources.push_back(params);

  DiagnosticBag diags;
  FieldExtractor extractor(&diags);
  const FieldTable table = extractor.extract(wb);

  EXPECT_EQ(table.calculation_count(), 1u);
  ASSERT_EQ(table.parameters().size(), 1u);
  EXPECT_EQ(table.parameters()[0].caption, "Rate");
  EXPECT_EQ(table.parameters()[0].allowed_values, (Names{"0.05", "0.1"}));
  EXPECT_TRUE(table.is_parameter("Rate"));
  EXPECT_TRUE(table.is_parameter("Parameter 1"));
}

TEST(SemaFieldResolution, ColumnWithEmptyFormulaIsSourceField)
{
  const auto wb = WorkbookBuilder().calc("Blank", "").field("Sales").build();

  FieldExtractor extractor;
  const FieldTable table = extractor.extract(wb);
  EXPECT_TRUE(table.empty());
  EXPECT_TRUE(table.is_source_field("Blank"));
  EXPECT_EQ(table.source_fields().size(), 2u);
}

TEST(SemaFieldResolution, DuplicateCaptionKeepsFirstAndWarns)
{
  const auto wb = WorkbookBuilder()
                    .datasource("orders")
                    .calc("Total", "SUM([Sales])", "Calculation_1")
                    .datasource("returns")
                    .calc("Total", "SUM([Refunds])", "Calculation_2")
                    .build();

  const auto t = test_support::build_graph(wb);
  EXPECT_EQ(t.graph.fields.calculation_count(), 1u);
  EXPECT_EQ(t.calc("Total").formula, "SUM([Sales])");
  EXPECT_EQ(t.calc("Total").datasource, "orders");
  EXPECT_TRUE(t.diags.has_code(diag_code::k_duplicate_caption));
  EXPECT_FALSE(t.diags.has_errors());
}

TEST(SemaFieldResolution, ReverseEdgesFollowDefinitionOrder)
{
  const auto wb = WorkbookBuilder()
                    .calc("A", "[B] + [C]")
                    .calc("B", "[C] * 2")
                    .calc("C", "[Sales]")
                    .build();

  const auto t = test_support::build_graph(wb);
  EXPECT_EQ(t.captions(t.calc("C").used_by), (Names{"A", "B"}));
  EXPECT_EQ(t.captions(t.calc("B").used_by), (Names{"A"}));
  EXPECT_TRUE(t.calc("A").used_by.empty());
}

TEST(SemaFieldResolution, ResolverIsRepeatable)
{
  const auto wb = WorkbookBuilder().calc("A", "[B]").calc("B", "[Sales]").build();

  FieldExtractor extractor;
  FieldTable table = extractor.extract(wb);
  DependencyResolver resolver(table);
  resolver.resolve();
  build_reverse_edges(table);
  resolver.resolve();
  build_reverse_edges(table);

  const auto b = *table.find_by_caption("B");
  EXPECT_EQ(table.calculation(*table.find_by_caption("A")).depends_on_calcs.size(), 1u);
  EXPECT_EQ(table.calculation(b).used_by.size(), 1u);
}
