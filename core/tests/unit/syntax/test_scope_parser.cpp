// tests/unit/syntax/test_scope_parser.cpp - Scoped-aggregation block parsing

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "wbcalc/syntax/scope_parser.hpp"

using namespace wbcalc::syntax;

using Dims = std::vector<std::string>;

TEST(SyntaxScopeParser, FixedWithEntityDimension)
{
  const std::string formula = "{FIXED [Customer] : MIN([Order Date])}";
  const auto blocks = parse_scoped_aggregations(formula);
  ASSERT_EQ(blocks.size(), 1u);

  const auto & b = blocks[0];
  EXPECT_EQ(b.kind, ScopeKind::Fixed);
  EXPECT_EQ(b.dimensions, (Dims{"Customer"}));
  ASSERT_TRUE(b.aggregation.has_value());
  EXPECT_EQ(*b.aggregation, "MIN");
  EXPECT_EQ(b.expression, "MIN([Order Date])");
  EXPECT_EQ(b.source_text, formula);
  EXPECT_EQ(b.begin, 0u);
  EXPECT_EQ(b.end, formula.size());
  EXPECT_FALSE(b.has_nested_scope);
}

TEST(SyntaxScopeParser, EmptyDimensionList)
{
  const auto blocks = parse_scoped_aggregations("{FIXED : SUM([Sales])}");
  ASSERT_EQ(blocks.size(), 1u);
  EXPECT_TRUE(blocks[0].dimensions.empty());
  EXPECT_EQ(blocks[0].aggregation.value_or(""), "SUM");
}

TEST(SyntaxScopeParser, NestedBlockIsCapturedAndParsed)
{
  const auto blocks =
    parse_scoped_aggregations("{FIXED [Region] : SUM({FIXED [Customer] : SUM([Sales])})}");
  ASSERT_EQ(blocks.size(), 1u);

  const auto & outer = blocks[0];
  EXPECT_EQ(outer.dimensions, (Dims{"Region"}));
  EXPECT_EQ(outer.aggregation.value_or(""), "SUM");
  EXPECT_EQ(outer.expression, "SUM({FIXED [Customer] : SUM([Sales])})");
  EXPECT_TRUE(outer.has_nested_scope);
  ASSERT_EQ(outer.nested.size(), 1u);
  EXPECT_EQ(outer.nested[0].dimensions, (Dims{"Customer"}));
  EXPECT_FALSE(outer.nested[0].has_nested_scope);
}

TEST(SyntaxScopeParser, ScopeOpeningInsideStringIsNotNested)
{
  const auto blocks =
    parse_scoped_aggregations("{FIXED [Region] : MAX(IF [Tag] = \"{FIXED\" THEN 1 END)}");
  ASSERT_EQ(blocks.size(), 1u);
  EXPECT_FALSE(blocks[0].has_nested_scope);
  EXPECT_TRUE(blocks[0].nested.empty());
}

TEST(SyntaxScopeParser, FindsEveryTopLevelBlock)
{
  const auto blocks = parse_scoped_aggregations(
    "SUM([Sales]) / SUM({FIXED : SUM([Sales])}) - {exclude [Region]: AVG([Profit])}");
  ASSERT_EQ(blocks.size(), 2u);
  EXPECT_EQ(blocks[0].kind, ScopeKind::Fixed);
  EXPECT_EQ(blocks[1].kind, ScopeKind::Exclude);
  EXPECT_EQ(blocks[1].dimensions, (Dims{"Region"}));
  EXPECT_EQ(blocks[1].aggregation.value_or(""), "AVG");
  EXPECT_LT(blocks[0].end, blocks[1].begin);
}

TEST(SyntaxScopeParser, SeveralDimensions)
{
  const auto blocks =
    parse_scoped_aggregations("{ INCLUDE [Customer], [Order Date] : SUM([Sales]) }");
  ASSERT_EQ(blocks.size(), 1u);
  EXPECT_EQ(blocks[0].kind, ScopeKind::Include);
  EXPECT_EQ(blocks[0].dimensions, (Dims{"Customer", "Order Date"}));
}

TEST(SyntaxScopeParser, QualifiedDimensionUsesDisplayName)
{
  const auto blocks = parse_scoped_aggregations(
    "{FIXED [Sales Data].[none:Customer Name:nk] : MIN([Order Date])}");
  ASSERT_EQ(blocks.size(), 1u);
  EXPECT_EQ(blocks[0].dimensions, (Dims{"Customer Name"}));
}

TEST(SyntaxScopeParser, AggregationIsCaseInsensitiveAndAllowsSpace)
{
  const auto blocks = parse_scoped_aggregations("{fixed [Region] : countd ([Customer])}");
  ASSERT_EQ(blocks.size(), 1u);
  EXPECT_EQ(blocks[0].aggregation.value_or(""), "COUNTD");
}

TEST(SyntaxScopeParser, UnknownLeadingFunctionMeansNoAggregation)
{
  const auto a = parse_scoped_aggregations("{FIXED [Region] : [Sales] * 2}");
  ASSERT_EQ(a.size(), 1u);
  EXPECT_FALSE(a[0].aggregation.has_value());

  const auto b = parse_scoped_aggregations("{FIXED [Region] : SUMX([Sales])}");
  ASSERT_EQ(b.size(), 1u);
  EXPECT_FALSE(b[0].aggregation.has_value());
}

TEST(SyntaxScopeParser, BracesInsideStringsAndFieldsDoNotCount)
{
  EXPECT_TRUE(parse_scoped_aggregations("IF [A] = \"{FIXED\" THEN 1 END").empty());

  const auto blocks = parse_scoped_aggregations("{FIXED [Odd}Name] : SUM([x] + LEN('}'))}");
  ASSERT_EQ(blocks.size(), 1u);
  EXPECT_EQ(blocks[0].dimensions, (Dims{"Odd}Name"}));
  EXPECT_EQ(blocks[0].expression, "SUM([x] + LEN('}'))");
}

TEST(SyntaxScopeParser, CommentedOutBlockIsSkipped)
{
  const auto blocks =
    parse_scoped_aggregations("// {FIXED : SUM([Old])}\n{FIXED [Region] : SUM([New])}");
  ASSERT_EQ(blocks.size(), 1u);
  EXPECT_EQ(blocks[0].dimensions, (Dims{"Region"}));
}

TEST(SyntaxScopeParser, MalformedBlocksAreIgnored)
{
  // not a scope keyword
  EXPECT_TRUE(parse_scoped_aggregations("{ SUM([Sales]) }").empty());
  // missing colon
  EXPECT_TRUE(parse_scoped_aggregations("{FIXED [Region] SUM([Sales])}").empty());
  // missing closing brace
  EXPECT_TRUE(parse_scoped_aggregations("{FIXED [Region] : SUM([Sales])").empty());
  // keyword prefix of a longer identifier
  EXPECT_TRUE(parse_scoped_aggregations("{FIXEDX [Region] : SUM([Sales])}").empty());
}

TEST(SyntaxScopeParser, BlockInsideNonScopeBracesIsFound)
{
  const auto blocks = parse_scoped_aggregations("{ 1 + {FIXED : SUM([Sales])} }");
  ASSERT_EQ(blocks.size(), 1u);
  EXPECT_TRUE(blocks[0].dimensions.empty());
}

TEST(SyntaxScopeParser, ScopeOpeningDetection)
{
  EXPECT_TRUE(contains_scope_opening("SUM({ FIXED [a] : SUM([b])})"));
  EXPECT_TRUE(contains_scope_opening("{exclude [a] : AVG([b])}"));
  EXPECT_FALSE(contains_scope_opening("{SUM([b])}"));
  EXPECT_FALSE(contains_scope_opening("FIXED"));
}

TEST(SyntaxScopeParser, LeadingAggregation)
{
  EXPECT_EQ(leading_aggregation("  median([x])").value_or(""), "MEDIAN");
  EXPECT_EQ(leading_aggregation("STDEVP([x])").value_or(""), "STDEVP");
  EXPECT_FALSE(leading_aggregation("SUM").has_value());
  EXPECT_FALSE(leading_aggregation("[x] + SUM([y])").has_value());
}
