// tests/unit/syntax/test_reference_scanner.cpp - Bracketed reference extraction

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "wbcalc/syntax/reference_scanner.hpp"

using wbcalc::syntax::extract_references;
using wbcalc::syntax::field_display_name;
using wbcalc::syntax::parse_field_reference;

using Refs = std::vector<std::string>;

TEST(SyntaxReferenceScanner, ExtractsInOrder)
{
  EXPECT_EQ(extract_references("SUM([Profit]) / SUM([Sales])"), (Refs{"Profit", "Sales"}));
}

TEST(SyntaxReferenceScanner, DeduplicatesKeepingFirstOccurrence)
{
  EXPECT_EQ(extract_references("[B] + [A] * [B] - [A]"), (Refs{"B", "A"}));
}

TEST(SyntaxReferenceScanner, NoBracketsYieldsEmpty)
{
  EXPECT_TRUE(extract_references("1 + 2").empty());
  EXPECT_TRUE(extract_references("").empty());
}

TEST(SyntaxReferenceScanner, SkipsParametersQualifier)
{
  EXPECT_EQ(extract_references("[Parameters].[Rate] * [Sales]"), (Refs{"Rate", "Sales"}));
}

TEST(SyntaxReferenceScanner, KeepsSpacesAndPunctuationInsideBrackets)
{
  EXPECT_EQ(
    extract_references("DATEDIFF('day', [Order Date], [Ship Date (UTC)])"),
    (Refs{"Order Date", "Ship Date (UTC)"}));
}

TEST(SyntaxReferenceScanner, UnterminatedBracketEndsScan)
{
  EXPECT_EQ(extract_references("[A] + [B"), (Refs{"A"}));
}

TEST(SyntaxReferenceScanner, EmptyBracketsAreIgnored)
{
  EXPECT_EQ(extract_references("[] + [A]"), (Refs{"A"}));
}

TEST(SyntaxReferenceScanner, QualifiedTokensAreSplitAtTheDot)
{
  EXPECT_EQ(
    extract_references("[Sales Data].[sum:Profit:qk]"), (Refs{"Sales Data", "sum:Profit:qk"}));
}

// ============================================================================
// Qualified reference decomposition
// ============================================================================

TEST(SyntaxFieldReference, DecomposesFourParts)
{
  const auto ref = parse_field_reference("[Sales Data].[sum:Profit:qk]");
  ASSERT_TRUE(ref.is_qualified());
  EXPECT_EQ(*ref.datasource, "Sales Data");
  ASSERT_TRUE(ref.prefix.has_value());
  EXPECT_EQ(*ref.prefix, "sum");
  EXPECT_EQ(ref.field_name, "Profit");
  ASSERT_TRUE(ref.suffix.has_value());
  EXPECT_EQ(*ref.suffix, "qk");
}

TEST(SyntaxFieldReference, QualifiedWithoutPrefixSuffix)
{
  const auto ref = parse_field_reference("[federated.1].[Region]");
  ASSERT_TRUE(ref.is_qualified());
  EXPECT_EQ(*ref.datasource, "federated.1");
  EXPECT_FALSE(ref.prefix.has_value());
  EXPECT_FALSE(ref.suffix.has_value());
  EXPECT_EQ(ref.field_name, "Region");
}

TEST(SyntaxFieldReference, BareTokenFallsBackToFieldName)
{
  const auto ref = parse_field_reference("[Region]");
  EXPECT_FALSE(ref.is_qualified());
  EXPECT_EQ(ref.field_name, "Region");

  EXPECT_EQ(field_display_name("Order.Date"), "Order.Date");
  EXPECT_EQ(field_display_name("none:Customer Name:nk"), "none:Customer Name:nk");
}

TEST(SyntaxFieldReference, DisplayNameOfQualifiedToken)
{
  EXPECT_EQ(field_display_name("[ds].[none:Customer Name:nk]"), "Customer Name");
}
