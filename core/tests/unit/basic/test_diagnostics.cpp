// tests/unit/basic/test_diagnostics.cpp - DiagnosticBag and DiagnosticBuilder
//

#include <gtest/gtest.h>

#include "minilang/basic/diagnostic.hpp"

using namespace minilang;

TEST(BasicDiagnostics, BuilderAddsOnDestruction)
{
  DiagnosticBag bag;
  {
    auto builder = bag.report_error(SourceRange(1, 2), "Invalid type in condition");
    builder.with_code("E002");
    EXPECT_TRUE(bag.empty());
  }
  ASSERT_EQ(bag.size(), 1U);
  EXPECT_EQ(bag.all()[0].code, "E002");
  EXPECT_EQ(bag.all()[0].message, "Invalid type in condition");
}

TEST(BasicDiagnostics, FluentChain)
{
  DiagnosticBag bag;
  bag.report_error(SourceRange(10, 11), "Identifier a has multiple declarations", "redeclared")
    .with_code("E001")
    .with_secondary_label(SourceRange(4, 5), "first declared here")
    .with_help("each identifier can be declared only once per program");

  ASSERT_EQ(bag.size(), 1U);
  const Diagnostic & d = bag.all()[0];
  ASSERT_EQ(d.labels.size(), 2U);
  EXPECT_EQ(d.labels[0].style, LabelStyle::Primary);
  EXPECT_EQ(d.labels[0].message, "redeclared");
  EXPECT_EQ(d.labels[1].style, LabelStyle::Secondary);
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(d.primary_range().get_begin().get_offset(), 10U);
  ASSERT_NE(d.primary_label(), nullptr);
  EXPECT_EQ(d.primary_label()->message, "redeclared");
}

TEST(BasicDiagnostics, MovedBuilderAddsOnce)
{
  DiagnosticBag bag;
  {
    auto first = bag.report_error({}, "Invalid type in condition");
    auto second = std::move(first);
    second.with_code("E002");
  }
  ASSERT_EQ(bag.size(), 1U);
  EXPECT_EQ(bag.all()[0].code, "E002");
}

TEST(BasicDiagnostics, HasErrors)
{
  DiagnosticBag bag;
  EXPECT_FALSE(bag.has_errors());
  EXPECT_TRUE(bag.empty());

  bag.report_error({}, "e");
  EXPECT_TRUE(bag.has_errors());
  EXPECT_EQ(bag.size(), 1U);
}

TEST(BasicDiagnostics, DiagnosticWithoutLabels)
{
  Diagnostic d;
  EXPECT_EQ(d.primary_label(), nullptr);
  EXPECT_FALSE(d.primary_range().is_valid());
}
