// tests/unit/sema/test_end_to_end.cpp - Whole programs from interchange documents
//
// Each document is what the parser emits for the program in its "text",
// including the pass-through precedence layers.
//

#include <gtest/gtest.h>

#include <sstream>

#include "minilang/sema/semantic_analyzer.hpp"
#include "minilang/test_support/analysis_helpers.hpp"

using namespace minilang;

namespace
{

test_support::AnalysisOutcome load_and_analyze(std::string_view json_text)
{
  auto unit = test_support::load(json_text);
  EXPECT_TRUE(unit.doc.ok());
  EXPECT_FALSE(unit.diags.has_errors());
  if (!unit.doc.ok()) {
    return {};
  }
  return test_support::analyze(*unit.program());
}

}  // namespace

// num a; a = 1;
TEST(SemaEndToEnd, DeclareAndAssign)
{
  const auto out = load_and_analyze(R"({
    "source": { "path": "ex1.ml", "text": "num a;\na = 1;\n" },
    "program": { "kind": "Program", "children": [
      { "kind": "Declaration", "value": "num", "range": { "start": 0, "end": 6 },
        "children": [ { "kind": "Identifier", "value": "a", "range": { "start": 4, "end": 5 } } ] },
      { "kind": "AssignStmt", "range": { "start": 7, "end": 13 }, "children": [
        { "kind": "Identifier", "value": "a", "range": { "start": 7, "end": 8 } },
        { "kind": "Expr", "children": [ { "kind": "IntValue", "value": 1 } ] } ] }
    ] }
  })");
  ASSERT_TRUE(out.ok()) << out.message();
  EXPECT_EQ(out.output, "{VAR:1, WHILE:0, IF:0, FUNC:0, OP:0}\n");
}

// num a; bool a;
TEST(SemaEndToEnd, MultipleDeclarations)
{
  const auto out = load_and_analyze(R"({
    "source": { "path": "ex2.ml", "text": "num a;\nbool a;\n" },
    "program": { "kind": "Program", "children": [
      { "kind": "Declaration", "value": "num", "range": { "start": 0, "end": 6 },
        "children": [ { "kind": "Identifier", "value": "a", "range": { "start": 4, "end": 5 } } ] },
      { "kind": "Declaration", "value": "bool", "range": { "start": 7, "end": 14 },
        "children": [ { "kind": "Identifier", "value": "a", "range": { "start": 12, "end": 13 } } ] }
    ] }
  })");
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.message(), "Identifier a has multiple declarations");
  EXPECT_EQ(out.error->range().get_begin().get_offset(), 12U);
  ASSERT_TRUE(out.error->related_range().has_value());
  EXPECT_EQ(out.error->related_range()->get_begin().get_offset(), 4U);
  EXPECT_TRUE(out.output.empty());
}

// bool b; if (b) { num x; x = 1 + 2; }
TEST(SemaEndToEnd, ConditionalWithBody)
{
  const auto out = load_and_analyze(R"({
    "program": { "kind": "Program", "children": [
      { "kind": "Declaration", "value": "bool",
        "children": [ { "kind": "Identifier", "value": "b" } ] },
      { "kind": "IfStmt", "children": [
        { "kind": "Expr", "children": [
          { "kind": "BoolExpr", "children": [
            { "kind": "CompExpr", "children": [
              { "kind": "AddExpr", "children": [
                { "kind": "MulExpr", "children": [
                  { "kind": "NotExpr", "children": [
                    { "kind": "UnaExpr", "children": [
                      { "kind": "GenValue", "children": [
                        { "kind": "Identifier", "value": "b" } ] } ] } ] } ] } ] } ] } ] } ] },
        { "kind": "Block", "children": [
          { "kind": "Declaration", "value": "num",
            "children": [ { "kind": "Identifier", "value": "x" } ] },
          { "kind": "AssignStmt", "children": [
            { "kind": "Identifier", "value": "x" },
            { "kind": "AddExpr", "ops": [ "+" ], "children": [
              { "kind": "IntValue", "value": 1 },
              { "kind": "IntValue", "value": 2 } ] } ] }
        ] }
      ] }
    ] }
  })");
  ASSERT_TRUE(out.ok()) << out.message();
  EXPECT_EQ(out.output, "{VAR:2, WHILE:0, IF:1, FUNC:0, OP:1}\n");
}

// num n; while (n) {}
TEST(SemaEndToEnd, NumberCondition)
{
  const auto out = load_and_analyze(R"({
    "source": { "path": "ex4.ml", "text": "num n;\nwhile (n) {}\n" },
    "program": { "kind": "Program", "children": [
      { "kind": "Declaration", "value": "num", "range": { "start": 0, "end": 6 },
        "children": [ { "kind": "Identifier", "value": "n", "range": { "start": 4, "end": 5 } } ] },
      { "kind": "WhileStmt", "range": { "start": 7, "end": 19 }, "children": [
        { "kind": "GenValue", "range": { "start": 14, "end": 15 }, "children": [
          { "kind": "Identifier", "value": "n", "range": { "start": 14, "end": 15 } } ] },
        { "kind": "Block", "range": { "start": 17, "end": 19 } }
      ] }
    ] }
  })");
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.message(), "Invalid type in condition");
  EXPECT_EQ(out.error->range().get_begin().get_offset(), 14U);
}

// bool t; num r; r = t == 1;
TEST(SemaEndToEnd, MixedEquality)
{
  const auto out = load_and_analyze(R"({
    "program": { "kind": "Program", "children": [
      { "kind": "Declaration", "value": "bool",
        "children": [ { "kind": "Identifier", "value": "t" } ] },
      { "kind": "Declaration", "value": "num",
        "children": [ { "kind": "Identifier", "value": "r" } ] },
      { "kind": "AssignStmt", "children": [
        { "kind": "Identifier", "value": "r" },
        { "kind": "CompExpr", "value": "==", "range": { "start": 19, "end": 25 }, "children": [
          { "kind": "GenValue", "children": [ { "kind": "Identifier", "value": "t" } ] },
          { "kind": "IntValue", "value": "1" } ] } ] }
    ] }
  })");
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.message(), "Invalid type in expression");
  EXPECT_EQ(out.error->code(), "E003");
}

TEST(SemaEndToEnd, FreshAnalyzerGivesSameResult)
{
  auto unit = test_support::load(R"({ "kind": "Program", "children": [
    { "kind": "Declaration", "value": "num", "children": [ { "kind": "Identifier", "value": "k" } ] },
    { "kind": "WhileStmt", "children": [
      { "kind": "CompExpr", "ops": [ "<" ], "children": [
        { "kind": "GenValue", "children": [ { "kind": "Identifier", "value": "k" } ] },
        { "kind": "IntValue", "value": 3 } ] },
      { "kind": "AssignStmt", "children": [
        { "kind": "Identifier", "value": "k" },
        { "kind": "AddExpr", "ops": [ "+" ], "children": [
          { "kind": "GenValue", "children": [ { "kind": "Identifier", "value": "k" } ] },
          { "kind": "IntValue", "value": 1 } ] } ] } ] }
  ] })");
  ASSERT_TRUE(unit.doc.ok());

  const auto first = test_support::analyze(*unit.program());
  const auto second = test_support::analyze(*unit.program());
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(*first.metrics, *second.metrics);
  EXPECT_EQ(first.output, "{VAR:1, WHILE:1, IF:0, FUNC:0, OP:2}\n");
  EXPECT_EQ(first.output, second.output);
}
