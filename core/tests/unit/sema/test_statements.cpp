// tests/unit/sema/test_statements.cpp - Statement rules of the semantic analyzer
//
// Declarations, conditions, functions, returns and assignments, built with
// AstBuilder and analyzed in isolation.
//

#include <gtest/gtest.h>

#include <sstream>

#include "minilang/ast/ast_builder.hpp"
#include "minilang/sema/semantic_analyzer.hpp"
#include "minilang/test_support/analysis_helpers.hpp"

using namespace minilang;
using test_support::analyze;
using test_support::TestTree;

// ============================================================================
// Declarations
// ============================================================================

TEST(SemaStatements, EmptyProgram)
{
  TestTree t;
  const auto out = analyze(*t.b.program({}));
  ASSERT_TRUE(out.ok());
  EXPECT_EQ(out.output, "{VAR:0, WHILE:0, IF:0, FUNC:0, OP:0}\n");
}

TEST(SemaStatements, DeclarationsAreCounted)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({
    b.declaration(ValueType::Number, "a"),
    b.declaration(ValueType::Bool, "b"),
    b.declaration(ValueType::Number, "c"),
  }));
  ASSERT_TRUE(out.ok()) << out.message();
  EXPECT_EQ(out.metrics->variables, 3U);
}

TEST(SemaStatements, DuplicateDeclarationFails)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({
    b.declaration(ValueType::Number, "a", SourceRange(0, 6)),
    b.declaration(ValueType::Number, "a", SourceRange(7, 13)),
  }));
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error->kind(), SemanticErrorKind::MultipleDeclaration);
  EXPECT_EQ(out.error->code(), "E001");
  EXPECT_EQ(out.message(), "Identifier a has multiple declarations");
  EXPECT_EQ(out.error->identifier(), "a");
  EXPECT_EQ(out.error->range().get_begin().get_offset(), 7U);
  ASSERT_TRUE(out.error->related_range().has_value());
  EXPECT_EQ(out.error->related_range()->get_begin().get_offset(), 0U);
}

TEST(SemaStatements, DeclarationInsideBlockIsGlobal)
{
  // No nested scopes: a name declared in a body is still declared afterwards
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({
    b.if_stmt(b.bool_value(true), {b.block({b.declaration(ValueType::Number, "x")})}),
    b.assign("x", b.int_value(5)),
  }));
  ASSERT_TRUE(out.ok()) << out.message();
  EXPECT_EQ(out.metrics->variables, 1U);
  EXPECT_EQ(out.metrics->conditionals, 1U);
}

TEST(SemaStatements, RedeclarationAcrossBlocksFails)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({
    b.declaration(ValueType::Number, "x"),
    b.while_stmt(b.bool_value(false), {b.block({b.declaration(ValueType::Bool, "x")})}),
  }));
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.message(), "Identifier x has multiple declarations");
}

// ============================================================================
// If / While
// ============================================================================

TEST(SemaStatements, IfWithBoolCondition)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({
    b.declaration(ValueType::Bool, "c"),
    b.if_stmt(b.var("c"), {b.block({})}),
  }));
  ASSERT_TRUE(out.ok()) << out.message();
  EXPECT_EQ(out.output, "{VAR:1, WHILE:0, IF:1, FUNC:0, OP:0}\n");
}

TEST(SemaStatements, IfWithNumberConditionFails)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({
    b.declaration(ValueType::Number, "n"),
    b.if_stmt(b.var("n", SourceRange(11, 12)), {b.block({})}),
  }));
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error->kind(), SemanticErrorKind::InvalidConditionType);
  EXPECT_EQ(out.message(), "Invalid type in condition");
  EXPECT_EQ(out.error->range().get_begin().get_offset(), 11U);
}

TEST(SemaStatements, WhileWithComparisonCondition)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({
    b.declaration(ValueType::Number, "i"),
    b.while_stmt(
      b.comp(b.var("i"), BinaryOp::Lt, b.int_value(10)),
      {b.block({b.assign("i", b.add(b.var("i"), BinaryOp::Add, b.int_value(1)))})}),
  }));
  ASSERT_TRUE(out.ok()) << out.message();
  EXPECT_EQ(out.output, "{VAR:1, WHILE:1, IF:0, FUNC:0, OP:2}\n");
}

TEST(SemaStatements, ConditionIsCheckedBeforeBody)
{
  // The body holds an undeclared read; the condition error must win
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({
    b.while_stmt(b.int_value(1), {b.block({b.assign("ghost", b.int_value(1))})}),
  }));
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error->kind(), SemanticErrorKind::InvalidConditionType);
}

TEST(SemaStatements, NestedConditionalsCountOncePerNode)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({
    b.if_stmt(
      b.bool_value(true),
      {b.block({
        b.if_stmt(b.bool_value(false), {b.block({})}),
        b.while_stmt(b.bool_value(false), {b.block({})}),
      })}),
  }));
  ASSERT_TRUE(out.ok()) << out.message();
  EXPECT_EQ(out.metrics->conditionals, 2U);
  EXPECT_EQ(out.metrics->loops, 1U);
}

TEST(SemaStatements, ElseBranchIsCheckedToo)
{
  // if (c) { } else { undeclared = 1; }
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({
    b.if_stmt(b.bool_value(true), {b.block({}), b.block({b.assign("nope", b.int_value(1))})}),
  }));
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.message(), "Invalid use of undefined Identifier nope");
}

// ============================================================================
// Functions and returns
// ============================================================================

TEST(SemaStatements, FunctionWithMatchingReturn)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({
    b.function(
      ValueType::Number, "f", {b.function_block({b.return_stmt(b.int_value(1))})}),
  }));
  ASSERT_TRUE(out.ok()) << out.message();
  EXPECT_EQ(out.output, "{VAR:0, WHILE:0, IF:0, FUNC:1, OP:0}\n");
}

TEST(SemaStatements, FunctionNameIsNotDeclaredOrRead)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({
    b.function(ValueType::Bool, "undeclared_name", {b.function_block({})}),
  }));
  ASSERT_TRUE(out.ok()) << out.message();
  EXPECT_EQ(out.metrics->variables, 0U);
}

TEST(SemaStatements, ReturnTypeMismatchFails)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({
    b.function(
      ValueType::Bool, "f", {b.function_block({b.return_stmt(b.int_value(1))})}),
  }));
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error->kind(), SemanticErrorKind::ReturnTypeMismatch);
  EXPECT_EQ(out.message(), "Return type does not match function type");
}

TEST(SemaStatements, ReturnInsideNestedIfUsesEnclosingFunction)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({
    b.function(
      ValueType::Bool, "f",
      {b.function_block({
        b.if_stmt(b.bool_value(true), {b.block({b.return_stmt(b.bool_value(false))})}),
        b.return_stmt(b.bool_value(true)),
      })}),
  }));
  ASSERT_TRUE(out.ok()) << out.message();
  EXPECT_EQ(out.metrics->functions, 1U);
  EXPECT_EQ(out.metrics->conditionals, 1U);
}

TEST(SemaStatements, ReturnDirectlyUnderFunction)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({
    b.function(ValueType::Number, "", {b.return_stmt(b.int_value(3))}),
  }));
  ASSERT_TRUE(out.ok()) << out.message();
  EXPECT_EQ(out.metrics->functions, 1U);
}

TEST(SemaStatements, NestedFunctionUsesItsOwnReturnType)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({
    b.function(
      ValueType::Number, "outer",
      {b.function_block({
        b.function(ValueType::Bool, "inner", {b.function_block({b.return_stmt(b.bool_value(true))})}),
        b.return_stmt(b.int_value(0)),
      })}),
  }));
  ASSERT_TRUE(out.ok()) << out.message();
  EXPECT_EQ(out.metrics->functions, 2U);
}

TEST(SemaStatements, NestedFunctionMismatchAgainstInnerType)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({
    b.function(
      ValueType::Number, "outer",
      {b.function_block({
        b.function(ValueType::Bool, "inner", {b.function_block({b.return_stmt(b.int_value(1))})}),
      })}),
  }));
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error->kind(), SemanticErrorKind::ReturnTypeMismatch);
}

TEST(SemaStatements, ReturnOutsideFunctionFails)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({b.return_stmt(b.int_value(1))}));
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error->kind(), SemanticErrorKind::ReturnOutsideFunction);
  EXPECT_EQ(out.error->code(), "E007");
  EXPECT_EQ(out.message(), "Return statement outside of function");
}

TEST(SemaStatements, ReturnValueIsCheckedBeforeContext)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({b.return_stmt(b.var("missing"))}));
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error->kind(), SemanticErrorKind::UndefinedIdentifier);
}

// ============================================================================
// Assignment
// ============================================================================

TEST(SemaStatements, AssignmentWithMatchingType)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({
    b.declaration(ValueType::Bool, "flag"),
    b.assign("flag", b.logic(b.bool_value(true), BinaryOp::And, b.bool_value(false))),
  }));
  ASSERT_TRUE(out.ok()) << out.message();
  EXPECT_EQ(out.metrics->operators, 1U);
}

TEST(SemaStatements, AssignmentTypeMismatchFails)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({
    b.declaration(ValueType::Number, "n"),
    b.assign("n", b.bool_value(true)),
  }));
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error->kind(), SemanticErrorKind::InvalidAssignmentType);
  EXPECT_EQ(out.message(), "Invalid type in assignation of Identifier n");
}

TEST(SemaStatements, AssignmentToUndeclaredTargetFails)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({b.assign("ghost", b.int_value(1))}));
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error->kind(), SemanticErrorKind::UndefinedIdentifier);
  EXPECT_EQ(out.message(), "Invalid use of undefined Identifier ghost");
  EXPECT_EQ(out.error->identifier(), "ghost");
}

TEST(SemaStatements, AssignmentValueIsSynthesizedFirst)
{
  // Both the target and the value are wrong; the value is reported
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({
    b.assign("ghost", b.add(b.bool_value(true), BinaryOp::Add, b.int_value(1))),
  }));
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error->kind(), SemanticErrorKind::InvalidExpressionType);
}

// ============================================================================
// Expression statements and run semantics
// ============================================================================

TEST(SemaStatements, ExpressionStatementIsTypedAndDiscarded)
{
  TestTree t;
  auto & b = t.b;
  const auto ok = analyze(*b.program({b.stmt(b.expr(b.add(b.int_value(1), BinaryOp::Add, b.int_value(2))))}));
  ASSERT_TRUE(ok.ok()) << ok.message();
  EXPECT_EQ(ok.metrics->operators, 1U);

  const auto bad = analyze(*b.program({b.stmt(b.expr(b.not_expr(b.int_value(2))))}));
  ASSERT_FALSE(bad.ok());
  EXPECT_EQ(bad.error->kind(), SemanticErrorKind::InvalidExpressionType);
}

TEST(SemaStatements, NothingIsWrittenOnFailure)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({
    b.declaration(ValueType::Number, "a"),
    b.declaration(ValueType::Number, "a"),
  }));
  ASSERT_FALSE(out.ok());
  EXPECT_TRUE(out.output.empty());
}

TEST(SemaStatements, RunResetsStateBetweenPrograms)
{
  TestTree t;
  auto & b = t.b;
  auto * program = b.program({
    b.declaration(ValueType::Number, "a"),
    b.assign("a", b.int_value(1)),
  });

  std::ostringstream sink;
  SemanticAnalyzer analyzer(sink);
  const auto first = analyzer.run(*program);
  const auto second = analyzer.run(*program);

  EXPECT_EQ(first, second);
  EXPECT_EQ(analyzer.symbols().size(), 1U);
  EXPECT_EQ(
    sink.str(), "{VAR:1, WHILE:0, IF:0, FUNC:0, OP:0}\n{VAR:1, WHILE:0, IF:0, FUNC:0, OP:0}\n");
}

TEST(SemaStatements, RunAfterFailureStartsClean)
{
  TestTree t;
  auto & b = t.b;
  auto * failing = b.program({
    b.declaration(ValueType::Number, "a"),
    b.declaration(ValueType::Bool, "a"),
  });
  auto * passing = b.program({b.declaration(ValueType::Bool, "a")});

  std::ostringstream sink;
  SemanticAnalyzer analyzer(sink);
  EXPECT_THROW(analyzer.run(*failing), SemanticError);

  const auto metrics = analyzer.run(*passing);
  EXPECT_EQ(metrics.variables, 1U);
  EXPECT_EQ(sink.str(), "{VAR:1, WHILE:0, IF:0, FUNC:0, OP:0}\n");
}

// ============================================================================
// Malformed trees
// ============================================================================

TEST(SemaStatements, NestedProgramIsMalformed)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({b.block({b.program({})})}));
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error->kind(), SemanticErrorKind::MalformedTree);
  EXPECT_EQ(out.error->code(), "E100");
}

TEST(SemaStatements, StatementInExpressionPositionIsMalformed)
{
  TestTree t;
  auto & b = t.b;
  const auto out = analyze(*b.program({b.if_stmt(b.block({}), {})}));
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error->kind(), SemanticErrorKind::MalformedTree);
  EXPECT_EQ(out.message(), "Malformed syntax tree: Block is not an expression");
}
