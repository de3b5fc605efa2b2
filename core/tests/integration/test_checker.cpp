// tests/integration/test_checker.cpp - Checker driver over files on disk
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "minilang/driver/checker.hpp"
#include "minilang/project/project_config.hpp"

using namespace minilang;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::remove_all(path);
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

std::string read_file(const std::filesystem::path & p)
{
  std::ifstream in(p, std::ios::binary);
  if (!in.is_open()) {
    throw std::runtime_error("failed to open file: " + p.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_file(const std::filesystem::path & p, const std::string & content)
{
  std::filesystem::create_directories(p.parent_path());
  std::ofstream out(p, std::ios::binary);
  if (!out.is_open()) {
    throw std::runtime_error("failed to write file: " + p.string());
  }
  out << content;
}

// num a; a = 1;
constexpr const char * k_valid_doc = R"({
  "source": { "path": "main.ml", "text": "num a;\na = 1;\n" },
  "program": { "kind": "Program", "children": [
    { "kind": "Declaration", "value": "num", "range": { "start": 0, "end": 6 },
      "children": [ { "kind": "Identifier", "value": "a", "range": { "start": 4, "end": 5 } } ] },
    { "kind": "AssignStmt", "range": { "start": 7, "end": 13 }, "children": [
      { "kind": "Identifier", "value": "a", "range": { "start": 7, "end": 8 } },
      { "kind": "IntValue", "value": 1, "range": { "start": 11, "end": 12 } } ] }
  ] }
})";

// num a; bool a;
constexpr const char * k_duplicate_doc = R"({
  "source": { "path": "dup.ml", "text": "num a;\nbool a;\n" },
  "program": { "kind": "Program", "children": [
    { "kind": "Declaration", "value": "num", "range": { "start": 0, "end": 6 },
      "children": [ { "kind": "Identifier", "value": "a", "range": { "start": 4, "end": 5 } } ] },
    { "kind": "Declaration", "value": "bool", "range": { "start": 7, "end": 14 },
      "children": [ { "kind": "Identifier", "value": "a", "range": { "start": 12, "end": 13 } } ] }
  ] }
})";

// x = y; with nothing declared, no source text
constexpr const char * k_undeclared_doc = R"({ "kind": "Program", "children": [
  { "kind": "Declaration", "value": "num", "children": [ { "kind": "Identifier", "value": "x" } ] },
  { "kind": "AssignStmt", "children": [
    { "kind": "Identifier", "value": "x" },
    { "kind": "GenValue", "children": [ { "kind": "Identifier", "value": "y" } ] } ] }
] })";

}  // namespace

// ============================================================================
// Single file
// ============================================================================

TEST(IntegrationChecker, ValidFileProducesSummary)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "minilang_check_valid");
  write_file(dir.path / "main.json", k_valid_doc);

  const auto result = Checker::check_file(dir.path / "main.json", {});
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.units.size(), 1U);

  const auto & unit = result.units[0];
  EXPECT_TRUE(unit.diagnostics.empty());
  ASSERT_TRUE(unit.metrics.has_value());
  EXPECT_EQ(unit.metrics->variables, 1U);
  EXPECT_EQ(unit.summary, "{VAR:1, WHILE:0, IF:0, FUNC:0, OP:0}\n");
  ASSERT_TRUE(unit.source.has_value());
  EXPECT_EQ(unit.display_path(), "main.ml");
  EXPECT_FALSE(result.summaries_written);
}

TEST(IntegrationChecker, SemanticErrorBecomesDiagnostic)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "minilang_check_dup");
  write_file(dir.path / "dup.json", k_duplicate_doc);

  const auto result = Checker::check_file(dir.path / "dup.json", {});
  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.units.size(), 1U);

  const auto & unit = result.units[0];
  EXPECT_FALSE(unit.metrics.has_value());
  EXPECT_TRUE(unit.summary.empty());
  ASSERT_EQ(unit.diagnostics.size(), 1U);

  const Diagnostic & d = unit.diagnostics.all()[0];
  EXPECT_EQ(d.code, "E001");
  EXPECT_EQ(d.message, "Identifier a has multiple declarations");
  EXPECT_EQ(d.primary_range().get_begin().get_offset(), 12U);
  ASSERT_EQ(d.labels.size(), 2U);
  EXPECT_EQ(d.labels[1].style, LabelStyle::Secondary);
  EXPECT_EQ(d.labels[1].message, "first declared here");
  EXPECT_TRUE(d.help_message.has_value());
}

TEST(IntegrationChecker, UndefinedIdentifierHelp)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "minilang_check_undef");
  write_file(dir.path / "undef.json", k_undeclared_doc);

  const auto result = Checker::check_file(dir.path / "undef.json", {});
  EXPECT_FALSE(result.success);

  const auto & unit = result.units[0];
  EXPECT_FALSE(unit.source.has_value());
  EXPECT_EQ(unit.display_path(), (dir.path / "undef.json").string());
  ASSERT_EQ(unit.diagnostics.size(), 1U);
  const Diagnostic & d = unit.diagnostics.all()[0];
  EXPECT_EQ(d.code, "E006");
  EXPECT_EQ(d.message, "Invalid use of undefined Identifier y");
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "declare 'y' before using it");
}

TEST(IntegrationChecker, LoadErrorStopsBeforeAnalysis)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "minilang_check_bad");
  write_file(dir.path / "bad.json", R"({ "kind": "Program", "children": [ { "kind": "Loop" } ] })");

  const auto result = Checker::check_file(dir.path / "bad.json", {});
  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.units[0].diagnostics.size(), 1U);
  EXPECT_EQ(result.units[0].diagnostics.all()[0].code, "A001");
  EXPECT_FALSE(result.units[0].metrics.has_value());
}

TEST(IntegrationChecker, MissingFile)
{
  const auto missing = std::filesystem::temp_directory_path() / "minilang_nope" / "x.json";
  const auto result = Checker::check_file(missing, {});
  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.units[0].diagnostics.size(), 1U);
  EXPECT_EQ(result.units[0].diagnostics.all()[0].message, "file not found: " + missing.string());
}

TEST(IntegrationChecker, MetricsFileReceivesSummary)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "minilang_check_metrics");
  write_file(dir.path / "main.json", k_valid_doc);

  CheckOptions options;
  options.metrics_file = dir.path / "out" / "metrics.txt";

  const auto first = Checker::check_file(dir.path / "main.json", options);
  const auto second = Checker::check_file(dir.path / "main.json", options);
  ASSERT_TRUE(first.success);
  EXPECT_TRUE(first.summaries_written);
  EXPECT_TRUE(second.summaries_written);

  // Appended, one line per successful run
  EXPECT_EQ(
    read_file(*options.metrics_file),
    "{VAR:1, WHILE:0, IF:0, FUNC:0, OP:0}\n{VAR:1, WHILE:0, IF:0, FUNC:0, OP:0}\n");
}

// ============================================================================
// Project
// ============================================================================

TEST(IntegrationChecker, ProjectChecksEveryEntryPoint)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "minilang_check_project");
  write_file(dir.path / "ast" / "main.json", k_valid_doc);
  write_file(dir.path / "ast" / "dup.json", k_duplicate_doc);
  write_file(
    dir.path / k_project_config_file_name,
    "package:\n"
    "  name: demo\n"
    "check:\n"
    "  entry_points:\n"
    "    - ast/main.json\n"
    "    - ast/dup.json\n"
    "  metrics_file: build/metrics.txt\n");

  const auto loaded = load_project_config(dir.path / k_project_config_file_name);
  ASSERT_TRUE(loaded.success) << loaded.error;

  const auto result = Checker::check_project(loaded.config, {});
  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.units.size(), 2U);
  EXPECT_TRUE(result.units[0].metrics.has_value());
  EXPECT_TRUE(result.units[1].diagnostics.has_errors());

  // Only the successful unit contributes a line
  EXPECT_TRUE(result.summaries_written);
  EXPECT_EQ(
    read_file(dir.path / "build" / "metrics.txt"), "{VAR:1, WHILE:0, IF:0, FUNC:0, OP:0}\n");
}

TEST(IntegrationChecker, ProjectWithoutEntryPoints)
{
  ProjectConfig config;
  config.project_root = std::filesystem::temp_directory_path();

  const auto result = Checker::check_project(config, {});
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.units.empty());
  ASSERT_EQ(result.diagnostics.size(), 1U);
  EXPECT_EQ(
    result.diagnostics.all()[0].message, "no entry points defined in project configuration");
}
