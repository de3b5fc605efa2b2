// minilang/driver/checker.cpp - Checker driver implementation
//
#include "minilang/driver/checker.hpp"

#include <fmt/core.h>

#include <fstream>
#include <iostream>
#include <sstream>

#include "minilang/ast/ast_context.hpp"
#include "minilang/ast/json_reader.hpp"
#include "minilang/sema/semantic_analyzer.hpp"
#include "minilang/sema/semantic_error.hpp"

namespace minilang
{

namespace
{

std::optional<std::string> read_file(const std::filesystem::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void report_semantic_error(const SemanticError & e, DiagnosticBag & diags)
{
  auto builder = diags.report_error(e.range(), e.what());
  builder.with_code(std::string(e.code()));

  switch (e.kind()) {
    case SemanticErrorKind::MultipleDeclaration:
      if (e.related_range()) {
        builder.with_secondary_label(*e.related_range(), "first declared here");
      }
      builder.with_help("each identifier can be declared only once per program");
      break;
    case SemanticErrorKind::UndefinedIdentifier:
      builder.with_help(fmt::format("declare '{}' before using it", e.identifier()));
      break;
    case SemanticErrorKind::ReturnOutsideFunction:
      builder.with_help("'return' is only allowed inside a function body");
      break;
    default:
      break;
  }
}

}  // namespace

std::string CheckedUnit::display_path() const
{
  if (source && !source->get_path().empty()) {
    return source->get_path().string();
  }
  return path.string();
}

CheckResult Checker::check_file(const std::filesystem::path & file, const CheckOptions & options)
{
  CheckResult result;
  result.units.push_back(check_unit(file, options));
  finish(result, options.metrics_file);
  return result;
}

CheckResult Checker::check_project(const ProjectConfig & config, const CheckOptions & options)
{
  CheckResult result;

  namespace fs = std::filesystem;

  // Handle empty entry points
  if (config.check.entry_points.empty()) {
    result.diagnostics.report_error(
      SourceRange{}, "no entry points defined in project configuration");
    return result;
  }

  for (const auto & entry_rel : config.check.entry_points) {
    const fs::path entry_path = config.project_root / entry_rel;
    result.units.push_back(check_unit(entry_path, options));
  }

  // Determine metrics file
  std::optional<fs::path> metrics = options.metrics_file;
  if (!metrics && config.check.metrics_file) {
    metrics = config.project_root / *config.check.metrics_file;
  }

  finish(result, metrics);
  return result;
}

CheckedUnit Checker::check_unit(const std::filesystem::path & file, const CheckOptions & options)
{
  CheckedUnit unit;
  unit.path = file;

  namespace fs = std::filesystem;

  if (options.verbose) {
    std::cerr << "Checking: " << file.string() << "\n";
  }

  // Ensure file exists
  if (!fs::exists(file)) {
    unit.diagnostics.report_error(SourceRange{}, "file not found: " + file.string());
    return unit;
  }

  const auto text = read_file(file);
  if (!text) {
    unit.diagnostics.report_error(SourceRange{}, "failed to read file: " + file.string());
    return unit;
  }

  // Fresh arena per document
  AstContext ast;
  const AstDocument doc = load_ast_json(*text, ast, unit.diagnostics);

  if (doc.source_text) {
    unit.source.emplace(doc.source_path.value_or(file.string()), *doc.source_text);
  } else if (doc.source_path) {
    unit.source.emplace(*doc.source_path, "");
  }

  if (!doc.ok()) {
    return unit;
  }

  std::ostringstream sink;
  SemanticAnalyzer analyzer(sink);
  try {
    unit.metrics = analyzer.run(*doc.program);
    unit.summary = sink.str();
  } catch (const SemanticError & e) {
    report_semantic_error(e, unit.diagnostics);
  }

  if (options.verbose) {
    if (unit.metrics) {
      std::cerr << "  ok: " << unit.metrics->to_string() << "\n";
    } else {
      std::cerr << "  failed with " << unit.diagnostics.size() << " diagnostic(s)\n";
    }
  }

  return unit;
}

bool Checker::write_metrics(
  const std::filesystem::path & path, const std::vector<CheckedUnit> & units,
  DiagnosticBag & diags)
{
  namespace fs = std::filesystem;

  try {
    if (path.has_parent_path()) {
      fs::create_directories(path.parent_path());
    }
  } catch (const fs::filesystem_error & e) {
    diags.report_error(SourceRange{}, "failed to create directory: " + std::string(e.what()));
    return false;
  }

  std::ofstream out(path, std::ios::app);
  if (!out.is_open()) {
    diags.report_error(SourceRange{}, "failed to open metrics file: " + path.string());
    return false;
  }

  for (const auto & unit : units) {
    out << unit.summary;
  }
  return true;
}

void Checker::finish(CheckResult & result, const std::optional<std::filesystem::path> & metrics)
{
  bool unit_errors = false;
  for (const auto & unit : result.units) {
    if (unit.diagnostics.has_errors()) {
      unit_errors = true;
    }
  }

  if (metrics) {
    result.summaries_written = write_metrics(*metrics, result.units, result.diagnostics);
  }

  result.success = !unit_errors && !result.diagnostics.has_errors();
}

}  // namespace minilang
