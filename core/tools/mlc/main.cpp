// mlc - minilang checker command line interface
//
// Usage:
//   mlc check [file.json | --project] [--metrics-file <path>]
//   mlc dump <file.json>
//   mlc init <project-name>
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "minilang/ast/ast_builder.hpp"
#include "minilang/ast/ast_context.hpp"
#include "minilang/ast/json_reader.hpp"
#include "minilang/ast/json_visitor.hpp"
#include "minilang/basic/diagnostic_printer.hpp"
#include "minilang/driver/checker.hpp"
#include "minilang/project/project_config.hpp"

#include "command_args.hpp"

namespace fs = std::filesystem;

using minilang::cli::CommandArgs;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "minilang checker v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [file.json]        Type-check an AST document or project\n"
            << "  dump <file.json>         Print the normalized AST document\n"
            << "  init <project-name>      Initialize a new project\n\n"
            << "Options:\n"
            << "  --project                Check the project described by mlc.yaml\n"
            << "  --metrics-file <path>    Append summary lines to a file\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

bool use_color(bool disabled)
{
  // Detect if terminal supports colors (simple check for TTY)
  return !disabled && isatty(fileno(stderr)) != 0;
}

void print_result_diagnostics(
  const minilang::CheckResult & result, const std::string & default_filename, bool color)
{
  minilang::DiagnosticPrinter printer(std::cerr, color);

  for (const auto & unit : result.units) {
    if (!unit.diagnostics.empty()) {
      const minilang::SourceFile * source = unit.source ? &*unit.source : nullptr;
      printer.print_all(unit.diagnostics, source, unit.display_path());
    }
  }

  if (!result.diagnostics.empty()) {
    printer.print_all(result.diagnostics, nullptr, default_filename);
  }
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  minilang::CheckOptions options;
  options.verbose = args.verbose;
  if (!args.metrics_file.empty()) {
    options.metrics_file = fs::absolute(args.metrics_file);
  }

  minilang::CheckResult result;

  if (args.use_project || args.input_file.empty()) {
    // Project mode: find mlc.yaml
    auto config_path = minilang::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no " << minilang::k_project_config_file_name
                << " found in current directory or parents\n";
      return 1;
    }

    const auto config_result = minilang::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return 1;
    }

    if (args.verbose) {
      std::cerr << "Checking project: " << config_result.config.package.name << "\n";
    }

    result = minilang::Checker::check_project(config_result.config, options);
  } else {
    // Single file mode
    const fs::path input_path = fs::absolute(args.input_file);

    if (!fs::exists(input_path)) {
      std::cerr << "error: file not found: " << input_path.string() << "\n";
      return 1;
    }

    result = minilang::Checker::check_file(input_path, options);
  }

  // Summaries go to stdout unless a metrics file took them
  if (!result.summaries_written) {
    for (const auto & unit : result.units) {
      std::cout << unit.summary;
    }
  }

  print_result_diagnostics(
    result, args.input_file.empty() ? "project" : args.input_file, use_color(args.no_color));

  return result.success ? 0 : 1;
}

int cmd_dump(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: mlc dump <file.json>\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);

  std::ifstream file(input_path);
  if (!file.is_open()) {
    std::cerr << "error: failed to open file: " << input_path.string() << "\n";
    return 1;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  minilang::AstContext ast;
  minilang::DiagnosticBag diags;
  const auto doc = minilang::load_ast_json(buffer.str(), ast, diags);

  if (!doc.ok()) {
    minilang::DiagnosticPrinter printer(std::cerr, use_color(args.no_color));
    printer.print_all(diags, nullptr, args.input_file);
    return 1;
  }

  if (doc.source_text) {
    const minilang::SourceFile source(
      doc.source_path.value_or(args.input_file), *doc.source_text);
    std::cout << minilang::to_json_document(doc.program, &source).dump(2) << "\n";
  } else {
    std::cout << minilang::to_json_document(doc.program, nullptr).dump(2) << "\n";
  }
  return 0;
}

/// Example program: bool b; if (b) { num x; x = 1 + 2; }
nlohmann::json example_document()
{
  using minilang::BinaryOp;
  using minilang::ValueType;

  minilang::AstContext ast;
  minilang::AstBuilder b(ast);

  auto * program = b.program({
    b.declaration(ValueType::Bool, "b"),
    b.if_stmt(
      b.var("b"),
      {
        b.declaration(ValueType::Number, "x"),
        b.assign("x", b.add(b.int_value(1), BinaryOp::Add, b.int_value(2))),
      }),
  });

  const minilang::SourceFile source(
    "src/main.ml", "bool b;\nif (b) {\n  num x;\n  x = 1 + 2;\n}\n");
  return minilang::to_json_document(program, &source);
}

int cmd_init(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: project name required\n";
    std::cerr << "usage: mlc init <project-name>\n";
    return 1;
  }

  const fs::path project_dir = fs::current_path() / args.input_file;

  if (fs::exists(project_dir)) {
    std::cerr << "error: directory already exists: " << project_dir.string() << "\n";
    return 1;
  }

  try {
    fs::create_directories(project_dir / "ast");

    // Create mlc.yaml
    std::ofstream config(project_dir / minilang::k_project_config_file_name);
    config << "package:\n"
           << "  name: '" << args.input_file << "'\n"
           << "  version: '0.1.0'\n\n"
           << "check:\n"
           << "  entry_points:\n"
           << "    - './ast/main.json'\n";
    config.close();

    // Create ast/main.json
    std::ofstream main(project_dir / "ast" / "main.json");
    main << example_document().dump(2) << "\n";
    main.close();

    std::cout << "Initialized new minilang project in " << project_dir.string() << "\n";
    std::cout << "\nNext steps:\n"
              << "  cd " << args.input_file << "\n"
              << "  mlc check\n";

    return 0;
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = minilang::cli::parse_args(argc, argv);

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n\n";
    print_usage(argv[0]);
    return 1;
  }

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "dump") {
    return cmd_dump(args);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
