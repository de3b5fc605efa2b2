// mlc/command_args.cpp - Command line parsing for mlc
#include "command_args.hpp"

namespace minilang::cli
{

CommandArgs parse_args(int argc, const char * const * argv)
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--metrics-file") {
      if (i + 1 >= argc) {
        args.error = "--metrics-file requires a path";
        return args;
      }
      args.metrics_file = argv[++i];
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

}  // namespace minilang::cli
