// mlc/command_args.hpp - Command line parsing for mlc
#pragma once

#include <string>

namespace minilang::cli
{

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string metrics_file;
  bool use_project = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;

  /// Usage error, empty when the command line is well-formed
  std::string error;
};

CommandArgs parse_args(int argc, const char * const * argv);

}  // namespace minilang::cli
