#pragma once

#include "application.hpp"
#include <string>
#include <vector>

namespace agentmesh {
namespace app {

// Everything the command line selects
struct CommandLine {
  AppConfig config;

  std::string log_level{"info"};
  std::string log_file;
  std::vector<std::string> debug_components;

  bool show_help{false};
  bool show_version{false};

  // Set when parsing failed on an unrecognized flag
  bool unknown_option{false};
};

/**
 * Parse command-line flags (argv without the program name).
 *
 * --config=<path> is loaded first and the other flags override it; the
 * result is validated with ValidateMeshConfig. --help and --version stop
 * parsing and return true.
 *
 * On failure returns false and fills error.
 */
bool ParseCommandLine(const std::vector<std::string> &args, CommandLine &out,
                      std::string &error);

void PrintUsage(const char *program_name);

} // namespace app
} // namespace agentmesh
