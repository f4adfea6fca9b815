#include "cli_options.hpp"
#include "mesh/mesh_config.hpp"
#include "util/string_parsing.hpp"
#include <cstdint>
#include <iostream>
#include <optional>

namespace agentmesh {
namespace app {

void PrintUsage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --name=<agent>       Agent name shown to peers (default: Agent)\n"
      << "  --host=<address>     Address to listen on and scan (default: 127.0.0.1)\n"
      << "  --port=<port>        Listen port (default: 54321)\n"
      << "  --range=<n>          Scan ports within +/- n of --port (default: 5)\n"
      << "  --timeout=<ms>       Connect timeout per scanned port (default: 500)\n"
      << "  --config=<path>      Load settings from a JSON file (flags override it)\n"
      << "  --noinput            Do not read messages from stdin\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, mesh, app, all\n"
      << "                       Can be comma-separated: --debug=network,mesh\n"
      << "  --logfile=<path>     Write logs to a rotating file instead of stdout\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

bool ParseCommandLine(const std::vector<std::string> &args, CommandLine &out,
                      std::string &error) {
  CommandLine parsed;
  std::string config_file;

  // Flags override the config file, so remember them and apply afterwards
  std::optional<std::string> name_flag;
  std::optional<std::string> host_flag;
  std::optional<uint16_t> port_flag;
  std::optional<int> range_flag;
  std::optional<int64_t> timeout_flag;

  for (const auto &arg : args) {
    if (arg == "--help") {
      out.show_help = true;
      return true;
    } else if (arg == "--version") {
      out.show_version = true;
      return true;
    } else if (arg.find("--name=") == 0) {
      name_flag = arg.substr(7);
      if (util::IsBlank(*name_flag)) {
        error = "Agent name must not be empty";
        return false;
      }
    } else if (arg.find("--host=") == 0) {
      host_flag = arg.substr(7);
      if (host_flag->empty()) {
        error = "Host must not be empty";
        return false;
      }
    } else if (arg.find("--port=") == 0) {
      auto port_opt = util::SafeParsePort(arg.substr(7));
      if (!port_opt) {
        error = "Invalid port number: " + arg.substr(7) +
                " (must be between 1 and 65535)";
        return false;
      }
      port_flag = *port_opt;
    } else if (arg.find("--range=") == 0) {
      auto range_opt = util::SafeParseInt(arg.substr(8), 1, 100);
      if (!range_opt) {
        error = "Invalid discovery range: " + arg.substr(8) +
                " (must be between 1 and 100)";
        return false;
      }
      range_flag = *range_opt;
    } else if (arg.find("--timeout=") == 0) {
      auto timeout_opt = util::SafeParseInt64(arg.substr(10), 1, 60000);
      if (!timeout_opt) {
        error = "Invalid connect timeout: " + arg.substr(10) +
                " (must be between 1 and 60000 ms)";
        return false;
      }
      timeout_flag = *timeout_opt;
    } else if (arg.find("--config=") == 0) {
      config_file = arg.substr(9);
    } else if (arg == "--noinput") {
      parsed.config.interactive = false;
    } else if (arg.find("--loglevel=") == 0) {
      parsed.log_level = arg.substr(11);
    } else if (arg.find("--logfile=") == 0) {
      parsed.log_file = arg.substr(10);
    } else if (arg.find("--debug=") == 0) {
      // Parse comma-separated components: --debug=network,mesh
      auto components = util::SplitCommaList(arg.substr(8));
      parsed.debug_components.insert(parsed.debug_components.end(),
                                     components.begin(), components.end());
    } else {
      error = "Unknown option: " + arg;
      out.unknown_option = true;
      return false;
    }
  }

  if (!config_file.empty() &&
      !mesh::LoadMeshConfigFile(config_file, parsed.config.mesh, error)) {
    return false;
  }

  if (name_flag) {
    parsed.config.mesh.agent_name = *name_flag;
  }
  if (host_flag) {
    parsed.config.mesh.host = *host_flag;
  }
  if (port_flag) {
    parsed.config.mesh.port = *port_flag;
  }
  if (range_flag) {
    parsed.config.mesh.discovery_range = *range_flag;
  }
  if (timeout_flag) {
    parsed.config.mesh.connect_timeout = std::chrono::milliseconds(*timeout_flag);
  }

  if (!mesh::ValidateMeshConfig(parsed.config.mesh, error)) {
    return false;
  }

  out = std::move(parsed);
  return true;
}

} // namespace app
} // namespace agentmesh
