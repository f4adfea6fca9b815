#include "application.hpp"
#include "cli_options.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <string>
#include <vector>

int main(int argc, char *argv[]) {
  try {
    std::vector<std::string> args(argv + 1, argv + argc);

    agentmesh::app::CommandLine cmd;
    std::string error;
    if (!agentmesh::app::ParseCommandLine(args, cmd, error)) {
      std::cerr << "Error: " << error << std::endl;
      if (cmd.unknown_option) {
        agentmesh::app::PrintUsage(argv[0]);
      }
      return 1;
    }

    if (cmd.show_help) {
      agentmesh::app::PrintUsage(argv[0]);
      return 0;
    }
    if (cmd.show_version) {
      std::cout << agentmesh::GetFullVersionString() << std::endl;
      std::cout << agentmesh::GetCopyrightString() << std::endl;
      return 0;
    }

    const std::string &log_file = cmd.log_file;
    agentmesh::util::LogManager::Initialize(cmd.log_level, !log_file.empty(),
                                            log_file.empty() ? "agentmesh.log" : log_file);

    // Apply component-specific debug levels
    for (const auto& component : cmd.debug_components) {
      if (component == "all") {
        agentmesh::util::LogManager::SetLogLevel("trace");
      } else if (component == "net" || component == "network") {
        agentmesh::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        agentmesh::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    // Loop callbacks must not log after the logger is destroyed
    {
      agentmesh::app::Application app(cmd.config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        return 1;
      }

      // Run until shutdown requested
      app.wait_for_shutdown();
    }

    agentmesh::util::LogManager::Shutdown();

    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    agentmesh::util::LogManager::Shutdown();
    return 1;
  }
}
