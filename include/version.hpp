// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace agentmesh {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 1;
constexpr int CLIENT_VERSION_MINOR = 0;
constexpr int CLIENT_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Unicity Foundation";

inline std::string GetFullVersionString() {
  return "agentmesh version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// ANSI color codes
namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *BLUE = "\033[1;34m";
} // namespace colors

// Startup banner printed before the logger takes over stdout
inline std::string GetStartupBanner(const std::string &agent_name,
                                    const std::string &endpoint) {
  const char *color = colors::BLUE;

  std::string banner;
  banner += "\n";
  banner += color;
  banner += "+-------------------------------------------------+\n";
  banner += "|  agentmesh " + GetVersionString();
  banner += std::string(37 - GetVersionString().length(), ' ') + "|\n";
  banner += "+-------------------------------------------------+\n";
  std::string agent_line = "  Agent:    " + agent_name;
  std::string endpoint_line = "  Endpoint: " + endpoint;
  for (const auto *line : {&agent_line, &endpoint_line}) {
    banner += "|" + *line;
    if (line->length() < 49) {
      banner += std::string(49 - line->length(), ' ');
    }
    banner += "|\n";
  }
  banner += "+-------------------------------------------------+";
  banner += colors::RESET;
  banner += "\n\n";

  return banner;
}

} // namespace agentmesh
