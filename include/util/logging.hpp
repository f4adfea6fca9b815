// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace agentmesh {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the application.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of stdout
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Thread-safe: Uses std::call_once internally. Multiple calls are safe;
   * only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "agentmesh.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name ("default", "network", "mesh", "app")
   *
   * Auto-initializes if not initialized. Unknown names return the
   * default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  // Set log level for a single component
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace agentmesh

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  agentmesh::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  agentmesh::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  agentmesh::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  agentmesh::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  agentmesh::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  agentmesh::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  agentmesh::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  agentmesh::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  agentmesh::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  agentmesh::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_MESH_TRACE(...)                                                    \
  agentmesh::util::LogManager::GetLogger("mesh")->trace(__VA_ARGS__)
#define LOG_MESH_DEBUG(...)                                                    \
  agentmesh::util::LogManager::GetLogger("mesh")->debug(__VA_ARGS__)
#define LOG_MESH_INFO(...)                                                     \
  agentmesh::util::LogManager::GetLogger("mesh")->info(__VA_ARGS__)
#define LOG_MESH_WARN(...)                                                     \
  agentmesh::util::LogManager::GetLogger("mesh")->warn(__VA_ARGS__)
#define LOG_MESH_ERROR(...)                                                    \
  agentmesh::util::LogManager::GetLogger("mesh")->error(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  agentmesh::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  agentmesh::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  agentmesh::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
