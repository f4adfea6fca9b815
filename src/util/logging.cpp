// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace agentmesh {
namespace util {

static std::once_flag s_init_flag;

// Guards s_loggers (all reads and writes)
static std::mutex s_loggers_mutex;
static std::map<std::string, std::shared_ptr<spdlog::logger>> s_loggers;

static constexpr const char *kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

static void InitializeInternal(const std::string &log_level, bool log_to_file,
                               const std::string &log_file_path) {
  try {
    std::vector<spdlog::sink_ptr> sinks;

    if (log_to_file) {
      namespace fs = std::filesystem;
      try {
        fs::path p = log_file_path.empty() ? fs::path("agentmesh.log") : fs::path(log_file_path);
        if (p.has_parent_path() && !p.parent_path().empty()) {
          std::error_code ec;
          fs::create_directories(p.parent_path(), ec);
        }
        // 5MB per file, 3 files kept
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            p.string(), 5 * 1024 * 1024, 3);
        file_sink->set_pattern(kPattern);
        sinks.push_back(file_sink);
      } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Failed to initialize file logger (" << ex.what()
                  << "), falling back to console logging\n";
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern(kPattern);
        sinks.push_back(console_sink);
      }
    } else {
      auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_pattern(kPattern);
      sinks.push_back(console_sink);
    }

    std::vector<std::string> components = {"default", "network", "mesh", "app"};

    std::lock_guard<std::mutex> lock(s_loggers_mutex);

    for (const auto &component : components) {
      auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(),
                                                     sinks.end());
      logger->set_level(spdlog::level::from_str(log_level));
      logger->flush_on(spdlog::level::info);

      // A previous Shutdown() drops the registry; ignore duplicates otherwise
      if (!spdlog::get(component)) {
        spdlog::register_logger(logger);
      }
      s_loggers[component] = logger;
    }

    spdlog::set_default_logger(s_loggers["default"]);

    // Direct access: LOG_INFO would deadlock on s_loggers_mutex
    if (log_level != "off") {
      s_loggers["default"]->info("Logging system initialized (level: {})", log_level);
    }
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
  }
}

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  std::call_once(s_init_flag, InitializeInternal, log_level, log_to_file, log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  spdlog::shutdown();
  s_loggers.clear();
  // s_init_flag cannot be reset; GetLogger() installs a quiet fallback logger
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  Initialize();

  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  auto it = s_loggers.find(name);
  if (it != s_loggers.end()) {
    return it->second;
  }

  // Prior init failed or Shutdown() ran: install a minimal console logger
  if (s_loggers.empty()) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kPattern);
    auto logger = std::make_shared<spdlog::logger>("default", console_sink);
    logger->set_level(spdlog::level::off);
    s_loggers["default"] = logger;
    return logger;
  }

  return s_loggers["default"];
}

void LogManager::SetLogLevel(const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  if (s_loggers.empty()) {
    return;
  }

  auto log_level = spdlog::level::from_str(level);
  for (auto &[name, logger] : s_loggers) {
    logger->set_level(log_level);
  }

  if (s_loggers.count("default") > 0 && level != "off") {
    s_loggers["default"]->info("Log level changed to: {}", level);
  }
}

void LogManager::SetComponentLevel(const std::string &component, const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  if (s_loggers.empty()) {
    return;
  }

  auto it = s_loggers.find(component);
  if (it != s_loggers.end()) {
    it->second->set_level(spdlog::level::from_str(level));
    if (s_loggers.count("default") > 0 && level != "off") {
      s_loggers["default"]->info("Component '{}' log level set to: {}", component, level);
    }
  } else if (s_loggers.count("default") > 0 &&
             s_loggers["default"]->level() != spdlog::level::off) {
    s_loggers["default"]->warn("Unknown log component: {}", component);
  }
}

} // namespace util
} // namespace agentmesh
