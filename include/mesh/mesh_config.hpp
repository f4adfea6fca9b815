#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace agentmesh {
namespace mesh {

// Defaults for a node joining the local agent mesh
namespace defaults {
inline constexpr const char *HOST = "127.0.0.1";
inline constexpr uint16_t PORT = 54321;
inline constexpr int DISCOVERY_RANGE = 5;
inline constexpr size_t QUEUE_CAPACITY = 100;
inline constexpr size_t MAX_MESSAGE_LENGTH = 5000;
inline constexpr size_t MAX_LINE_BYTES = 64 * 1024;
inline constexpr const char *SOURCE_TAG = "group_chat";
} // namespace defaults

struct MeshConfig {
  std::string agent_name{"Agent"};
  std::string host{defaults::HOST};
  uint16_t port{defaults::PORT};

  // Discovery scans port +/- discovery_range (offset 0 excluded)
  int discovery_range{defaults::DISCOVERY_RANGE};
  std::chrono::milliseconds connect_timeout{500};

  // Initial passes: after settle_delay, then again after second_pass_delay
  std::chrono::milliseconds settle_delay{200};
  std::chrono::milliseconds second_pass_delay{500};

  // Adaptive cadence once the context loop runs
  std::chrono::milliseconds warmup_window{30000};
  std::chrono::milliseconds warmup_interval{5000};
  std::chrono::milliseconds steady_interval{30000};

  std::chrono::milliseconds drain_interval{500};
  std::chrono::milliseconds broadcast_timeout{1000};

  size_t queue_capacity{defaults::QUEUE_CAPACITY};
  size_t max_message_length{defaults::MAX_MESSAGE_LENGTH};
  size_t max_line_bytes{defaults::MAX_LINE_BYTES};
};

/**
 * Load overrides from a JSON config file into config.
 *
 * Recognized keys: agent_name, host, port, discovery_range,
 * connect_timeout_ms, settle_delay_ms, second_pass_delay_ms,
 * warmup_window_ms, warmup_interval_ms, steady_interval_ms,
 * drain_interval_ms, broadcast_timeout_ms, queue_capacity,
 * max_message_length, max_line_bytes. Unknown keys are ignored.
 *
 * On failure returns false, fills error, and leaves config untouched.
 */
bool LoadMeshConfigFile(const std::string &path, MeshConfig &config,
                        std::string &error);

// Validate ranges; fills error and returns false on the first problem
bool ValidateMeshConfig(const MeshConfig &config, std::string &error);

} // namespace mesh
} // namespace agentmesh
