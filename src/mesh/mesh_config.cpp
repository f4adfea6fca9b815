#include "mesh/mesh_config.hpp"
#include "util/logging.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

namespace agentmesh {
namespace mesh {

namespace {

using json = nlohmann::json;

bool ReadMillis(const json &root, const char *key,
                std::chrono::milliseconds &out, std::string &error) {
  auto it = root.find(key);
  if (it == root.end()) {
    return true;
  }
  if (!it->is_number_integer() || it->get<int64_t>() < 0) {
    error = std::string(key) + " must be a non-negative integer";
    return false;
  }
  out = std::chrono::milliseconds(it->get<int64_t>());
  return true;
}

bool ReadSize(const json &root, const char *key, size_t &out,
              std::string &error) {
  auto it = root.find(key);
  if (it == root.end()) {
    return true;
  }
  if (!it->is_number_unsigned()) {
    error = std::string(key) + " must be a non-negative integer";
    return false;
  }
  out = it->get<size_t>();
  return true;
}

bool ReadString(const json &root, const char *key, std::string &out,
                std::string &error) {
  auto it = root.find(key);
  if (it == root.end()) {
    return true;
  }
  if (!it->is_string()) {
    error = std::string(key) + " must be a string";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

} // namespace

bool LoadMeshConfigFile(const std::string &path, MeshConfig &config,
                        std::string &error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "cannot open config file: " + path;
    return false;
  }

  json root = json::parse(file, nullptr, false);
  if (root.is_discarded() || !root.is_object()) {
    error = "config file is not a JSON object: " + path;
    return false;
  }

  MeshConfig loaded = config;

  if (!ReadString(root, "agent_name", loaded.agent_name, error) ||
      !ReadString(root, "host", loaded.host, error)) {
    return false;
  }

  if (auto it = root.find("port"); it != root.end()) {
    if (!it->is_number_integer() || it->get<int64_t>() < 1 ||
        it->get<int64_t>() > 65535) {
      error = "port must be an integer between 1 and 65535";
      return false;
    }
    loaded.port = static_cast<uint16_t>(it->get<int64_t>());
  }

  if (auto it = root.find("discovery_range"); it != root.end()) {
    if (!it->is_number_integer() || it->get<int64_t>() < 1 ||
        it->get<int64_t>() > 100) {
      error = "discovery_range must be an integer between 1 and 100";
      return false;
    }
    loaded.discovery_range = static_cast<int>(it->get<int64_t>());
  }

  if (!ReadMillis(root, "connect_timeout_ms", loaded.connect_timeout, error) ||
      !ReadMillis(root, "settle_delay_ms", loaded.settle_delay, error) ||
      !ReadMillis(root, "second_pass_delay_ms", loaded.second_pass_delay, error) ||
      !ReadMillis(root, "warmup_window_ms", loaded.warmup_window, error) ||
      !ReadMillis(root, "warmup_interval_ms", loaded.warmup_interval, error) ||
      !ReadMillis(root, "steady_interval_ms", loaded.steady_interval, error) ||
      !ReadMillis(root, "drain_interval_ms", loaded.drain_interval, error) ||
      !ReadMillis(root, "broadcast_timeout_ms", loaded.broadcast_timeout, error)) {
    return false;
  }

  if (!ReadSize(root, "queue_capacity", loaded.queue_capacity, error) ||
      !ReadSize(root, "max_message_length", loaded.max_message_length, error) ||
      !ReadSize(root, "max_line_bytes", loaded.max_line_bytes, error)) {
    return false;
  }

  if (!ValidateMeshConfig(loaded, error)) {
    return false;
  }

  config = loaded;
  LOG_DEBUG("Loaded config from {}", path);
  return true;
}

bool ValidateMeshConfig(const MeshConfig &config, std::string &error) {
  if (config.agent_name.empty()) {
    error = "agent_name must not be empty";
    return false;
  }
  if (config.host.empty()) {
    error = "host must not be empty";
    return false;
  }
  if (config.port == 0) {
    error = "port must be between 1 and 65535";
    return false;
  }
  if (config.discovery_range < 1 || config.discovery_range > 100) {
    error = "discovery_range must be between 1 and 100";
    return false;
  }
  if (config.connect_timeout.count() <= 0) {
    error = "connect_timeout must be positive";
    return false;
  }
  if (config.warmup_interval.count() <= 0 || config.steady_interval.count() <= 0 ||
      config.drain_interval.count() <= 0) {
    error = "discovery and drain intervals must be positive";
    return false;
  }
  if (config.broadcast_timeout.count() <= 0) {
    error = "broadcast_timeout must be positive";
    return false;
  }
  if (config.queue_capacity == 0) {
    error = "queue_capacity must be positive";
    return false;
  }
  if (config.max_message_length == 0 || config.max_line_bytes == 0) {
    error = "message and line limits must be positive";
    return false;
  }
  return true;
}

} // namespace mesh
} // namespace agentmesh
