#include "mesh/wire_codec.hpp"
#include "util/logging.hpp"
#include <nlohmann/json.hpp>

namespace agentmesh {
namespace mesh {

std::string EncodeMessage(const MeshMessage &msg) {
  using json = nlohmann::json;
  json record;
  record["agent"] = msg.agent;
  record["message"] = msg.message;
  record["timestamp"] = msg.timestamp;

  std::string encoded =
      record.dump(-1, ' ', false, json::error_handler_t::replace);
  encoded.push_back('\n');
  return encoded;
}

std::optional<MeshMessage> DecodeMessage(std::string_view line) {
  using json = nlohmann::json;

  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.remove_suffix(1);
  }

  json record = json::parse(line.begin(), line.end(), nullptr, false);
  if (record.is_discarded()) {
    LOG_MESH_TRACE("wire record is not valid JSON");
    return std::nullopt;
  }
  if (!record.is_object()) {
    LOG_MESH_TRACE("wire record is not a JSON object");
    return std::nullopt;
  }

  MeshMessage msg;
  msg.agent = UNKNOWN_AGENT;

  if (auto it = record.find("agent"); it != record.end()) {
    if (!it->is_string()) {
      return std::nullopt;
    }
    msg.agent = it->get<std::string>();
  }

  if (auto it = record.find("message"); it != record.end()) {
    if (!it->is_string()) {
      return std::nullopt;
    }
    msg.message = it->get<std::string>();
  }

  if (auto it = record.find("timestamp"); it != record.end() && it->is_number()) {
    msg.timestamp = it->get<double>();
  }

  return msg;
}

} // namespace mesh
} // namespace agentmesh
