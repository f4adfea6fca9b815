#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace agentmesh {
namespace mesh {

// One chat line exchanged between agents
struct MeshMessage {
  std::string agent;
  std::string message;
  double timestamp{0.0};
};

// Agent name assumed when a record carries none
inline constexpr const char *UNKNOWN_AGENT = "Unknown";

/**
 * Encode a message as a single wire record:
 *   {"agent":"...","message":"...","timestamp":1700000000.5}\n
 *
 * Invalid UTF-8 in the text fields is replaced with U+FFFD.
 */
std::string EncodeMessage(const MeshMessage &msg);

/**
 * Decode one wire record. A trailing "\n" or "\r\n" is accepted.
 *
 * Returns std::nullopt when the line is not a JSON object or a field has
 * the wrong type. Missing fields take defaults: agent "Unknown",
 * message "", timestamp 0.
 */
std::optional<MeshMessage> DecodeMessage(std::string_view line);

} // namespace mesh
} // namespace agentmesh
