#pragma once

#include "mesh/connection_registry.hpp"
#include "mesh/inbound_queue.hpp"
#include "network/transport.hpp"
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace agentmesh {
namespace mesh {

/**
 * PeerReader - drains one Link
 *
 * Frames newline-terminated records, decodes them and pushes every decoded
 * message to the InboundQueue (no authorship filtering here). Malformed
 * lines are logged and skipped. On end of stream or read error the reader
 * closes its Link and removes it from the registry; that teardown happens
 * exactly once.
 *
 * The reader is kept alive by the callbacks it installs on the connection
 * and holds only a weak reference back to it.
 */
class PeerReader : public std::enable_shared_from_this<PeerReader> {
public:
  using RunningCheck = std::function<bool()>;

  /**
   * Attach a reader to a Link that is already in the registry and start
   * the stream. Must be called on the event loop.
   */
  static std::shared_ptr<PeerReader> Spawn(const Link &link,
                                           ConnectionRegistry &registry,
                                           InboundQueue &queue,
                                           size_t max_line_bytes,
                                           RunningCheck is_running);

  // Everything needed to register a new Link and start its reader
  struct Context {
    ConnectionRegistry &registry;
    InboundQueue &queue;
    size_t max_line_bytes;
    RunningCheck is_running;
  };

  static std::shared_ptr<PeerReader> Spawn(const Link &link, const Context &ctx) {
    return Spawn(link, ctx.registry, ctx.queue, ctx.max_line_bytes, ctx.is_running);
  }

  PeerReader(const PeerReader&) = delete;
  PeerReader& operator=(const PeerReader&) = delete;

  LinkId link_id() const { return link_id_; }
  bool closed() const { return closed_; }

  void OnData(std::string_view data);
  void OnDisconnect();

private:
  PeerReader(const Link &link, ConnectionRegistry &registry,
             InboundQueue &queue, size_t max_line_bytes,
             RunningCheck is_running);

  void HandleLine(std::string_view line);
  void CloseLink();

  const LinkId link_id_;
  const std::optional<uint16_t> port_;
  std::weak_ptr<network::TransportConnection> connection_;
  ConnectionRegistry &registry_;
  InboundQueue &queue_;
  const size_t max_line_bytes_;
  RunningCheck is_running_;

  std::string buffer_;
  bool closed_{false};
};

} // namespace mesh
} // namespace agentmesh
