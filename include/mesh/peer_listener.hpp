#pragma once

#include "mesh/peer_reader.hpp"
#include "network/transport.hpp"
#include <cstdint>
#include <set>
#include <string>

namespace agentmesh {
namespace mesh {

/**
 * PeerListener - accepts inbound Links on the node's own port
 *
 * Each accepted connection is inserted into the registry before its
 * reader starts, so a discovery scan from the same peer racing with the
 * accept cannot produce a duplicate entry for its port.
 *
 * Remote ports listed in window_ports are never tagged: an ephemeral
 * source port that falls inside the discovery window would otherwise
 * hide the listener that owns that port from discovery.
 */
class PeerListener {
public:
  PeerListener(network::Transport &transport, PeerReader::Context ctx,
               std::set<uint16_t> window_ports = {});
  ~PeerListener();

  PeerListener(const PeerListener&) = delete;
  PeerListener& operator=(const PeerListener&) = delete;

  /**
   * Bind and start accepting. AddressInUse means another node already
   * owns the port; the caller continues in client-only mode.
   */
  network::ListenResult Start(const std::string &host, uint16_t port);

  void Stop();

  bool listening() const { return listening_; }
  uint64_t accepted_count() const { return accepted_; }

private:
  void HandleAccepted(network::TransportConnectionPtr conn);

  network::Transport &transport_;
  PeerReader::Context ctx_;
  std::set<uint16_t> window_ports_;
  bool listening_{false};
  uint64_t accepted_{0};
};

} // namespace mesh
} // namespace agentmesh
