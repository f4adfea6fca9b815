#pragma once

#include "network/transport.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace agentmesh {
namespace mesh {

using LinkId = uint64_t;

// An established stream to one peer, tagged with the peer's port when known
struct Link {
  LinkId id{0};
  network::TransportConnectionPtr connection;
  std::optional<uint16_t> port;
  bool inbound{false};
};

/**
 * ConnectionRegistry - the node's record of its live Links and the set of
 * remote ports they occupy.
 *
 * Invariant: a port is held by at most one Link. Links are keyed by a
 * monotonically assigned LinkId and removed by key.
 *
 * Mutation happens on the event loop only; the mutex makes the read-only
 * accessors safe from other threads (availability checks, diagnostics).
 */
class ConnectionRegistry {
public:
  ConnectionRegistry() = default;

  ConnectionRegistry(const ConnectionRegistry&) = delete;
  ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

  /**
   * Insert a Link. Returns its id, or std::nullopt if port is already held
   * by another Link (nothing is inserted in that case).
   */
  std::optional<LinkId> Add(network::TransportConnectionPtr connection,
                            std::optional<uint16_t> port);

  // Remove a Link and release its port. Does not close the connection.
  // Returns false if the id is unknown (already removed).
  bool Remove(LinkId id);

  // Remove every Link, returning them so the caller can close them
  std::vector<Link> Clear();

  bool Contains(LinkId id) const;
  bool HasPort(uint16_t port) const;

  // Copy of the current Links, in insertion order
  std::vector<Link> Snapshot() const;

  // Sorted list of linked remote ports
  std::vector<uint16_t> ConnectedPorts() const;

  size_t size() const;
  bool empty() const { return size() == 0; }

private:
  mutable std::mutex mutex_;
  std::map<LinkId, Link> links_;
  std::set<uint16_t> ports_;
  LinkId next_id_{1};
};

} // namespace mesh
} // namespace agentmesh
