#pragma once

/*
 MeshNode — one agent's membership in the local broadcast mesh

 Ownership
 - Owns the event loop (one io_context, one thread), the transport, the
   ConnectionRegistry, the InboundQueue and every task driven on the loop
   (listener, discovery, readers, broadcaster, context injector)

 Threading
 - Public methods are called from host threads, never from the loop.
   Work is marshalled onto the loop; the loop never blocks.

 Lifecycle
 - Initialize(): start the loop, bind the listener (client-only when the
   port is taken), run two discovery passes
 - StartContextLoop(): periodic discovery plus injection into the host
 - Cleanup(): cancel everything, close all Links, join the loop
*/

#include "mesh/broadcaster.hpp"
#include "mesh/connection_registry.hpp"
#include "mesh/context_injector.hpp"
#include "mesh/inbound_queue.hpp"
#include "mesh/mesh_config.hpp"
#include "mesh/peer_discovery.hpp"
#include "mesh/peer_listener.hpp"
#include "mesh/thought_sink.hpp"
#include "network/transport.hpp"
#include <atomic>
#include <utility>  // std::exchange, needed by boost/asio/awaitable.hpp under C++20
#include <boost/asio.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

namespace agentmesh {
namespace mesh {

// Outcome of a tool command
struct CommandResult {
  bool success{false};
  std::string message;
  std::string guidance;
  nlohmann::json metadata = nlohmann::json::object();
};

class MeshNode {
public:
  // Builds the transport on the node's io_context (tests inject in-memory
  // transports through this)
  using TransportFactory = std::function<std::shared_ptr<network::Transport>(
      boost::asio::io_context &)>;

  explicit MeshNode(MeshConfig config);
  MeshNode(MeshConfig config, TransportFactory transport_factory);
  ~MeshNode();

  MeshNode(const MeshNode&) = delete;
  MeshNode& operator=(const MeshNode&) = delete;

  /**
   * Start the loop, bind the listener and run the initial discovery passes.
   * Returns false if already initialized, if the configuration is invalid,
   * or if binding failed for a reason other than the port being in use.
   */
  bool Initialize();

  // Stop all tasks, close the listener and every Link, join the loop.
  // Safe to call more than once.
  void Cleanup();

  // Send text to every connected peer; true if at least one accepted it
  bool Broadcast(const std::string &text);

  // Listener bound or at least one live Link
  bool IsAvailable() const;

  // Begin scheduled discovery and delivery of peer messages to sink.
  // sink must outlive Cleanup().
  bool StartContextLoop(ThoughtSink &sink);

  /**
   * Tool commands:
   *   broadcast <message>  - metadata: recipients
   *   get_messages         - metadata: messages, count
   */
  CommandResult Execute(const std::string &command,
                        const std::vector<std::string> &args);

  // Run one discovery scan and wait for it; returns the new Link count
  size_t DiscoverPeers();

  // Introspection (any thread)
  const MeshConfig &config() const { return config_; }
  bool running() const { return running_.load(std::memory_order_acquire); }
  bool listening() const { return listening_.load(std::memory_order_acquire); }
  size_t link_count() const { return registry_.size(); }
  std::vector<uint16_t> connected_ports() const {
    return registry_.ConnectedPorts();
  }
  uint64_t dropped_messages() const { return queue_.dropped(); }
  size_t pending_messages() const { return queue_.size(); }
  double last_broadcast_time() const {
    return broadcaster_->last_broadcast_time();
  }

private:
  // Run fn on the loop thread and wait for its result
  template <typename Fn> auto RunOnLoop(Fn fn) -> decltype(fn());

  void StopLoop();
  void ScheduleDiscovery(std::chrono::milliseconds delay);
  std::chrono::milliseconds NextDiscoveryInterval() const;
  bool InLoopThread();

  MeshConfig config_;

  boost::asio::io_context io_context_;
  std::shared_ptr<network::Transport> transport_;

  ConnectionRegistry registry_;
  InboundQueue queue_;

  std::unique_ptr<PeerListener> listener_;
  std::unique_ptr<PeerDiscovery> discovery_;
  std::unique_ptr<Broadcaster> broadcaster_;
  std::unique_ptr<ContextInjector> injector_;
  boost::asio::steady_timer discovery_timer_;

  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::thread loop_thread_;

  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
  std::atomic<bool> listening_{false};

  // Event loop only
  bool context_active_{false};
  std::chrono::steady_clock::time_point context_started_;
};

} // namespace mesh
} // namespace agentmesh
