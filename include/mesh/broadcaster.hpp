#pragma once

#include "mesh/connection_registry.hpp"
#include <atomic>
#include <utility>  // std::exchange, needed by boost/asio/awaitable.hpp under C++20
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <string>

namespace agentmesh {
namespace mesh {

/**
 * Broadcaster - fan-out of one local message to every Link
 *
 * BroadcastAsync() runs on the event loop. The record is encoded once and
 * written to a snapshot of the registry; each write completes
 * independently. When every write has completed, Links whose write failed
 * are removed from the registry and closed, and the caller learns whether
 * at least one peer accepted the bytes.
 *
 * BroadcastSync() is the bridge for host threads: it posts BroadcastAsync()
 * onto the loop and waits a bounded time for the outcome.
 */
class Broadcaster {
public:
  using RunningCheck = std::function<bool()>;
  using DoneCallback = std::function<void(bool delivered)>;

  Broadcaster(boost::asio::io_context &io_context, ConnectionRegistry &registry,
              std::string agent_name, size_t max_message_length,
              std::chrono::milliseconds sync_timeout, RunningCheck is_running);

  Broadcaster(const Broadcaster&) = delete;
  Broadcaster& operator=(const Broadcaster&) = delete;

  // Event loop only. on_done is called exactly once.
  void BroadcastAsync(const std::string &text, DoneCallback on_done);

  // Any thread except the event loop's
  bool BroadcastSync(const std::string &text);

  // Unix time (fractional seconds) of the last delivered broadcast, 0 if none
  double last_broadcast_time() const {
    return last_broadcast_time_.load(std::memory_order_relaxed);
  }
  uint64_t broadcasts_delivered() const {
    return delivered_.load(std::memory_order_relaxed);
  }

private:
  struct Fanout;
  void OnWriteDone(const std::shared_ptr<Fanout> &fanout, const Link &link,
                   bool ok);

  boost::asio::io_context &io_context_;
  ConnectionRegistry &registry_;
  const std::string agent_name_;
  const size_t max_message_length_;
  const std::chrono::milliseconds sync_timeout_;
  RunningCheck is_running_;

  std::atomic<double> last_broadcast_time_{0.0};
  std::atomic<uint64_t> delivered_{0};
};

} // namespace mesh
} // namespace agentmesh
