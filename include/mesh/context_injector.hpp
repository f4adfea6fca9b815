#pragma once

#include "mesh/inbound_queue.hpp"
#include "mesh/thought_sink.hpp"
#include <utility>  // std::exchange, needed by boost/asio/awaitable.hpp under C++20
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace agentmesh {
namespace mesh {

/**
 * ContextInjector - periodic hand-off from the InboundQueue to the host
 *
 * Every drain interval the queue is emptied; messages from other agents
 * with non-empty text reach the sink as "{agent} said: {message}".
 * Messages authored under this node's own name are dropped here, and only
 * here.
 */
class ContextInjector {
public:
  using RunningCheck = std::function<bool()>;

  ContextInjector(boost::asio::io_context &io_context, InboundQueue &queue,
                  std::string agent_name, std::chrono::milliseconds interval,
                  RunningCheck is_running);
  ~ContextInjector();

  ContextInjector(const ContextInjector&) = delete;
  ContextInjector& operator=(const ContextInjector&) = delete;

  // Begin periodic draining into sink (event loop only)
  void Start(ThoughtSink &sink);
  void Stop();

  bool active() const { return active_; }

  // Run one drain pass now; returns the number of messages handed to the sink
  size_t DrainOnce();

  uint64_t injected_count() const { return injected_; }
  uint64_t self_filtered_count() const { return self_filtered_; }

private:
  void ScheduleNext();

  boost::asio::steady_timer timer_;
  InboundQueue &queue_;
  const std::string agent_name_;
  const std::chrono::milliseconds interval_;
  RunningCheck is_running_;

  ThoughtSink *sink_{nullptr};
  bool active_{false};
  uint64_t injected_{0};
  uint64_t self_filtered_{0};
};

} // namespace mesh
} // namespace agentmesh
