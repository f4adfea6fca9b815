#pragma once

#include "mesh/wire_codec.hpp"
#include <atomic>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace agentmesh {
namespace mesh {

/**
 * InboundQueue - bounded FIFO between Peer Readers and the Context Injector
 *
 * When full, the newest message is dropped (not the oldest) and counted.
 * Readers never block on it.
 */
class InboundQueue {
public:
  explicit InboundQueue(size_t capacity);

  InboundQueue(const InboundQueue&) = delete;
  InboundQueue& operator=(const InboundQueue&) = delete;

  // Returns false (and counts a drop) when the queue is full
  bool Push(MeshMessage msg);

  std::optional<MeshMessage> TryPop();

  // Remove and return everything queued
  std::vector<MeshMessage> Drain();

  size_t size() const;
  bool empty() const { return size() == 0; }
  size_t capacity() const { return capacity_; }
  uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<MeshMessage> messages_;
  std::atomic<uint64_t> dropped_{0};
};

} // namespace mesh
} // namespace agentmesh
