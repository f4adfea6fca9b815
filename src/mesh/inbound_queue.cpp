#include "mesh/inbound_queue.hpp"
#include <iterator>

namespace agentmesh {
namespace mesh {

InboundQueue::InboundQueue(size_t capacity) : capacity_(capacity) {}

bool InboundQueue::Push(MeshMessage msg) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (messages_.size() >= capacity_) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }
  messages_.push_back(std::move(msg));
  return true;
}

std::optional<MeshMessage> InboundQueue::TryPop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (messages_.empty()) {
    return std::nullopt;
  }
  MeshMessage msg = std::move(messages_.front());
  messages_.pop_front();
  return msg;
}

std::vector<MeshMessage> InboundQueue::Drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<MeshMessage> drained(std::make_move_iterator(messages_.begin()),
                                   std::make_move_iterator(messages_.end()));
  messages_.clear();
  return drained;
}

size_t InboundQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return messages_.size();
}

} // namespace mesh
} // namespace agentmesh
