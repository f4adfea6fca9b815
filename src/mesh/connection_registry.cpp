#include "mesh/connection_registry.hpp"

namespace agentmesh {
namespace mesh {

std::optional<LinkId> ConnectionRegistry::Add(
    network::TransportConnectionPtr connection, std::optional<uint16_t> port) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (port && !ports_.insert(*port).second) {
    return std::nullopt;
  }

  LinkId id = next_id_++;
  bool inbound = connection && connection->is_inbound();
  links_.emplace(id, Link{id, std::move(connection), port, inbound});
  return id;
}

bool ConnectionRegistry::Remove(LinkId id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = links_.find(id);
  if (it == links_.end()) {
    return false;
  }
  if (it->second.port) {
    ports_.erase(*it->second.port);
  }
  links_.erase(it);
  return true;
}

std::vector<Link> ConnectionRegistry::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<Link> removed;
  removed.reserve(links_.size());
  for (auto &[id, link] : links_) {
    removed.push_back(std::move(link));
  }
  links_.clear();
  ports_.clear();
  return removed;
}

bool ConnectionRegistry::Contains(LinkId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return links_.count(id) > 0;
}

bool ConnectionRegistry::HasPort(uint16_t port) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ports_.count(port) > 0;
}

std::vector<Link> ConnectionRegistry::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<Link> links;
  links.reserve(links_.size());
  for (const auto &[id, link] : links_) {
    links.push_back(link);
  }
  return links;
}

std::vector<uint16_t> ConnectionRegistry::ConnectedPorts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<uint16_t>(ports_.begin(), ports_.end());
}

size_t ConnectionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return links_.size();
}

} // namespace mesh
} // namespace agentmesh
