#include "mesh/peer_reader.hpp"
#include "util/logging.hpp"

namespace agentmesh {
namespace mesh {

std::shared_ptr<PeerReader> PeerReader::Spawn(const Link &link,
                                              ConnectionRegistry &registry,
                                              InboundQueue &queue,
                                              size_t max_line_bytes,
                                              RunningCheck is_running) {
  auto reader = std::shared_ptr<PeerReader>(
      new PeerReader(link, registry, queue, max_line_bytes, std::move(is_running)));

  auto conn = link.connection;
  if (!conn) {
    registry.Remove(link.id);
    reader->closed_ = true;
    return reader;
  }

  conn->set_receive_callback(
      [reader](std::string_view data) { reader->OnData(data); });
  conn->set_disconnect_callback([reader]() { reader->OnDisconnect(); });

  if (!conn->is_open()) {
    // Closed between insertion and spawn; tear down now
    reader->OnDisconnect();
    return reader;
  }

  conn->start();
  return reader;
}

PeerReader::PeerReader(const Link &link, ConnectionRegistry &registry,
                       InboundQueue &queue, size_t max_line_bytes,
                       RunningCheck is_running)
    : link_id_(link.id), port_(link.port), connection_(link.connection),
      registry_(registry), queue_(queue), max_line_bytes_(max_line_bytes),
      is_running_(std::move(is_running)) {}

void PeerReader::OnData(std::string_view data) {
  if (closed_) {
    return;
  }
  if (is_running_ && !is_running_()) {
    CloseLink();
    return;
  }

  buffer_.append(data.data(), data.size());

  size_t start = 0;
  size_t newline;
  while ((newline = buffer_.find('\n', start)) != std::string::npos) {
    HandleLine(std::string_view(buffer_).substr(start, newline - start));
    start = newline + 1;
    if (closed_) {
      return;
    }
  }
  buffer_.erase(0, start);

  if (buffer_.size() > max_line_bytes_) {
    LOG_MESH_WARN("Link {} sent a line longer than {} bytes, closing",
                  link_id_, max_line_bytes_);
    buffer_.clear();
    CloseLink();
  }
}

void PeerReader::HandleLine(std::string_view line) {
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  if (line.find_first_not_of(" \t") == std::string_view::npos) {
    return;
  }

  auto msg = DecodeMessage(line);
  if (!msg) {
    LOG_MESH_WARN("Invalid message received on link {}, discarded", link_id_);
    return;
  }

  LOG_MESH_TRACE("link {}: message from '{}' ({} bytes)", link_id_, msg->agent,
                 msg->message.size());

  if (!queue_.Push(std::move(*msg))) {
    LOG_MESH_WARN("Inbound queue full ({} messages), dropped message from link {}",
                  queue_.capacity(), link_id_);
  }
}

void PeerReader::CloseLink() {
  // The connection delivers OnDisconnect() once it has closed
  if (auto conn = connection_.lock()) {
    conn->close();
  } else {
    OnDisconnect();
  }
}

void PeerReader::OnDisconnect() {
  if (closed_) {
    return;
  }
  closed_ = true;

  if (auto conn = connection_.lock()) {
    conn->close();
  }

  if (registry_.Remove(link_id_)) {
    if (port_) {
      LOG_MESH_DEBUG("Link {} (port {}) closed, {} link(s) remain", link_id_,
                     *port_, registry_.size());
    } else {
      LOG_MESH_DEBUG("Link {} closed, {} link(s) remain", link_id_,
                     registry_.size());
    }
  }
}

} // namespace mesh
} // namespace agentmesh
