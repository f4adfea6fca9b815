#include "mesh/peer_listener.hpp"
#include "util/logging.hpp"

namespace agentmesh {
namespace mesh {

PeerListener::PeerListener(network::Transport &transport, PeerReader::Context ctx,
                           std::set<uint16_t> window_ports)
    : transport_(transport), ctx_(std::move(ctx)),
      window_ports_(std::move(window_ports)) {}

PeerListener::~PeerListener() { Stop(); }

network::ListenResult PeerListener::Start(const std::string &host, uint16_t port) {
  if (listening_) {
    return network::ListenResult::Listening;
  }

  auto result = transport_.listen(
      host, port,
      [this](network::TransportConnectionPtr conn) { HandleAccepted(std::move(conn)); });

  listening_ = (result == network::ListenResult::Listening);
  return result;
}

void PeerListener::Stop() {
  if (!listening_) {
    return;
  }
  listening_ = false;
  transport_.stop_listening();
}

void PeerListener::HandleAccepted(network::TransportConnectionPtr conn) {
  if (!conn) {
    return;
  }
  if (ctx_.is_running && !ctx_.is_running()) {
    conn->close();
    return;
  }

  ++accepted_;

  // Tag with the peer's port unless another Link already holds it or
  // discovery may still need to dial it
  std::optional<uint16_t> port = conn->remote_port();
  if (*port == 0 || window_ports_.count(*port) != 0 ||
      ctx_.registry.HasPort(*port)) {
    port.reset();
  }

  auto link_id = ctx_.registry.Add(conn, port);
  if (!link_id) {
    LOG_MESH_ERROR("Failed to register inbound link from {}:{}",
                   conn->remote_address(), conn->remote_port());
    conn->close();
    return;
  }

  LOG_MESH_INFO("New connection from {}:{}, total links: {}",
                conn->remote_address(), conn->remote_port(), ctx_.registry.size());

  Link link{*link_id, conn, port, true};
  PeerReader::Spawn(link, ctx_);
}

} // namespace mesh
} // namespace agentmesh
