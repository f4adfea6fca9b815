#include "mesh/peer_discovery.hpp"
#include "util/logging.hpp"

namespace agentmesh {
namespace mesh {

PeerDiscovery::PeerDiscovery(network::Transport &transport,
                             PeerReader::Context ctx, Config config)
    : transport_(transport), ctx_(std::move(ctx)), config_(std::move(config)) {}

PeerDiscovery::~PeerDiscovery() { Stop(); }

std::vector<uint16_t> PeerDiscovery::WindowPorts() const {
  std::vector<uint16_t> ports;
  const int base = static_cast<int>(config_.base_port);
  for (int offset = -config_.range; offset <= config_.range; ++offset) {
    if (offset == 0) {
      continue;
    }
    const int candidate = base + offset;
    if (candidate < 1 || candidate > 65535) {
      continue;
    }
    ports.push_back(static_cast<uint16_t>(candidate));
  }
  return ports;
}

void PeerDiscovery::Scan(ScanCallback on_done) {
  if (stopped_) {
    if (on_done) {
      on_done(0);
    }
    return;
  }

  if (scanning_) {
    // Coalesce into a single follow-up scan
    rescan_requested_ = true;
    if (on_done) {
      queued_waiters_.push_back(std::move(on_done));
    }
    return;
  }

  if (on_done) {
    current_waiters_.push_back(std::move(on_done));
  }
  BeginScan();
}

void PeerDiscovery::Stop() {
  if (stopped_) {
    return;
  }
  stopped_ = true;
  rescan_requested_ = false;

  // Aborting the dial delivers its callback, which finishes the scan
  if (in_flight_) {
    auto conn = std::move(in_flight_);
    in_flight_.reset();
    conn->close();
  }
}

void PeerDiscovery::BeginScan() {
  scanning_ = true;
  ports_ = WindowPorts();
  next_index_ = 0;
  new_links_ = 0;

  LOG_MESH_TRACE("Discovery scan started: {} candidate port(s) around {}",
                 ports_.size(), config_.base_port);
  TryNext();
}

void PeerDiscovery::TryNext() {
  while (true) {
    if (stopped_ || (ctx_.is_running && !ctx_.is_running())) {
      FinishScan();
      return;
    }
    if (next_index_ >= ports_.size()) {
      FinishScan();
      return;
    }

    const uint16_t port = ports_[next_index_++];
    if (ctx_.registry.HasPort(port)) {
      continue;
    }

    const uint64_t attempt = ++attempt_seq_;
    // A transport may report the outcome before connect() returns; that
    // outcome is parked here and handled once the connection object exists
    auto pending = std::make_shared<PendingDial>();
    auto conn = transport_.connect(
        config_.host, port, config_.connect_timeout,
        [this, attempt, port, pending](network::ConnectStatus status,
                                       const std::string &detail) {
          if (!pending->returned) {
            pending->early_status = status;
            pending->early_detail = detail;
            return;
          }
          OnConnectResult(attempt, port, pending->connection.lock(), status,
                          detail);
        });
    pending->connection = conn;
    pending->returned = true;

    if (pending->early_status) {
      OnConnectResult(attempt, port, conn, *pending->early_status,
                      pending->early_detail);
      return;
    }

    if (!conn) {
      // Transport refused to create the attempt and will not call back
      completed_attempt_ = attempt;
      LOG_MESH_WARN("Peer discovery could not dial port {}", port);
      continue;
    }

    in_flight_ = std::move(conn);
    return;
  }
}

void PeerDiscovery::OnConnectResult(uint64_t attempt, uint16_t port,
                                    network::TransportConnectionPtr conn,
                                    network::ConnectStatus status,
                                    const std::string &detail) {
  if (attempt <= completed_attempt_) {
    return;
  }
  completed_attempt_ = attempt;
  in_flight_.reset();

  if (status == network::ConnectStatus::Connected) {
    bool running = !stopped_ && (!ctx_.is_running || ctx_.is_running());
    if (!conn || !running) {
      if (conn) {
        conn->close();
      }
    } else if (auto link_id = ctx_.registry.Add(conn, port)) {
      ++new_links_;
      LOG_MESH_INFO("Connected to peer on port {}, total links: {}", port,
                    ctx_.registry.size());
      PeerReader::Spawn(Link{*link_id, conn, port, false}, ctx_);
    } else {
      // An inbound Link claimed this port while we were dialing
      LOG_MESH_DEBUG("Port {} already linked, dropping outbound connection",
                     port);
      conn->close();
    }
  } else if (network::IsExpectedConnectFailure(status)) {
    LOG_MESH_TRACE("No peer on port {} ({})", port,
                   network::ConnectStatusName(status));
  } else {
    LOG_MESH_WARN("Peer discovery error on port {}: {} {}", port,
                  network::ConnectStatusName(status), detail);
  }

  TryNext();
}

void PeerDiscovery::FinishScan() {
  if (!scanning_) {
    return;
  }
  scanning_ = false;
  ++scans_completed_;

  const size_t found = new_links_;
  if (found > 0) {
    LOG_MESH_INFO("Peer discovery complete. Connected to {} new peer(s), {} "
                  "total link(s)",
                  found, ctx_.registry.size());
  } else {
    LOG_MESH_DEBUG("Peer discovery complete. No new peers, {} total link(s)",
                   ctx_.registry.size());
  }

  auto waiters = std::move(current_waiters_);
  current_waiters_.clear();

  if (stopped_) {
    for (auto &w : queued_waiters_) {
      waiters.push_back(std::move(w));
    }
    queued_waiters_.clear();
    rescan_requested_ = false;
  } else if (rescan_requested_) {
    rescan_requested_ = false;
    current_waiters_ = std::move(queued_waiters_);
    queued_waiters_.clear();
    BeginScan();
  }

  for (auto &waiter : waiters) {
    waiter(found);
  }
}

} // namespace mesh
} // namespace agentmesh
