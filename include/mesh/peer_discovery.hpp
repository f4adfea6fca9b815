#pragma once

/*
 PeerDiscovery — finds co-located agents by dialing a bounded port window

 Purpose
 - Dial every port in [base - range, base + range] (base itself excluded)
   that has no Link yet, one attempt at a time with a short timeout
 - Register each successful connection before its reader starts
 - Keep scanning after any single failure

 Serialization
 - At most one scan runs at a time. A scan requested while another is in
   progress is coalesced into one follow-up scan; every queued requester is
   notified when that follow-up completes.

 Error policy
 - Timeouts, refusals, unreachable hosts and aborted attempts are normal
   while peers come and go; they are logged at trace level only.
*/

#include "mesh/peer_reader.hpp"
#include "network/transport.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentmesh {
namespace mesh {

class PeerDiscovery {
public:
  struct Config {
    std::string host;
    uint16_t base_port{0};
    int range{5};
    std::chrono::milliseconds connect_timeout{500};
  };

  // Called with the number of Links the scan created
  using ScanCallback = std::function<void(size_t new_links)>;

  PeerDiscovery(network::Transport &transport, PeerReader::Context ctx,
                Config config);
  ~PeerDiscovery();

  PeerDiscovery(const PeerDiscovery&) = delete;
  PeerDiscovery& operator=(const PeerDiscovery&) = delete;

  // Request a scan (event loop only)
  void Scan(ScanCallback on_done = {});

  // Abort the in-flight attempt and refuse further scans until Start()
  void Stop();
  void Start() { stopped_ = false; }

  bool scanning() const { return scanning_; }
  uint64_t scans_completed() const { return scans_completed_; }

  // Ports of the discovery window, in scan order
  std::vector<uint16_t> WindowPorts() const;

private:
  // Bookkeeping for one connect() call
  struct PendingDial {
    std::weak_ptr<network::TransportConnection> connection;
    bool returned{false};
    std::optional<network::ConnectStatus> early_status;
    std::string early_detail;
  };

  void BeginScan();
  void TryNext();
  void OnConnectResult(uint64_t attempt, uint16_t port,
                       network::TransportConnectionPtr conn,
                       network::ConnectStatus status, const std::string &detail);
  void FinishScan();

  network::Transport &transport_;
  PeerReader::Context ctx_;
  Config config_;

  // Scan state (event loop only)
  bool scanning_{false};
  bool stopped_{false};
  bool rescan_requested_{false};
  std::vector<uint16_t> ports_;
  size_t next_index_{0};
  size_t new_links_{0};
  std::vector<ScanCallback> current_waiters_;
  std::vector<ScanCallback> queued_waiters_;

  // Attempts complete in order; completed_attempt_ < attempt_seq_ means
  // in_flight_ is still dialing
  network::TransportConnectionPtr in_flight_;
  uint64_t attempt_seq_{0};
  uint64_t completed_attempt_{0};

  uint64_t scans_completed_{0};
};

} // namespace mesh
} // namespace agentmesh
