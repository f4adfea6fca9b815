#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace agentmesh {
namespace network {

// Abstract transport interface for network communication
// Allows dependency injection of different implementations:
// - RealTransport: TCP sockets via boost::asio
// - MockTransport: in-memory links for component tests (in test/)
//
// All callbacks are delivered on the event loop that drives the transport.

class Transport;
class TransportConnection;
using TransportConnectionPtr = std::shared_ptr<TransportConnection>;

// Outcome of an outbound connection attempt
enum class ConnectStatus {
  Connected,
  TimedOut,
  Refused,
  Unreachable,
  Aborted,
  Failed
};

// Outcome of a listen() call
enum class ListenResult {
  Listening,
  AddressInUse,
  Failed
};

const char *ConnectStatusName(ConnectStatus status);

// True for connect outcomes that are normal while scanning for peers
bool IsExpectedConnectFailure(ConnectStatus status);

using ConnectCallback =
    std::function<void(ConnectStatus status, const std::string &detail)>;
using ReceiveCallback = std::function<void(std::string_view data)>;
using DisconnectCallback = std::function<void()>;
using SendCallback = std::function<void(bool ok)>;
using AcceptCallback = std::function<void(TransportConnectionPtr)>;

// TransportConnection - one duplex byte stream to a peer
class TransportConnection {
public:
  virtual ~TransportConnection() = default;

  // Start receiving data (receive callback per chunk, disconnect callback
  // once when the stream ends, fails, or is closed)
  virtual void start() = 0;

  // Queue payload for writing. on_done(true) once every byte has been
  // written, on_done(false) if the write failed or the connection closed
  // first. Writes complete in submission order.
  virtual void send(std::shared_ptr<const std::string> payload,
                    SendCallback on_done) = 0;

  // Close the stream. Idempotent; delivers the disconnect callback if it
  // has not been delivered yet.
  virtual void close() = 0;
  virtual bool is_open() const = 0;

  virtual std::string remote_address() const = 0;
  virtual uint16_t remote_port() const = 0;
  virtual bool is_inbound() const = 0;
  virtual uint64_t connection_id() const = 0;

  virtual void set_receive_callback(ReceiveCallback callback) = 0;
  virtual void set_disconnect_callback(DisconnectCallback callback) = 0;
};

// Transport - factory for outbound connections and inbound acceptance
class Transport {
public:
  virtual ~Transport() = default;

  // Initiate outbound connection; callback reports the outcome exactly once.
  // The returned object is only usable after ConnectStatus::Connected.
  virtual TransportConnectionPtr connect(const std::string &host,
                                         uint16_t port,
                                         std::chrono::milliseconds timeout,
                                         ConnectCallback callback) = 0;

  // Start accepting inbound connections on host:port
  virtual ListenResult listen(const std::string &host, uint16_t port,
                              AcceptCallback accept_callback) = 0;

  virtual void stop_listening() = 0;
  virtual bool is_listening() const = 0;

  // Bound listening port (0 if not listening)
  virtual uint16_t listening_port() const = 0;
};

} // namespace network
} // namespace agentmesh
