#pragma once

#include "network/transport.hpp"
#include <atomic>
#include <utility>  // std::exchange, needed by boost/asio/awaitable.hpp under C++20
#include <boost/asio.hpp>
#include <chrono>
#include <deque>
#include <memory>
#include <string>

namespace agentmesh {
namespace network {

/**
 * RealTransportConnection - TCP socket implementation of TransportConnection
 *
 * Wraps boost::asio::ip::tcp::socket. All handlers run on the single thread
 * driving the io_context, so no strand is used; public methods must be
 * called from that thread.
 */
class RealTransportConnection
    : public TransportConnection,
      public std::enable_shared_from_this<RealTransportConnection> {
public:
  /**
   * Create outbound connection (will connect to remote)
   */
  static TransportConnectionPtr
  create_outbound(boost::asio::io_context &io_context, const std::string &host,
                  uint16_t port, std::chrono::milliseconds timeout,
                  ConnectCallback callback);

  /**
   * Create inbound connection (already connected socket)
   */
  static TransportConnectionPtr
  create_inbound(boost::asio::io_context &io_context,
                 boost::asio::ip::tcp::socket socket);

  ~RealTransportConnection() override = default;

  // Non-copyable, non-movable (connections are not reusable)
  RealTransportConnection(const RealTransportConnection&) = delete;
  RealTransportConnection& operator=(const RealTransportConnection&) = delete;
  RealTransportConnection(RealTransportConnection&&) = delete;
  RealTransportConnection& operator=(RealTransportConnection&&) = delete;

  // TransportConnection interface
  void start() override;
  void send(std::shared_ptr<const std::string> payload,
            SendCallback on_done) override;
  void close() override;
  bool is_open() const override { return open_; }
  std::string remote_address() const override { return remote_addr_; }
  uint16_t remote_port() const override { return remote_port_; }
  bool is_inbound() const override { return is_inbound_; }
  uint64_t connection_id() const override { return id_; }
  void set_receive_callback(ReceiveCallback callback) override;
  void set_disconnect_callback(DisconnectCallback callback) override;

#ifdef AGENTMESH_TESTS
  // Test-only: override send queue byte limit (0 disables override)
  static void SetSendQueueLimitForTest(size_t bytes);
  static void ResetSendQueueLimitForTest();
#endif

private:
  RealTransportConnection(boost::asio::io_context &io_context, bool is_inbound);

  void do_connect(const std::string &host, uint16_t port,
                  std::chrono::milliseconds timeout, ConnectCallback callback);
  void finish_connect(ConnectStatus status, const std::string &detail);

  void start_read();
  void do_write();
  void close_impl();

  // Deliver disconnect callback exactly once (posted, never re-entrant)
  void deliver_disconnect_once();

  size_t send_queue_limit() const;

  struct PendingWrite {
    std::shared_ptr<const std::string> payload;
    SendCallback on_done;
  };

  boost::asio::io_context &io_context_;
  boost::asio::ip::tcp::socket socket_;
  bool is_inbound_;
  uint64_t id_;
  static std::atomic<uint64_t> next_id_;

  ReceiveCallback receive_callback_;
  DisconnectCallback disconnect_callback_;
  bool disconnect_delivered_{false};

  // Writes are serialized through this queue; front() is in flight
  std::deque<PendingWrite> send_queue_;
  size_t send_queue_bytes_{0};
  bool writing_{false};

  static constexpr size_t RECV_BUFFER_SIZE = 16 * 1024;
  static constexpr size_t DEFAULT_SEND_QUEUE_LIMIT = 4 * 1024 * 1024;

#ifdef AGENTMESH_TESTS
  static std::atomic<size_t> send_queue_limit_override_bytes_;
#endif

  // Outbound connect state
  std::unique_ptr<boost::asio::steady_timer> connect_timer_;
  std::shared_ptr<boost::asio::ip::tcp::resolver> resolver_;
  ConnectCallback connect_callback_;
  bool connect_done_{false};

  std::atomic<bool> open_{false};
  std::string remote_addr_;
  uint16_t remote_port_{0};
};

/**
 * RealTransport - boost::asio implementation of Transport
 *
 * Does not own the io_context or any thread; the owner runs the loop.
 */
class RealTransport : public Transport {
public:
  explicit RealTransport(boost::asio::io_context &io_context);
  ~RealTransport() override;

  RealTransport(const RealTransport&) = delete;
  RealTransport& operator=(const RealTransport&) = delete;

  TransportConnectionPtr connect(const std::string &host, uint16_t port,
                                 std::chrono::milliseconds timeout,
                                 ConnectCallback callback) override;

  ListenResult listen(const std::string &host, uint16_t port,
                      AcceptCallback accept_callback) override;

  void stop_listening() override;
  bool is_listening() const override { return acceptor_ != nullptr; }
  uint16_t listening_port() const override { return listen_port_; }

  boost::asio::io_context &io_context() { return io_context_; }

private:
  void start_accept();
  void handle_accept(const boost::system::error_code &ec,
                     boost::asio::ip::tcp::socket socket);

  boost::asio::io_context &io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  AcceptCallback accept_callback_;
  uint16_t listen_port_{0};
};

} // namespace network
} // namespace agentmesh
