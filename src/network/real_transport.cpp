// Copyright (c) 2025 The Unicity Foundation
// Real transport implementation using boost::asio TCP sockets

#include "network/real_transport.hpp"
#include "util/logging.hpp"
#include <array>

namespace agentmesh {
namespace network {

const char *ConnectStatusName(ConnectStatus status) {
  switch (status) {
  case ConnectStatus::Connected:
    return "connected";
  case ConnectStatus::TimedOut:
    return "timed out";
  case ConnectStatus::Refused:
    return "refused";
  case ConnectStatus::Unreachable:
    return "unreachable";
  case ConnectStatus::Aborted:
    return "aborted";
  case ConnectStatus::Failed:
    return "failed";
  }
  return "unknown";
}

bool IsExpectedConnectFailure(ConnectStatus status) {
  return status == ConnectStatus::TimedOut ||
         status == ConnectStatus::Refused ||
         status == ConnectStatus::Unreachable ||
         status == ConnectStatus::Aborted;
}

namespace {

ConnectStatus ClassifyConnectError(const boost::system::error_code &ec) {
  namespace error = boost::asio::error;
  if (ec == error::connection_refused) {
    return ConnectStatus::Refused;
  }
  if (ec == error::timed_out) {
    return ConnectStatus::TimedOut;
  }
  if (ec == error::host_unreachable || ec == error::network_unreachable ||
      ec == error::host_not_found || ec == error::host_not_found_try_again) {
    return ConnectStatus::Unreachable;
  }
  if (ec == error::operation_aborted) {
    return ConnectStatus::Aborted;
  }
  return ConnectStatus::Failed;
}

} // namespace

// ============================================================================
// RealTransportConnection
// ============================================================================

std::atomic<uint64_t> RealTransportConnection::next_id_{1};

#ifdef AGENTMESH_TESTS
std::atomic<size_t> RealTransportConnection::send_queue_limit_override_bytes_{0};
#endif

TransportConnectionPtr RealTransportConnection::create_outbound(
    boost::asio::io_context &io_context, const std::string &host,
    uint16_t port, std::chrono::milliseconds timeout,
    ConnectCallback callback) {
  auto conn = std::shared_ptr<RealTransportConnection>(
      new RealTransportConnection(io_context, false));
  // Defer do_connect so shared_from_this() is safe and the object lifetime
  // is extended regardless of factory return-value usage.
  boost::asio::post(io_context, [conn, host, port, timeout,
                                 callback = std::move(callback)]() mutable {
    conn->do_connect(host, port, timeout, std::move(callback));
  });
  return conn;
}

TransportConnectionPtr
RealTransportConnection::create_inbound(boost::asio::io_context &io_context,
                                        boost::asio::ip::tcp::socket socket) {
  auto conn = std::shared_ptr<RealTransportConnection>(
      new RealTransportConnection(io_context, true));
  conn->socket_ = std::move(socket);
  conn->open_ = true;
  conn->connect_done_ = true;

  boost::system::error_code ec;
  auto remote_ep = conn->socket_.remote_endpoint(ec);
  if (!ec) {
    conn->remote_addr_ = remote_ep.address().to_string();
    conn->remote_port_ = remote_ep.port();
  } else {
    LOG_NET_TRACE("failed to get remote endpoint: {}", ec.message());
  }

  return conn;
}

RealTransportConnection::RealTransportConnection(
    boost::asio::io_context &io_context, bool is_inbound)
    : io_context_(io_context), socket_(io_context), is_inbound_(is_inbound),
      id_(next_id_++),
      connect_timer_(std::make_unique<boost::asio::steady_timer>(io_context)) {}

void RealTransportConnection::do_connect(const std::string &host,
                                         uint16_t port,
                                         std::chrono::milliseconds timeout,
                                         ConnectCallback callback) {
  remote_addr_ = host;
  remote_port_ = port;

  // close() ran before the posted connect started
  if (connect_done_) {
    if (callback) {
      callback(ConnectStatus::Aborted, "closed before connect");
    }
    return;
  }
  connect_callback_ = std::move(callback);

  if (timeout.count() > 0 && connect_timer_) {
    connect_timer_->expires_after(timeout);
    connect_timer_->async_wait(
        [this, self = shared_from_this()](const boost::system::error_code &ec) {
          if (ec == boost::asio::error::operation_aborted || connect_done_) {
            return;
          }
          LOG_NET_TRACE("connect timeout to {}:{}", remote_addr_, remote_port_);
          if (resolver_) {
            resolver_->cancel();
          }
          finish_connect(ConnectStatus::TimedOut, "connect timeout");
        });
  }

  resolver_ = std::make_shared<boost::asio::ip::tcp::resolver>(io_context_);
  resolver_->async_resolve(
      host, std::to_string(port),
      [this, self = shared_from_this()](
          const boost::system::error_code &ec,
          boost::asio::ip::tcp::resolver::results_type results) {
        if (connect_done_) {
          return;
        }
        if (ec) {
          LOG_NET_TRACE("failed to resolve {}: {}", remote_addr_, ec.message());
          finish_connect(ClassifyConnectError(ec), ec.message());
          return;
        }

        boost::asio::async_connect(
            socket_, results,
            [this, self](const boost::system::error_code &ec,
                         const boost::asio::ip::tcp::endpoint &ep) {
              if (connect_done_) {
                return;
              }
              if (ec) {
                LOG_NET_TRACE("failed to connect to {}:{}: {}", remote_addr_,
                              remote_port_, ec.message());
                finish_connect(ClassifyConnectError(ec), ec.message());
                return;
              }

              boost::system::error_code opt_ec;
              socket_.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);
              remote_addr_ = ep.address().to_string();
              remote_port_ = ep.port();

              open_ = true;
              LOG_NET_TRACE("connected to {}:{}", remote_addr_, remote_port_);
              finish_connect(ConnectStatus::Connected, "");
            });
      });
}

void RealTransportConnection::finish_connect(ConnectStatus status,
                                             const std::string &detail) {
  if (connect_done_) {
    return;
  }
  connect_done_ = true;

  if (connect_timer_) {
    connect_timer_->cancel();
  }
  resolver_.reset();

  if (status != ConnectStatus::Connected) {
    boost::system::error_code ignored;
    socket_.close(ignored);
  }

  ConnectCallback callback = std::move(connect_callback_);
  connect_callback_ = {};
  if (callback) {
    try {
      callback(status, detail);
    } catch (const std::exception &e) {
      LOG_NET_ERROR("exception in connect callback for {}:{}: {}",
                    remote_addr_, remote_port_, e.what());
    }
  }
}

void RealTransportConnection::start() {
  boost::asio::dispatch(io_context_, [self = shared_from_this()]() {
    if (!self->open_) {
      return;
    }
    self->start_read();
  });
}

void RealTransportConnection::start_read() {
  if (!open_) {
    return;
  }

  auto buf = std::make_shared<std::array<char, RECV_BUFFER_SIZE>>();

  socket_.async_read_some(
      boost::asio::buffer(*buf),
      [this, self = shared_from_this(), buf](const boost::system::error_code &ec,
                                             size_t bytes_transferred) {
        // Closed locally meanwhile; close_impl() already notified
        if (!open_) {
          return;
        }

        if (ec) {
          if (ec != boost::asio::error::eof &&
              ec != boost::asio::error::operation_aborted) {
            LOG_NET_TRACE("read error from {}:{}: {}", remote_addr_,
                          remote_port_, ec.message());
          }
          close_impl();
          return;
        }

        if (bytes_transferred > 0 && receive_callback_) {
          ReceiveCallback saved_receive_cb = receive_callback_;
          try {
            saved_receive_cb(std::string_view(buf->data(), bytes_transferred));
          } catch (const std::exception &e) {
            LOG_NET_WARN("exception in receive callback from {}:{}: {}",
                         remote_addr_, remote_port_, e.what());
          }
        }

        // The receive callback may have closed the connection
        if (!open_) {
          return;
        }

        start_read();
      });
}

void RealTransportConnection::send(std::shared_ptr<const std::string> payload,
                                   SendCallback on_done) {
  if (!open_ || !payload) {
    if (on_done) {
      boost::asio::post(io_context_, [cb = std::move(on_done)]() { cb(false); });
    }
    return;
  }

  // Bound memory held for a peer that stopped reading
  size_t limit = send_queue_limit();
  if (send_queue_bytes_ + payload->size() > limit) {
    LOG_NET_WARN("send queue overflow ({} queued, {} incoming, limit {}), "
                 "closing connection to {}:{}",
                 send_queue_bytes_, payload->size(), limit, remote_addr_,
                 remote_port_);
    if (on_done) {
      boost::asio::post(io_context_, [cb = std::move(on_done)]() { cb(false); });
    }
    close_impl();
    return;
  }

  send_queue_bytes_ += payload->size();
  send_queue_.push_back(PendingWrite{std::move(payload), std::move(on_done)});

  if (!writing_) {
    writing_ = true;
    do_write();
  }
}

void RealTransportConnection::do_write() {
  if (!open_ || send_queue_.empty()) {
    writing_ = false;
    return;
  }

  auto payload = send_queue_.front().payload;

  boost::asio::async_write(
      socket_, boost::asio::buffer(*payload),
      [this, self = shared_from_this(), payload](const boost::system::error_code &ec,
                                                 size_t /*bytes_transferred*/) {
        // close_impl() already failed every queued write
        if (!open_ || send_queue_.empty()) {
          return;
        }

        PendingWrite done = std::move(send_queue_.front());
        send_queue_.pop_front();
        send_queue_bytes_ -= done.payload->size();

        if (ec) {
          LOG_NET_TRACE("write error to {}:{}: {}", remote_addr_, remote_port_,
                        ec.message());
          if (done.on_done) {
            done.on_done(false);
          }
          close_impl();
          return;
        }

        if (done.on_done) {
          done.on_done(true);
        }
        do_write();
      });
}

void RealTransportConnection::deliver_disconnect_once() {
  if (disconnect_delivered_) {
    return;
  }
  disconnect_delivered_ = true;

  DisconnectCallback saved_disconnect_cb = std::move(disconnect_callback_);
  disconnect_callback_ = {};
  if (saved_disconnect_cb) {
    // Posted so callers of close() are never re-entered
    boost::asio::post(io_context_, [cb = std::move(saved_disconnect_cb)]() {
      try {
        cb();
      } catch (const std::exception &e) {
        LOG_NET_WARN("exception in disconnect callback: {}", e.what());
      }
    });
  }
}

void RealTransportConnection::close() {
  boost::asio::dispatch(io_context_, [self = shared_from_this()]() {
    if (!self->connect_done_) {
      self->finish_connect(ConnectStatus::Aborted, "closed while connecting");
      return;
    }
    self->close_impl();
  });
}

void RealTransportConnection::close_impl() {
  if (!open_.exchange(false)) {
    return;
  }

  deliver_disconnect_once();
  receive_callback_ = {};

  // Cancels outstanding reads/writes; their handlers observe !open_
  boost::system::error_code ignored;
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
  socket_.close(ignored);

  std::deque<PendingWrite> failed;
  std::swap(failed, send_queue_);
  send_queue_bytes_ = 0;
  writing_ = false;

  for (auto &pending : failed) {
    if (pending.on_done) {
      boost::asio::post(io_context_, [cb = std::move(pending.on_done)]() { cb(false); });
    }
  }
}

#ifdef AGENTMESH_TESTS
void RealTransportConnection::SetSendQueueLimitForTest(size_t bytes) {
  send_queue_limit_override_bytes_.store(bytes, std::memory_order_relaxed);
}

void RealTransportConnection::ResetSendQueueLimitForTest() {
  send_queue_limit_override_bytes_.store(0, std::memory_order_relaxed);
}
#endif

size_t RealTransportConnection::send_queue_limit() const {
#ifdef AGENTMESH_TESTS
  size_t override_bytes = send_queue_limit_override_bytes_.load(std::memory_order_relaxed);
  if (override_bytes > 0) {
    return override_bytes;
  }
#endif
  return DEFAULT_SEND_QUEUE_LIMIT;
}

void RealTransportConnection::set_receive_callback(ReceiveCallback callback) {
  receive_callback_ = std::move(callback);
}

void RealTransportConnection::set_disconnect_callback(DisconnectCallback callback) {
  disconnect_callback_ = std::move(callback);
}

// ============================================================================
// RealTransport
// ============================================================================

RealTransport::RealTransport(boost::asio::io_context &io_context)
    : io_context_(io_context) {}

RealTransport::~RealTransport() { stop_listening(); }

TransportConnectionPtr RealTransport::connect(const std::string &host,
                                              uint16_t port,
                                              std::chrono::milliseconds timeout,
                                              ConnectCallback callback) {
  return RealTransportConnection::create_outbound(io_context_, host, port,
                                                  timeout, std::move(callback));
}

ListenResult RealTransport::listen(const std::string &host, uint16_t port,
                                   AcceptCallback accept_callback) {
  if (acceptor_) {
    LOG_NET_TRACE("already listening");
    return ListenResult::Failed;
  }

  using tcp = boost::asio::ip::tcp;

  try {
    tcp::endpoint endpoint;
    boost::system::error_code addr_ec;
    auto address = boost::asio::ip::make_address(host, addr_ec);
    if (!addr_ec) {
      endpoint = tcp::endpoint(address, port);
    } else {
      // Host name such as "localhost": bind the first resolved address
      tcp::resolver resolver(io_context_);
      auto results = resolver.resolve(host, std::to_string(port));
      endpoint = *results.begin();
    }

    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(boost::asio::socket_base::max_listen_connections);

    boost::system::error_code ep_ec;
    auto bound = acceptor_->local_endpoint(ep_ec);
    listen_port_ = ep_ec ? port : bound.port();
  } catch (const boost::system::system_error &e) {
    if (acceptor_) {
      boost::system::error_code ignored;
      acceptor_->close(ignored);
      acceptor_.reset();
    }
    listen_port_ = 0;
    if (e.code() == boost::asio::error::address_in_use) {
      LOG_NET_DEBUG("port {} on {} already in use", port, host);
      return ListenResult::AddressInUse;
    }
    LOG_NET_ERROR("failed to listen on {}:{}: {}", host, port, e.what());
    return ListenResult::Failed;
  }

  accept_callback_ = std::move(accept_callback);
  LOG_NET_INFO("listening on {}:{}", host, listen_port_);
  start_accept();
  return ListenResult::Listening;
}

void RealTransport::start_accept() {
  if (!acceptor_) {
    return;
  }

  // RealTransport can be stack-allocated in tests; stop_listening() cancels
  // the pending accept before destruction.
  acceptor_->async_accept([this](const boost::system::error_code &ec,
                                 boost::asio::ip::tcp::socket socket) {
    handle_accept(ec, std::move(socket));
  });
}

void RealTransport::handle_accept(const boost::system::error_code &ec,
                                  boost::asio::ip::tcp::socket socket) {
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      LOG_NET_TRACE("accept error: {}", ec.message());
      start_accept();
    }
    return;
  }

  boost::system::error_code opt_ec;
  socket.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);

  auto conn = RealTransportConnection::create_inbound(io_context_, std::move(socket));
  LOG_NET_DEBUG("connection from {}:{} accepted", conn->remote_address(),
                conn->remote_port());

  if (accept_callback_) {
    try {
      accept_callback_(conn);
    } catch (const std::exception &e) {
      LOG_NET_WARN("exception in accept callback: {}", e.what());
    }
  }

  start_accept();
}

void RealTransport::stop_listening() {
  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
  listen_port_ = 0;
  // Release anything the callback captured
  accept_callback_ = {};
}

} // namespace network
} // namespace agentmesh
