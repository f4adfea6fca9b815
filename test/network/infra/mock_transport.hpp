#pragma once

#include "network/transport.hpp"
#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace agentmesh {
namespace network {

// In-memory connection for component tests. Everything completes
// synchronously on the calling thread.
class MockTransportConnection : public TransportConnection,
                                public std::enable_shared_from_this<MockTransportConnection> {
public:
    MockTransportConnection(uint16_t remote_port, bool inbound)
        : remote_port_(remote_port), is_inbound_(inbound), id_(next_id()) {}

    void start() override { started_ = true; }

    void send(std::shared_ptr<const std::string> payload, SendCallback on_done) override {
        bool ok = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (open_ && !fail_sends_) {
                sent_.push_back(*payload);
                ok = true;
            }
        }
        if (on_done) {
            on_done(ok);
        }
    }

    void close() override {
        if (!open_) return;
        open_ = false;
        ++close_count_;
        auto cb = disconnect_callback_;
        if (cb) {
            cb();
        }
    }

    bool is_open() const override { return open_; }
    std::string remote_address() const override { return "127.0.0.1"; }
    uint16_t remote_port() const override { return remote_port_; }
    bool is_inbound() const override { return is_inbound_; }
    uint64_t connection_id() const override { return id_; }

    void set_receive_callback(ReceiveCallback callback) override { receive_callback_ = std::move(callback); }
    void set_disconnect_callback(DisconnectCallback callback) override { disconnect_callback_ = std::move(callback); }

    // Test controls
    void set_fail_sends(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_sends_ = fail;
    }

    void simulate_receive(const std::string& data) {
        if (receive_callback_) {
            receive_callback_(data);
        }
    }

    // Peer hung up
    void simulate_remote_close() { close(); }

    // Close without delivering the disconnect callback (dead socket)
    void kill_silently() { open_ = false; }

    bool started() const { return started_; }
    int close_count() const { return close_count_; }

    std::vector<std::string> sent() {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    size_t sent_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_.size();
    }

private:
    static uint64_t next_id() {
        static std::atomic<uint64_t> id{1};
        return id.fetch_add(1);
    }

    bool open_ = true;
    bool started_ = false;
    bool fail_sends_ = false;
    int close_count_ = 0;
    uint16_t remote_port_;
    bool is_inbound_;
    uint64_t id_;
    ReceiveCallback receive_callback_;
    DisconnectCallback disconnect_callback_;
    std::mutex mutex_;
    std::vector<std::string> sent_;
};

using MockConnectionPtr = std::shared_ptr<MockTransportConnection>;

// Transport mock: ports marked as "up" accept connections, everything else
// is refused. Connect outcomes are reported synchronously unless deferred.
class MockTransport : public Transport {
public:
    TransportConnectionPtr connect(const std::string& host, uint16_t port,
                                   std::chrono::milliseconds timeout,
                                   ConnectCallback callback) override {
        (void)host;
        (void)timeout;
        dialed_.push_back(port);

        ConnectStatus status = ConnectStatus::Refused;
        auto it = outcomes_.find(port);
        if (it != outcomes_.end()) {
            status = it->second;
        }

        auto conn = std::make_shared<MockTransportConnection>(port, false);
        if (status == ConnectStatus::Connected) {
            outbound_[port] = conn;
        } else {
            conn->kill_silently();
        }

        if (defer_connects_) {
            pending_.push_back(Pending{conn, status, std::move(callback)});
        } else if (callback) {
            callback(status, status == ConnectStatus::Connected ? "" : ConnectStatusName(status));
        }
        return conn;
    }

    ListenResult listen(const std::string& host, uint16_t port,
                        AcceptCallback accept_callback) override {
        (void)host;
        if (listen_result_ == ListenResult::Listening) {
            accept_callback_ = std::move(accept_callback);
            listening_port_ = port;
        }
        return listen_result_;
    }

    void stop_listening() override {
        accept_callback_ = nullptr;
        listening_port_ = 0;
    }

    bool is_listening() const override { return listening_port_ != 0; }
    uint16_t listening_port() const override { return listening_port_; }

    // Test controls
    void set_peer_up(uint16_t port) { outcomes_[port] = ConnectStatus::Connected; }
    void set_outcome(uint16_t port, ConnectStatus status) { outcomes_[port] = status; }
    void set_listen_result(ListenResult result) { listen_result_ = result; }
    void set_defer_connects(bool defer) { defer_connects_ = defer; }

    // Deliver the oldest deferred connect outcome; false if none pending
    bool complete_next_connect() {
        if (pending_.empty()) return false;
        auto p = std::move(pending_.front());
        pending_.pop_front();
        if (p.callback) {
            p.callback(p.status, "");
        }
        return true;
    }

    void complete_all_connects() {
        while (complete_next_connect()) {}
    }

    size_t pending_connects() const { return pending_.size(); }

    // Simulate a peer dialing us from remote_port
    MockConnectionPtr simulate_accept(uint16_t remote_port) {
        auto conn = std::make_shared<MockTransportConnection>(remote_port, true);
        if (accept_callback_) {
            accept_callback_(conn);
        }
        return conn;
    }

    MockConnectionPtr outbound(uint16_t port) const {
        auto it = outbound_.find(port);
        return it == outbound_.end() ? nullptr : it->second;
    }

    const std::vector<uint16_t>& dialed() const { return dialed_; }
    void clear_dialed() { dialed_.clear(); }

private:
    struct Pending {
        MockConnectionPtr conn;
        ConnectStatus status;
        ConnectCallback callback;
    };

    std::map<uint16_t, ConnectStatus> outcomes_;
    std::map<uint16_t, MockConnectionPtr> outbound_;
    std::deque<Pending> pending_;
    std::vector<uint16_t> dialed_;
    bool defer_connects_ = false;
    ListenResult listen_result_ = ListenResult::Listening;
    AcceptCallback accept_callback_;
    uint16_t listening_port_ = 0;
};

} // namespace network
} // namespace agentmesh
