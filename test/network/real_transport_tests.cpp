#include <catch2/catch_test_macros.hpp>
#include "network/real_transport.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <string>
#include <thread>

using namespace agentmesh::network;
using namespace std::chrono_literals;

namespace {

// One io_context driven by one background thread, like a mesh node
class EventLoop {
public:
    EventLoop() : guard_(boost::asio::make_work_guard(io)), thread_([this]() { io.run(); }) {}
    ~EventLoop() {
        guard_.reset();
        io.stop();
        thread_.join();
    }

    // Run fn on the loop and wait for it
    template <typename Fn>
    void run(Fn fn) {
        std::promise<void> done;
        boost::asio::post(io, [&]() { fn(); done.set_value(); });
        done.get_future().wait();
    }

    boost::asio::io_context io;

private:
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> guard_;
    std::thread thread_;
};

struct Waiter {
    std::mutex m;
    std::condition_variable cv;

    template <typename Pred>
    bool wait(Pred pred, std::chrono::milliseconds timeout = 3000ms) {
        std::unique_lock<std::mutex> lk(m);
        return cv.wait_for(lk, timeout, pred);
    }

    void notify() { cv.notify_all(); }
};

} // namespace

TEST_CASE("RealTransport binds an ephemeral port", "[network][transport][real]") {
    EventLoop loop;
    RealTransport transport(loop.io);

    ListenResult result = ListenResult::Failed;
    loop.run([&]() { result = transport.listen("127.0.0.1", 0, [](TransportConnectionPtr) {}); });

    REQUIRE(result == ListenResult::Listening);
    CHECK(transport.is_listening());
    CHECK(transport.listening_port() != 0);

    loop.run([&]() { transport.stop_listening(); });
    CHECK_FALSE(transport.is_listening());
    CHECK(transport.listening_port() == 0);
}

TEST_CASE("RealTransport reports address in use", "[network][transport][real]") {
    EventLoop loop;
    RealTransport first(loop.io);
    RealTransport second(loop.io);

    ListenResult r1 = ListenResult::Failed;
    ListenResult r2 = ListenResult::Failed;
    loop.run([&]() {
        r1 = first.listen("127.0.0.1", 0, [](TransportConnectionPtr) {});
        if (r1 == ListenResult::Listening) {
            r2 = second.listen("127.0.0.1", first.listening_port(), [](TransportConnectionPtr) {});
        }
    });

    REQUIRE(r1 == ListenResult::Listening);
    CHECK(r2 == ListenResult::AddressInUse);
    CHECK_FALSE(second.is_listening());

    loop.run([&]() { first.stop_listening(); });
}

TEST_CASE("RealTransport delivers bytes and completes writes", "[network][transport][real]") {
    EventLoop loop;
    RealTransport server(loop.io);
    RealTransport client(loop.io);
    Waiter w;

    TransportConnectionPtr inbound;
    std::string received;
    bool accepted = false;

    ListenResult listen_result = ListenResult::Failed;
    loop.run([&]() {
        listen_result = server.listen("127.0.0.1", 0, [&](TransportConnectionPtr conn) {
            std::lock_guard<std::mutex> lk(w.m);
            inbound = conn;
            accepted = true;
            conn->set_receive_callback([&](std::string_view data) {
                std::lock_guard<std::mutex> lk2(w.m);
                received.append(data.data(), data.size());
                w.notify();
            });
            conn->start();
            w.notify();
        });
    });
    REQUIRE(listen_result == ListenResult::Listening);
    const uint16_t port = server.listening_port();

    TransportConnectionPtr outbound;
    ConnectStatus status = ConnectStatus::Failed;
    bool connected = false;
    loop.run([&]() {
        outbound = client.connect("127.0.0.1", port, 1000ms,
                                  [&](ConnectStatus s, const std::string&) {
                                      std::lock_guard<std::mutex> lk(w.m);
                                      status = s;
                                      connected = true;
                                      w.notify();
                                  });
    });

    REQUIRE(w.wait([&]() { return connected && accepted; }));
    REQUIRE(status == ConnectStatus::Connected);
    CHECK(outbound->is_open());
    CHECK_FALSE(outbound->is_inbound());
    CHECK(outbound->remote_port() == port);

    bool write_done = false;
    bool write_ok = false;
    auto payload = std::make_shared<const std::string>("{\"agent\":\"Anna\"}\n");
    loop.run([&]() {
        outbound->send(payload, [&](bool ok) {
            std::lock_guard<std::mutex> lk(w.m);
            write_ok = ok;
            write_done = true;
            w.notify();
        });
    });

    REQUIRE(w.wait([&]() { return write_done && received.size() >= payload->size(); }));
    CHECK(write_ok);
    CHECK(received == *payload);

    {
        std::lock_guard<std::mutex> lk(w.m);
        CHECK(inbound->is_inbound());
        CHECK(inbound->remote_port() != 0);
    }

    loop.run([&]() {
        outbound->close();
        inbound->close();
        server.stop_listening();
    });
}

TEST_CASE("RealTransport notifies the remote side on close", "[network][transport][real]") {
    EventLoop loop;
    RealTransport server(loop.io);
    RealTransport client(loop.io);
    Waiter w;

    TransportConnectionPtr inbound;
    std::atomic<int> disconnects{0};

    loop.run([&]() {
        server.listen("127.0.0.1", 0, [&](TransportConnectionPtr conn) {
            conn->set_disconnect_callback([&]() {
                disconnects++;
                w.notify();
            });
            conn->start();
            std::lock_guard<std::mutex> lk(w.m);
            inbound = conn;
            w.notify();
        });
    });
    const uint16_t port = server.listening_port();
    REQUIRE(port != 0);

    TransportConnectionPtr outbound;
    std::atomic<bool> connected{false};
    loop.run([&]() {
        outbound = client.connect("127.0.0.1", port, 1000ms,
                                  [&](ConnectStatus s, const std::string&) {
                                      connected = (s == ConnectStatus::Connected);
                                      w.notify();
                                  });
    });
    REQUIRE(w.wait([&]() { return connected.load() && inbound != nullptr; }));

    loop.run([&]() { outbound->close(); });

    REQUIRE(w.wait([&]() { return disconnects.load() == 1; }));

    // Closing again after end-of-stream does not notify twice
    loop.run([&]() { inbound->close(); });
    std::this_thread::sleep_for(50ms);
    CHECK(disconnects.load() == 1);
    CHECK_FALSE(inbound->is_open());

    loop.run([&]() { server.stop_listening(); });
}

TEST_CASE("RealTransport reports refused connections", "[network][transport][real]") {
    EventLoop loop;
    RealTransport probe(loop.io);
    RealTransport client(loop.io);
    Waiter w;

    // Find a port that nothing listens on
    uint16_t port = 0;
    loop.run([&]() {
        if (probe.listen("127.0.0.1", 0, [](TransportConnectionPtr) {}) == ListenResult::Listening) {
            port = probe.listening_port();
            probe.stop_listening();
        }
    });
    REQUIRE(port != 0);

    std::atomic<bool> done{false};
    ConnectStatus status = ConnectStatus::Connected;
    loop.run([&]() {
        client.connect("127.0.0.1", port, 1000ms, [&](ConnectStatus s, const std::string&) {
            status = s;
            done = true;
            w.notify();
        });
    });

    REQUIRE(w.wait([&]() { return done.load(); }));
    CHECK(status == ConnectStatus::Refused);
    CHECK(IsExpectedConnectFailure(status));
}

TEST_CASE("RealTransport aborts a connect closed before it completes", "[network][transport][real]") {
    EventLoop loop;
    RealTransport client(loop.io);
    Waiter w;

    std::atomic<int> calls{0};
    ConnectStatus status = ConnectStatus::Connected;
    loop.run([&]() {
        auto conn = client.connect("127.0.0.1", 9, 1000ms, [&](ConnectStatus s, const std::string&) {
            status = s;
            calls++;
            w.notify();
        });
        conn->close();
    });

    REQUIRE(w.wait([&]() { return calls.load() > 0; }));
    std::this_thread::sleep_for(50ms);
    CHECK(calls.load() == 1);
    CHECK(status == ConnectStatus::Aborted);
}

TEST_CASE("RealTransport fails queued writes on close", "[network][transport][real]") {
    EventLoop loop;
    RealTransport server(loop.io);
    RealTransport client(loop.io);
    Waiter w;

    std::atomic<bool> accepted{false};
    TransportConnectionPtr inbound;
    loop.run([&]() {
        server.listen("127.0.0.1", 0, [&](TransportConnectionPtr conn) {
            inbound = conn;
            accepted = true;
            w.notify();
        });
    });
    const uint16_t port = server.listening_port();

    TransportConnectionPtr outbound;
    std::atomic<bool> connected{false};
    loop.run([&]() {
        outbound = client.connect("127.0.0.1", port, 1000ms, [&](ConnectStatus s, const std::string&) {
            connected = (s == ConnectStatus::Connected);
            w.notify();
        });
    });
    REQUIRE(w.wait([&]() { return connected.load() && accepted.load(); }));

    std::atomic<int> failures{0};
    loop.run([&]() {
        outbound->close();
        outbound->send(std::make_shared<const std::string>("late\n"), [&](bool ok) {
            if (!ok) failures++;
            w.notify();
        });
    });

    REQUIRE(w.wait([&]() { return failures.load() == 1; }));
    CHECK_FALSE(outbound->is_open());

    loop.run([&]() {
        inbound->close();
        server.stop_listening();
    });
}

#ifdef AGENTMESH_TESTS
TEST_CASE("RealTransport closes a connection whose send queue overflows", "[network][transport][real]") {
    EventLoop loop;
    RealTransport server(loop.io);
    RealTransport client(loop.io);
    Waiter w;

    std::atomic<bool> accepted{false};
    TransportConnectionPtr inbound;
    loop.run([&]() {
        server.listen("127.0.0.1", 0, [&](TransportConnectionPtr conn) {
            // Never started: the peer stops reading
            inbound = conn;
            accepted = true;
            w.notify();
        });
    });
    const uint16_t port = server.listening_port();

    TransportConnectionPtr outbound;
    std::atomic<bool> connected{false};
    loop.run([&]() {
        outbound = client.connect("127.0.0.1", port, 1000ms, [&](ConnectStatus s, const std::string&) {
            connected = (s == ConnectStatus::Connected);
            w.notify();
        });
    });
    REQUIRE(w.wait([&]() { return connected.load() && accepted.load(); }));

    RealTransportConnection::SetSendQueueLimitForTest(1024);
    std::atomic<int> failures{0};
    loop.run([&]() {
        auto big = std::make_shared<const std::string>(2048, 'x');
        outbound->send(big, [&](bool ok) {
            if (!ok) failures++;
            w.notify();
        });
    });
    RealTransportConnection::ResetSendQueueLimitForTest();

    REQUIRE(w.wait([&]() { return failures.load() == 1; }));
    CHECK_FALSE(outbound->is_open());

    loop.run([&]() {
        inbound->close();
        server.stop_listening();
    });
}
#endif
