#include "transfer/connectionPool.hpp"
#include "transfer/peerServer.hpp"
#include "transfer/internal/chunkFetch.hpp"
#include "networking/socket.hpp"
#include "testUtil.hpp"

#include <atomic>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <mutex>
#include <set>
#include <thread>

using namespace csw;
using namespace std::chrono_literals;

namespace {

//a listening socket nobody accepts on, the kernel finishes handshakes for us
class Backlog {
public:
    Backlog() {
        auto sock = openSocket(true, 0);
        if (sock && EXIT_SUCCESS == tcp::listen(sock->first, 16)) {
            fd_   = sock->first;
            port_ = sock->second;
        }
    }
    ~Backlog() { closeSocket(fd_); }

    int         fd()   const { return fd_; }
    PeerAddress addr() const { return PeerAddress{"127.0.0.1", port_}; }

private:
    int      fd_   = -1;
    uint16_t port_ = 0;
};

} //anon

TEST(ConnectionPool, HealthyReturnIsReused) {
    Backlog server;
    ASSERT_GE(server.fd(), 0);
    ConnectionPool pool(300s, 2s, 4);

    auto conn = pool.checkout(server.addr());
    ASSERT_NE(nullptr, conn);
    uint64_t id = conn->id;
    pool.release(std::move(conn), true);
    EXPECT_EQ(1u, pool.idleCount(server.addr()));

    auto again = pool.checkout(server.addr());
    ASSERT_NE(nullptr, again);
    EXPECT_EQ(id, again->id);
    EXPECT_EQ(1u, pool.connectionsOpened());
    EXPECT_EQ(0u, pool.idleCount());
}

TEST(ConnectionPool, UnhealthyReturnForcesNewConnection) {
    Backlog server;
    ASSERT_GE(server.fd(), 0);
    ConnectionPool pool(300s, 2s, 4);

    auto conn = pool.checkout(server.addr());
    ASSERT_NE(nullptr, conn);
    uint64_t id = conn->id;
    pool.release(std::move(conn), false);
    EXPECT_EQ(0u, pool.idleCount());

    auto fresh = pool.checkout(server.addr());
    ASSERT_NE(nullptr, fresh);
    EXPECT_NE(id, fresh->id);
    EXPECT_EQ(2u, pool.connectionsOpened());
}

TEST(ConnectionPool, TwoCheckoutsGetDistinctConnections) {
    Backlog server;
    ASSERT_GE(server.fd(), 0);
    ConnectionPool pool(300s, 2s, 4);

    auto first  = pool.checkout(server.addr());
    auto second = pool.checkout(server.addr());
    ASSERT_NE(nullptr, first);
    ASSERT_NE(nullptr, second);
    EXPECT_NE(first->id, second->id);
    EXPECT_NE(first->fd, second->fd);
}

TEST(ConnectionPool, ManyWorkersNeverHoldTheSameConnection) {
    test::TempDir dir;
    PeerServer server(dir / "chunks", 0, 30s);
    ASSERT_EQ(EXIT_SUCCESS, server.start());
    PeerAddress addr{"127.0.0.1", server.boundPort()};

    constexpr size_t MAX_IDLE = 3;
    ConnectionPool pool(300s, 2s, MAX_IDLE);

    std::mutex         in_use_mtx;
    std::set<uint64_t> in_use;
    std::atomic<int>   shared   = 0;
    std::atomic<int>   failures = 0;
    std::atomic<int>   over_cap = 0;

    std::vector<std::thread> workers;
    for (int w = 0; w < 8; ++w) {
        workers.emplace_back([&] {
            for (int i = 0; i < 25; ++i) {
                auto conn = pool.checkout(addr);
                if (!conn) {
                    ++failures;
                    continue;
                }
                uint64_t id = conn->id;
                {
                    std::lock_guard<std::mutex> lock(in_use_mtx);
                    if (!in_use.insert(id).second)
                        ++shared;
                }

                //a second user of the socket would garble the framing
                std::vector<uint8_t> data;
                bool healthy = fetchChunk(conn->fd, "nothing", 0, 2000ms, data) == FetchStatus::NOT_FOUND;
                if (!healthy)
                    ++failures;

                {
                    std::lock_guard<std::mutex> lock(in_use_mtx);
                    in_use.erase(id);
                }
                pool.release(std::move(conn), healthy);
                if (pool.idleCount(addr) > MAX_IDLE)
                    ++over_cap;
            }
        });
    }
    for (auto& t : workers)
        t.join();

    EXPECT_EQ(0, shared.load());
    EXPECT_EQ(0, failures.load());
    EXPECT_EQ(0, over_cap.load());
    EXPECT_LE(pool.idleCount(addr), MAX_IDLE);
    EXPECT_LT(pool.connectionsOpened(), 8u * 25u);

    pool.closeAll();
    server.stop();
}

TEST(ConnectionPool, CleanerClosesIdleConnections) {
    Backlog server;
    ASSERT_GE(server.fd(), 0);
    ConnectionPool pool(10s, 2s, 4);
    TimePoint t0 = Clock::now();

    auto conn = pool.checkout(server.addr(), t0);
    ASSERT_NE(nullptr, conn);
    pool.release(std::move(conn), true, t0);

    EXPECT_EQ(0u, pool.runCleanup(t0 + 10s));
    EXPECT_EQ(1u, pool.idleCount());
    EXPECT_EQ(1u, pool.runCleanup(t0 + 11s));
    EXPECT_EQ(0u, pool.idleCount());
}

TEST(ConnectionPool, ExpiredIdleConnectionIsNotHandedOut) {
    Backlog server;
    ASSERT_GE(server.fd(), 0);
    ConnectionPool pool(10s, 2s, 4);
    TimePoint t0 = Clock::now();

    auto conn = pool.checkout(server.addr(), t0);
    ASSERT_NE(nullptr, conn);
    uint64_t id = conn->id;
    pool.release(std::move(conn), true, t0);

    auto later = pool.checkout(server.addr(), t0 + 11s);
    ASSERT_NE(nullptr, later);
    EXPECT_NE(id, later->id);
}

TEST(ConnectionPool, PeerClosedConnectionIsDiscarded) {
    Backlog server;
    ASSERT_GE(server.fd(), 0);
    ConnectionPool pool(300s, 2s, 4);

    auto conn = pool.checkout(server.addr());
    ASSERT_NE(nullptr, conn);
    uint64_t id = conn->id;
    pool.release(std::move(conn), true);

    //server side accepts then hangs up
    PeerAddress client;
    int accepted = tcp::accept(server.fd(), client, 2000ms);
    ASSERT_GE(accepted, 0);
    closeSocket(accepted);
    std::this_thread::sleep_for(50ms);

    auto fresh = pool.checkout(server.addr());
    ASSERT_NE(nullptr, fresh);
    EXPECT_NE(id, fresh->id);
}

TEST(ConnectionPool, IdleConnectionsPerPeerAreCapped) {
    Backlog server;
    ASSERT_GE(server.fd(), 0);
    ConnectionPool pool(300s, 2s, 2);

    std::vector<std::unique_ptr<PooledConnection>> held;
    for (int i = 0; i < 3; ++i) {
        held.push_back(pool.checkout(server.addr()));
        ASSERT_NE(nullptr, held.back());
    }
    int extra_fd = held.back()->fd;
    for (auto& conn : held)
        pool.release(std::move(conn), true);

    EXPECT_EQ(2u, pool.idleCount(server.addr()));
    //the one over the cap was closed, not leaked
    EXPECT_EQ(-1, fcntl(extra_fd, F_GETFD));
}

TEST(ConnectionPool, UnreachablePeerGivesNull) {
    uint16_t dead_port;
    {
        Backlog temp;
        ASSERT_GE(temp.fd(), 0);
        dead_port = temp.addr().port;
    }

    ConnectionPool pool(300s, 500ms, 4);
    EXPECT_EQ(nullptr, pool.checkout(PeerAddress{"127.0.0.1", dead_port}));
}

TEST(ConnectionPool, ReturnsAfterCloseAllAreDropped) {
    Backlog server;
    ASSERT_GE(server.fd(), 0);
    ConnectionPool pool(300s, 2s, 4);

    auto conn = pool.checkout(server.addr());
    ASSERT_NE(nullptr, conn);
    int fd = conn->fd;
    pool.closeAll();
    pool.release(std::move(conn), true);
    EXPECT_EQ(0u, pool.idleCount());
    EXPECT_EQ(-1, fcntl(fd, F_GETFD));
}

TEST(ConnectionPool, ReopenAcceptsReturnsAgain) {
    Backlog server;
    ASSERT_GE(server.fd(), 0);
    ConnectionPool pool(300s, 2s, 4);

    pool.closeAll();
    pool.reopen();
    auto conn = pool.checkout(server.addr());
    ASSERT_NE(nullptr, conn);
    pool.release(std::move(conn), true);
    EXPECT_EQ(1u, pool.idleCount(server.addr()));
}

TEST(ConnectionPool, LivenessProbe) {
    Backlog server;
    ASSERT_GE(server.fd(), 0);
    auto sock = openSocket(false);
    ASSERT_TRUE(sock.has_value());
    ASSERT_GE(tcp::connect(sock->first, server.addr(), 2000ms), 0);
    EXPECT_TRUE(connectionAlive(sock->first));

    PeerAddress client;
    int accepted = tcp::accept(server.fd(), client, 2000ms);
    ASSERT_GE(accepted, 0);
    ASSERT_EQ(EXIT_SUCCESS, tcp::sendMessage(accepted, {1, 2, 3}));
    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(connectionAlive(sock->first)); //unexpected bytes

    closeSocket(accepted);
    closeSocket(sock->first);
}
