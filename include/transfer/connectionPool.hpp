#pragma once

#include "chunkInfo.hpp"
#include "peerAddress.hpp"
#include "util/periodicTask.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * PooledConnection
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> One open TCP connection to a peer. Owns its socket and closes it on
 *    destruction, so dropping the unique_ptr is always enough to clean up.
 *
 * Fields:
 * -> addr:
 *    Who's on the other end.
 * -> fd:
 *    The connected socket.
 * -> id:
 *    Unique per pool, lets callers tell a reused connection from a new one.
 * -> last_used:
 *    When the connection was last returned to the pool.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
struct PooledConnection {
    PeerAddress addr;
    int         fd = -1;
    uint64_t    id = 0;
    TimePoint   last_used;

    PooledConnection(PeerAddress a, int socket_fd, uint64_t conn_id, TimePoint now);
    ~PooledConnection();

    PooledConnection(const PooledConnection&)            = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * ConnectionPool
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Keeps idle connections to peers around so repeated chunk requests to the
 *    same peer skip the TCP handshake.
 *
 *    A checked out connection belongs to the caller alone until it's released.
 *    Checkout never waits on another caller: with no usable idle connection a
 *    new one is opened.
 *
 *    A cleaner task closes connections idle for longer than idle_threshold.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class ConnectionPool {
public:
    /*
     * Takes:
     * -> idle_threshold:
     *    Idle connections older than this are never handed out and are closed
     *    by the cleaner.
     * -> connect_timeout:
     *    Bound on establishing a new connection.
     * -> max_idle_per_peer:
     *    Idle connections kept per address. Healthy returns over the cap are
     *    closed.
     */
    ConnectionPool(std::chrono::milliseconds idle_threshold,
                   std::chrono::milliseconds connect_timeout,
                   size_t                    max_idle_per_peer);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&)            = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * checkout
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Hands out the most recently used idle connection to addr that is
     *    younger than the idle threshold and passes a liveness probe. Idle
     *    connections that fail either check are closed. Without one, a new
     *    connection is opened.
     *
     * Returns:
     * -> On success:
     *    The connection, owned by the caller until release().
     * -> On failure:
     *    nullptr if the peer couldn't be reached.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    std::unique_ptr<PooledConnection> checkout(const PeerAddress& addr, TimePoint now=Clock::now());

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * release
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Returns a connection. Healthy ones go back to the idle set stamped
     *    with now, unhealthy ones are closed.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    void release(std::unique_ptr<PooledConnection> conn, bool healthy, TimePoint now=Clock::now());

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * runCleanup
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Closes every idle connection last used more than idle_threshold
     *    before now. The body of the cleaner task.
     *
     * Returns:
     * -> The number of connections closed.
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    size_t runCleanup(TimePoint now);

    void startCleaner(std::chrono::milliseconds interval);
    void stopCleaner();

    //closes every idle connection, checked out ones are closed on release
    void closeAll();
    //accepts returns again after closeAll, for a restarted peer
    void reopen();

    size_t   idleCount() const;
    size_t   idleCount(const PeerAddress& addr) const;
    uint64_t connectionsOpened() const { return next_id_.load() - 1; }

private:
    std::unique_ptr<PooledConnection> connect(const PeerAddress& addr, TimePoint now);

    std::chrono::milliseconds idle_threshold_;
    std::chrono::milliseconds connect_timeout_;
    size_t                    max_idle_per_peer_;

    mutable std::mutex        mtx_;
    std::unordered_map<PeerAddress,
                       std::vector<std::unique_ptr<PooledConnection>>,
                       PeerAddressHash> idle_;
    std::atomic<uint64_t>     next_id_ = 1;
    bool                      closed_  = false;

    std::unique_ptr<PeriodicTask> cleaner_;
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * connectionAlive
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Non-blocking peek at an idle socket. An idle connection has nothing to
 *    read, so EOF means the peer closed and any pending bytes mean the stream
 *    is out of sync. Either way it can't be reused.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
bool connectionAlive(int socket_fd);

} //csw
