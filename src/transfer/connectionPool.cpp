#include "transfer/connectionPool.hpp"
#include "networking/socket.hpp"

#include <cerrno>
#include <iostream>
#include <sys/socket.h>

namespace csw {

PooledConnection::PooledConnection(PeerAddress a, int socket_fd, uint64_t conn_id, TimePoint now)
    :
    addr      (std::move(a)),
    fd        (socket_fd),
    id        (conn_id),
    last_used (now) {}

PooledConnection::~PooledConnection() {
    closeSocket(fd);
}

bool connectionAlive(int socket_fd) {
    uint8_t byte;
    ssize_t res = recv(socket_fd, &byte, 1, MSG_PEEK | MSG_DONTWAIT);
    if (res == 0)
        return false; //peer closed
    if (res > 0)
        return false; //stray bytes, stream out of sync
    return errno == EAGAIN || errno == EWOULDBLOCK;
}

ConnectionPool::ConnectionPool(std::chrono::milliseconds idle_threshold,
                               std::chrono::milliseconds connect_timeout,
                               size_t                    max_idle_per_peer)
    :
    idle_threshold_    (idle_threshold),
    connect_timeout_   (connect_timeout),
    max_idle_per_peer_ (max_idle_per_peer) {}

ConnectionPool::~ConnectionPool() {
    stopCleaner();
    closeAll();
}

std::unique_ptr<PooledConnection> ConnectionPool::connect(const PeerAddress& addr, TimePoint now) {
    auto sock = openSocket(false);
    if (!sock) {
        std::cerr << "[ConnectionPool] Could not open socket." << std::endl;
        return nullptr;
    }

    if (0 > tcp::connect(sock->first, addr, connect_timeout_)) {
        std::cerr << "[ConnectionPool] Could not connect to " << addr.toString() << std::endl;
        closeSocket(sock->first);
        return nullptr;
    }

    return std::make_unique<PooledConnection>(addr, sock->first, next_id_.fetch_add(1), now);
}

std::unique_ptr<PooledConnection> ConnectionPool::checkout(const PeerAddress& addr, TimePoint now) {
    while (true) {
        std::unique_ptr<PooledConnection> candidate;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto it = idle_.find(addr);
            if (it == idle_.end() || it->second.empty())
                break;

            candidate = std::move(it->second.back());
            it->second.pop_back();
            if (it->second.empty())
                idle_.erase(it);
        }

        //probe outside the lock, the candidate is ours now
        if (now - candidate->last_used > idle_threshold_)
            continue; //expired, destructor closes it
        if (!connectionAlive(candidate->fd))
            continue;

        return candidate;
    }

    return connect(addr, now);
}

void ConnectionPool::release(std::unique_ptr<PooledConnection> conn, bool healthy, TimePoint now) {
    if (!conn)
        return;
    if (!healthy)
        return; //closed on scope exit

    conn->last_used = now;

    //declared outside the lock so a connection we don't keep closes after it drops
    std::unique_ptr<PooledConnection> dropped;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = idle_.find(conn->addr);
        size_t held = it == idle_.end() ? 0 : it->second.size();
        if (closed_ || held >= max_idle_per_peer_)
            dropped = std::move(conn);
        else
            idle_[conn->addr].push_back(std::move(conn));
    }
}

size_t ConnectionPool::runCleanup(TimePoint now) {
    //collect first so sockets close after the lock drops
    std::vector<std::unique_ptr<PooledConnection>> expired;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (auto it = idle_.begin(); it != idle_.end();) {
            auto& conns = it->second;
            for (auto c_it = conns.begin(); c_it != conns.end();) {
                if (now - (*c_it)->last_used > idle_threshold_) {
                    expired.push_back(std::move(*c_it));
                    c_it = conns.erase(c_it);
                } else {
                    ++c_it;
                }
            }

            if (conns.empty())
                it = idle_.erase(it);
            else
                ++it;
        }
    }

    if (!expired.empty())
        std::cout << "[ConnectionPool] Closed " << expired.size() << " idle connections." << std::endl;
    return expired.size();
}

void ConnectionPool::startCleaner(std::chrono::milliseconds interval) {
    if (!cleaner_)
        cleaner_ = std::make_unique<PeriodicTask>("ConnectionPool cleaner",
                                                  interval,
                                                  [this] { runCleanup(Clock::now()); });
    cleaner_->start();
}

void ConnectionPool::stopCleaner() {
    if (cleaner_)
        cleaner_->stop();
}

void ConnectionPool::closeAll() {
    std::unordered_map<PeerAddress, std::vector<std::unique_ptr<PooledConnection>>, PeerAddressHash> dropped;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        closed_ = true;
        dropped.swap(idle_);
    }
}

void ConnectionPool::reopen() {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = false;
}

size_t ConnectionPool::idleCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    size_t count = 0;
    for (const auto& [addr, conns] : idle_)
        count += conns.size();
    return count;
}

size_t ConnectionPool::idleCount(const PeerAddress& addr) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = idle_.find(addr);
    return it == idle_.end() ? 0 : it->second.size();
}

} //csw
