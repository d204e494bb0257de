#pragma once

#include "peerAddress.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace csw {

inline constexpr int MAX_PENDING_PEERS = 16;

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * PeerServer
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Serves chunks out of chunk storage. Each accepted connection gets its own
 *    thread which answers requests until the peer hangs up, stays silent for
 *    idle_timeout, or sends something that isn't a chunk request. The last
 *    case gets a FAIL reply before the connection is closed.
 *
 *    A request for a chunk that isn't stored gets CHUNK_NOT_FOUND and the
 *    connection stays open.
 *
 *    Connection threads share nothing but read access to chunk storage. They
 *    are tracked, and stop() wakes and joins every one of them.
 *
 * Constructor:
 * -> Takes:
 *    -> chunk_dir:
 *       Where chunks are read from.
 *    -> port:
 *       TCP port to serve on, 0 for an ephemeral one (see boundPort()).
 *    -> idle_timeout:
 *       How long a connection may sit without a request.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
class PeerServer {
public:
    PeerServer(std::filesystem::path     chunk_dir,
               uint16_t                  port,
               std::chrono::milliseconds idle_timeout);
    ~PeerServer();

    PeerServer(const PeerServer&)            = delete;
    PeerServer& operator=(const PeerServer&) = delete;

    /*
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * start
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     * Description:
     * -> Binds, listens and starts the accept thread.
     *
     * Returns:
     * -> On success:
     *    EXIT_SUCCESS
     * -> On failure:
     *    EXIT_FAILURE
     * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
     */
    int start();

    void stop();

    uint16_t boundPort() const { return bound_port_.load(); }

    //connections currently being served
    size_t activeConnections() const;

private:
    struct Session {
        std::thread       thread;
        int               fd   = -1;
        std::atomic<bool> done = false;
    };

    void acceptLoop();
    void serveConnection(Session* session, PeerAddress peer);
    void reapSessions(bool all);

    std::filesystem::path     chunk_dir_;
    uint16_t                  port_;
    std::chrono::milliseconds idle_timeout_;

    int                       listen_fd_  = -1;
    std::atomic<uint16_t>     bound_port_ = 0;
    std::atomic<bool>         shutdown_   = false;
    std::thread               accept_thread_;

    mutable std::mutex                  sessions_mtx_;
    std::list<std::unique_ptr<Session>> sessions_;
};

} //csw
