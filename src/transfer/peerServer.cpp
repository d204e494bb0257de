#include "transfer/peerServer.hpp"
#include "networking/fileParsing.hpp"
#include "networking/messageFormatting.hpp"
#include "networking/socket.hpp"

#include <iostream>
#include <vector>

namespace csw {

//how often the accept loop checks for shutdown
static constexpr std::chrono::milliseconds ACCEPT_POLL{500};

PeerServer::PeerServer(std::filesystem::path     chunk_dir,
                       uint16_t                  port,
                       std::chrono::milliseconds idle_timeout)
    :
    chunk_dir_    (std::move(chunk_dir)),
    port_         (port),
    idle_timeout_ (idle_timeout) {}

PeerServer::~PeerServer() {
    stop();
}

int PeerServer::start() {
    if (listen_fd_ >= 0)
        return EXIT_SUCCESS;

    auto sock = openSocket(true, port_);
    if (!sock) {
        std::cerr << "[PeerServer] Could not bind port " << port_ << std::endl;
        return EXIT_FAILURE;
    }

    if (EXIT_SUCCESS != tcp::listen(sock->first, MAX_PENDING_PEERS)) {
        std::cerr << "[PeerServer] Could not start listening." << std::endl;
        closeSocket(sock->first);
        return EXIT_FAILURE;
    }

    listen_fd_ = sock->first;
    bound_port_.store(sock->second);
    shutdown_.store(false);
    accept_thread_ = std::thread(&PeerServer::acceptLoop, this);

    std::cout << "[PeerServer] Serving chunks on port " << sock->second << std::endl;
    return EXIT_SUCCESS;
}

void PeerServer::stop() {
    shutdown_.store(true);
    if (accept_thread_.joinable())
        accept_thread_.join();

    closeSocket(listen_fd_);
    listen_fd_ = -1;

    //kick every connection out of its blocking recv
    {
        std::lock_guard<std::mutex> lock(sessions_mtx_);
        for (auto& session : sessions_)
            wakeSocket(session->fd);
    }
    reapSessions(true);
}

size_t PeerServer::activeConnections() const {
    std::lock_guard<std::mutex> lock(sessions_mtx_);
    size_t active = 0;
    for (const auto& session : sessions_)
        if (!session->done.load())
            ++active;
    return active;
}

void PeerServer::reapSessions(bool all) {
    std::list<std::unique_ptr<Session>> finished;
    {
        std::lock_guard<std::mutex> lock(sessions_mtx_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (all || (*it)->done.load()) {
                finished.push_back(std::move(*it));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& session : finished)
        if (session->thread.joinable())
            session->thread.join();
}

void PeerServer::acceptLoop() {
    while (!shutdown_.load()) { //Keep listening until shutdown is requested
        reapSessions(false);

        PeerAddress peer;
        int peer_sock = tcp::accept(listen_fd_, peer, ACCEPT_POLL);
        if (peer_sock < 0)
            continue; //timeout, check shutdown

        auto session = std::make_unique<Session>();
        Session* raw = session.get();
        raw->fd      = peer_sock;

        std::lock_guard<std::mutex> lock(sessions_mtx_);
        if (shutdown_.load()) {
            closeSocket(peer_sock);
            break;
        }
        sessions_.push_back(std::move(session));
        raw->thread = std::thread(&PeerServer::serveConnection, this, raw, peer);
    }
}

void PeerServer::serveConnection(Session* session, PeerAddress peer) {
    int peer_sock;
    {
        std::lock_guard<std::mutex> lock(sessions_mtx_);
        peer_sock = session->fd;
    }

    std::vector<uint8_t> request_msg;
    while (!shutdown_.load()) {
        ssize_t read = tcp::recvMessage(peer_sock, request_msg, idle_timeout_);
        if (read == tcp::PEER_CLOSED)
            break;
        if (read < 0) {
            std::cout << "[PeerServer] Closing idle or broken connection from " << peer.toString() << std::endl;
            break;
        }

        auto request = parseChunkRequest(request_msg);
        if (!request || !validFileName(request->f_name)) {
            std::cerr << "[PeerServer] Malformed request from " << peer.toString() << std::endl;
            if (EXIT_SUCCESS != tcp::sendMessage(peer_sock, createFailMessage("malformed chunk request")))
                std::cerr << "[PeerServer] Could not send FAIL to " << peer.toString() << std::endl;
            break;
        }

        std::vector<uint8_t> reply;
        auto chunk = readChunk(chunk_dir_, request->f_name, request->index);
        if (chunk)
            reply = createChunkData(chunk.value());
        else
            reply = createChunkNotFound();

        if (EXIT_SUCCESS != tcp::sendMessage(peer_sock, reply)) {
            std::cerr << "[PeerServer] Send to " << peer.toString() << " failed." << std::endl;
            break;
        }
    }

    //fd is cleared under the lock so stop() never shuts down a reused descriptor
    {
        std::lock_guard<std::mutex> lock(sessions_mtx_);
        session->fd = -1;
    }
    closeSocket(peer_sock);
    session->done.store(true);
}

} //csw
